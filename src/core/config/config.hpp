#pragma once
#include <string>
#include <vector>

#include "../../engine/config/run_config.hpp"
#include "../types/constants.hpp"

namespace Harvester {
namespace Core {

enum class Command { None, Scrape, Keywords, Validate };

/**
 * @brief Command-line and YAML configuration of the harvester binary.
 *
 * Precedence: built-in defaults, then the --config YAML file, then the
 * command line.
 */
struct Config {
    Command           command = Command::None;
    Engine::RunConfig run;

    std::vector<std::string> keywords;  // search keywords or expansion seeds
    std::string              keywords_file;
    std::string              proxy_file;

    std::string output_dir = Constants::DEFAULT_OUTPUT_DIR;
    std::string output_name;  // without extension; empty = timestamped default
    std::string format = "json";
    bool        include_metadata = false;  // txt keyword export only

    std::string config_path;
    bool        verbose = false;
    bool        color   = true;

    // Exits on --help and on command-line errors; throws ConfigError for bad files.
    static Config parse(int argc, char* argv[]);
};

// Applies a YAML file on top of config. Throws ConfigError.
void load_yaml(Config& config, const std::string& path);

/**
 * @brief Reads a one-entry-per-line file (keywords, proxies).
 *
 * Lines are trimmed; blank lines and lines starting with '#' are ignored.
 * @throws ConfigError when the file cannot be opened.
 */
std::vector<std::string> load_list_file(const std::string& path);

}  // namespace Core
}  // namespace Harvester
