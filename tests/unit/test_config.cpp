#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"
#include "../../src/core/types/errors.hpp"

using namespace Harvester::Core;
using Harvester::Engine::BrowserType;
using Harvester::Engine::Modifier;

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path);
    ofs << content;
}

}  // namespace

TEST(ConfigTest, ScrapeCommand) {
    char* argv[] = {(char*)"harvester",
                    (char*)"scrape",
                    (char*)"-k",
                    (char*)"cat food",
                    (char*)"-k",
                    (char*)"dog",
                    (char*)"-p",
                    (char*)"3",
                    (char*)"--proxy",
                    (char*)"http://p1:8080",
                    (char*)"--no-rotate",
                    (char*)"--browser",
                    (char*)"firefox",
                    (char*)"--format",
                    (char*)"csv",
                    (char*)"--min-delay",
                    (char*)"0.5"};
    auto  config = Config::parse(17, argv);

    EXPECT_EQ(config.command, Command::Scrape);
    ASSERT_EQ(config.keywords.size(), 2);
    EXPECT_EQ(config.keywords[0], "cat food");
    EXPECT_EQ(config.run.pages_per_keyword, 3);
    ASSERT_EQ(config.run.proxy_urls.size(), 1);
    EXPECT_FALSE(config.run.rotate_proxy);
    EXPECT_EQ(config.run.browser_type, BrowserType::Firefox);
    EXPECT_EQ(config.format, "csv");
    EXPECT_DOUBLE_EQ(config.run.min_delay, 0.5);
}

TEST(ConfigTest, KeywordsCommand) {
    char* argv[] = {(char*)"harvester",
                    (char*)"--no-color",
                    (char*)"keywords",
                    (char*)"cat",
                    (char*)"dog",
                    (char*)"--depth",
                    (char*)"3",
                    (char*)"--modifiers",
                    (char*)"alphabet,questions",
                    (char*)"--no-base",
                    (char*)"--data-source",
                    (char*)"yt",
                    (char*)"--format",
                    (char*)"txt",
                    (char*)"--metadata"};
    auto  config = Config::parse(15, argv);

    EXPECT_EQ(config.command, Command::Keywords);
    std::vector<std::string> seeds = {"cat", "dog"};
    EXPECT_EQ(config.keywords, seeds);
    EXPECT_EQ(config.run.max_depth, 3);
    std::vector<Modifier> modifiers = {Modifier::Alphabet, Modifier::Questions};
    EXPECT_EQ(config.run.modifiers, modifiers);
    EXPECT_FALSE(config.run.include_base_query);
    EXPECT_EQ(config.run.data_source, "yt");
    EXPECT_TRUE(config.include_metadata);
    EXPECT_FALSE(config.color);
}

TEST(ConfigTest, ValidateCommandKeepsDefaults) {
    char* argv[] = {(char*)"harvester", (char*)"validate"};
    auto  config = Config::parse(2, argv);
    EXPECT_EQ(config.command, Command::Validate);
    EXPECT_EQ(config.run.max_depth, Constants::DEFAULT_MAX_DEPTH);
    EXPECT_EQ(config.output_dir, Constants::DEFAULT_OUTPUT_DIR);
    EXPECT_TRUE(config.run.rotate_proxy);
}

TEST(ConfigTest, YamlLoading) {
    write_file("test_config.yaml", R"(
max_depth: 4
concurrency: 6
output: "custom_output"
render_serp: true
headless: false
language: de
modifiers: [questions, prepositions]
proxies:
  - "http://yaml_p1"
  - "socks5://yaml_p2"
keywords: single seed
)");

    Config config;
    load_yaml(config, "test_config.yaml");

    EXPECT_EQ(config.run.max_depth, 4);
    EXPECT_EQ(config.run.max_concurrency, 6);
    EXPECT_EQ(config.output_dir, "custom_output");
    EXPECT_TRUE(config.run.render_serp);
    EXPECT_FALSE(config.run.headless);
    EXPECT_EQ(config.run.language, "de");
    EXPECT_EQ(config.run.modifiers.size(), 2);
    EXPECT_EQ(config.run.proxy_urls.size(), 2);
    ASSERT_EQ(config.keywords.size(), 1);
    EXPECT_EQ(config.keywords[0], "single seed");

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    write_file("test_ovr.yaml", "max_depth: 5\nconcurrency: 4\nlanguage: fr\n");

    char* argv[] = {(char*)"harvester",
                    (char*)"--config",
                    (char*)"test_ovr.yaml",
                    (char*)"keywords",
                    (char*)"seed",
                    (char*)"--depth",
                    (char*)"1"};
    auto  config = Config::parse(7, argv);

    EXPECT_EQ(config.run.max_depth, 1);
    EXPECT_EQ(config.run.max_concurrency, 4);
    EXPECT_EQ(config.run.language, "fr");

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, BadYamlIsConfigError) {
    write_file("test_bad.yaml", "max_depth: [unclosed\n");
    Config config;
    EXPECT_THROW(load_yaml(config, "test_bad.yaml"), ConfigError);

    write_file("test_bad.yaml", "max_depth: deep\n");
    EXPECT_THROW(load_yaml(config, "test_bad.yaml"), ConfigError);

    write_file("test_bad.yaml", "modifiers: [emoji]\n");
    EXPECT_THROW(load_yaml(config, "test_bad.yaml"), ConfigError);

    std::remove("test_bad.yaml");
    EXPECT_THROW(load_yaml(config, "does_not_exist.yaml"), ConfigError);
}

TEST(ConfigTest, ListFiles) {
    write_file("test_list.txt", "# seeds\ncat food\n\n   dog  \nc#\n#skipped\n");
    std::vector<std::string> expected = {"cat food", "dog", "c#"};
    EXPECT_EQ(load_list_file("test_list.txt"), expected);
    std::remove("test_list.txt");

    EXPECT_THROW(load_list_file("missing_list.txt"), ConfigError);
}

TEST(ConfigTest, KeywordsFileIsAppended) {
    write_file("test_kw.txt", "from file\n");
    char* argv[] = {(char*)"harvester", (char*)"scrape", (char*)"-k", (char*)"inline", (char*)"-f", (char*)"test_kw.txt"};
    auto  config = Config::parse(6, argv);

    std::vector<std::string> expected = {"inline", "from file"};
    EXPECT_EQ(config.keywords, expected);
    std::remove("test_kw.txt");
}
