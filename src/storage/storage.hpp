#pragma once
#include <string>

namespace Harvester {
namespace Storage {

// Keyed sink for exported documents; keys are relative paths.
class Storage {
public:
    virtual ~Storage() = default;

    // Replaces whatever is stored under key. Returns false on failure.
    virtual bool save(const std::string& key, const std::string& content) = 0;

    virtual bool exists(const std::string& key) const = 0;

    // Where the key ends up, for reporting.
    virtual std::string locate(const std::string& key) const = 0;
};

}  // namespace Storage
}  // namespace Harvester
