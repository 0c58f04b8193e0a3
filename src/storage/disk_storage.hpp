#pragma once
#include <string>
#include "storage.hpp"

namespace Harvester {
namespace Storage {

class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    bool        save(const std::string& key, const std::string& content) override;
    bool        exists(const std::string& key) const override;
    std::string locate(const std::string& key) const override;

    // Creates the base directory if needed and checks a file can be written there.
    bool writable() const;

    const std::string& base_path() const {
        return base_path_;
    }

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Harvester
