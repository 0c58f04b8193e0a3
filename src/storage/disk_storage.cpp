#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>
#include "../core/logger/logger.hpp"

namespace Harvester {
namespace Storage {

using Harvester::Core::Logger;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create storage directory: " + base_path_ + " (" + ec.message() + ")");
    }
}

std::string DiskStorage::locate(const std::string& key) const {
    std::filesystem::path path(base_path_);
    path /= key;
    return path.string();
}

bool DiskStorage::exists(const std::string& key) const {
    std::error_code ec;
    return std::filesystem::exists(locate(key), ec);
}

bool DiskStorage::save(const std::string& key, const std::string& content) {
    try {
        std::filesystem::path path(locate(key));

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Write Error: " + path.string());
            return false;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            Logger::error("Write Error: " + path.string());
            return false;
        }
        Logger::debug("Saved: " + path.string());
        return true;
    } catch (const std::exception& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        return false;
    }
}

bool DiskStorage::writable() const {
    std::error_code ec;
    std::filesystem::path base(base_path_.empty() ? "." : base_path_);
    std::filesystem::create_directories(base, ec);
    if (ec)
        return false;

    auto probe = base / ".harvester_write_test";
    {
        std::ofstream file(probe, std::ios::trunc);
        if (!file.is_open())
            return false;
        file << "ok";
        if (!file)
            return false;
    }
    std::filesystem::remove(probe, ec);
    return true;
}

}  // namespace Storage
}  // namespace Harvester
