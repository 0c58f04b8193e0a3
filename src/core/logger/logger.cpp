#include "logger.hpp"
#include <iostream>

namespace Harvester {
namespace Core {

int  Logger::level_ = LogLevel::LOG_DEFAULT;
bool Logger::color_ = true;

std::mutex Logger::mutex_;

namespace {
const std::string RESET  = "\033[0m";
const std::string RED    = "\033[31m";
const std::string GREEN  = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string BLUE   = "\033[34m";
const std::string GREY   = "\033[90m";

void write_line(std::ostream& out,
                bool               color,
                const std::string& tint,
                const std::string& tag,
                const std::string& message) {
    if (color)
        out << tint << tag << RESET << message << std::endl;
    else
        out << tag << message << std::endl;
}
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_color(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = enabled;
}

void Logger::debug(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_DEBUG) {
        write_line(std::cout, color_, GREY, "[DEBUG] ", message);
    }
}

void Logger::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_INFO) {
        write_line(std::cout, color_, BLUE, "[INFO] ", message);
    }
}

void Logger::success(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_SUCCESS) {
        write_line(std::cout, color_, GREEN, "[SUCCESS] ", message);
    }
}

void Logger::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_WARN) {
        write_line(std::cerr, color_, YELLOW, "[WARN] ", message);
    }
}

void Logger::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_ERROR) {
        write_line(std::cerr, color_, RED, "[ERROR] ", message);
    }
}

}  // namespace Core
}  // namespace Harvester
