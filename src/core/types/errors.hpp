#pragma once
#include <stdexcept>
#include <string>

namespace Harvester {
namespace Core {

enum class ErrorKind { None, Network, Timeout, Blocked, Parse, ExhaustedRetries };

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Network: return "network";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Blocked: return "blocked";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::ExhaustedRetries: return "exhausted_retries";
    }
    return "unknown";
}

// Invalid run configuration, detected before any scheduling starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {
    }
};

// A response that looked well-formed but could not be interpreted as a whole.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {
    }
};

}  // namespace Core
}  // namespace Harvester
