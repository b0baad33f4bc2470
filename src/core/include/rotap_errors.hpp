#ifndef ROTAP_ERRORS_HPP
#define ROTAP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rotap {

/// Configuration document unreadable, malformed or semantically invalid.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error("config: " + msg) {}
};

/// Unrecoverable condition: the daemon must not keep serving credentials.
class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& msg)
        : std::runtime_error(msg) {}
};

} // namespace rotap

#endif // ROTAP_ERRORS_HPP
