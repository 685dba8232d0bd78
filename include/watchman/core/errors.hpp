#pragma once

#include <stdexcept>
#include <string>

namespace Watchman {

/**
 * @brief Query for a target name that is not currently registered.
 * Client error; callers map it to "not found" and do not retry.
 */
class TargetNotFoundError : public std::runtime_error {
public:
    explicit TargetNotFoundError(const std::string& name)
        : std::runtime_error("Target not found: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief Registration rejected because the target itself is malformed
 * (empty name, unparseable endpoint, ...).
 */
class InvalidTargetError : public std::invalid_argument {
public:
    explicit InvalidTargetError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace Watchman
