#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace hatch {

/**
 * @brief A short human-readable description of what went wrong. Loaded onto errors that are
 * expected to reach a user.
 */
struct e_human_message {
    std::string value;
};

/**
 * @brief Identity (short spec string) of the package whose build raised an error.
 */
struct e_package_id {
    std::string value;
};

/**
 * @brief A required executable could not be found.
 */
struct e_missing_executable {
    std::string value;
};

/**
 * @brief Base of all errors raised while installing a package.
 *
 * Errors of this type that escape a build are tagged with an e_package_id by the isolation
 * runner, so the caller can tell which package went wrong.
 */
class install_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/**
 * @brief Raised when the build environment cannot be prepared (before any child is forked, or
 * in the child before the build action runs).
 */
class setup_error : public install_error {
public:
    using install_error::install_error;
};

/**
 * @brief An external program run during a build exited unsuccessfully.
 */
class process_error : public install_error {
public:
    std::vector<std::string> command;
    int                      retc   = 0;
    int                      signal = 0;

    process_error(std::string msg, std::vector<std::string> cmd, int rc, int sig)
        : install_error(std::move(msg))
        , command(std::move(cmd))
        , retc(rc)
        , signal(sig) {}
};

/**
 * @brief A user-written package test assertion failed.
 */
class test_failure : public install_error {
public:
    using install_error::install_error;
};

/**
 * @brief Raised by a build action to stop the remaining phases of a build. This is a control
 * directive, not a failure.
 */
class stop_phase : public std::exception {
    std::string _message;
    std::string _long_message;

public:
    explicit stop_phase(std::string message, std::string long_message = {})
        : _message(std::move(message))
        , _long_message(std::move(long_message)) {}

    const std::string& message() const noexcept { return _message; }
    const std::string& long_message() const noexcept { return _long_message; }

    const char* what() const noexcept override { return _message.c_str(); }
};

}  // namespace hatch
