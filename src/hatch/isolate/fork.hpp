#pragma once

#include "./child_error.hpp"

#include <hatch/build/setup.hpp>
#include <hatch/error/errors.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <variant>

namespace hatch {

/**
 * @brief The build logic run inside the isolated process. Its return value is sent back to the
 * parent.
 */
using build_action = std::function<nlohmann::json(build_session&)>;

struct fork_options {
    setup_options setup = {};
    /// Skip environment setup in the child and only run the action
    bool fake = false;
    /// Log of the build. Tools run through the root toolkit append to it.
    std::optional<fs::path> build_log = std::nullopt;
    /// Log of the package tests
    std::optional<fs::path> test_log = std::nullopt;
};

/**
 * @brief The outcome of an isolated build: the action's value, a request to stop the remaining
 * phases, or a failure.
 */
using isolated_result = std::variant<nlohmann::json, stop_phase, child_error>;

/**
 * @brief Run @p action in a forked child process, after preparing the child's environment for
 * the session's root node.
 *
 * Blocks until the child has sent its single message and exited. Nothing the action does to its
 * process affects the caller. Throws an install_error tagged with e_package_id if the child
 * cannot be started.
 */
isolated_result run_isolated(build_session& session, const build_action& action, fork_options);

/**
 * @brief Like run_isolated, but a failure is printed and thrown as a child_error tagged with
 * e_package_id, and a stop request is thrown as a stop_phase.
 */
nlohmann::json fork_build(build_session& session, const build_action& action, fork_options);

}  // namespace hatch
