#pragma once

#include <hatch/util/fs/path.hpp>
#include <hatch/util/proc.hpp>

#include <map>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

namespace hatch {

/**
 * @brief Options for one invocation of an executable.
 */
struct run_options {
    /// Variables set for this invocation only
    std::map<std::string, std::string> extra_env = {};
    std::optional<fs::path>            cwd       = std::nullopt;
    /// If false, a failing command is reported through the result instead of a process_error
    bool fail_on_error = true;
};

/**
 * @brief A callable command-line tool as seen by a recipe.
 *
 * The output of every invocation is appended to the log file, if one is attached.
 */
class executable {
    std::vector<std::string>           _command;
    std::map<std::string, std::string> _default_env;
    std::optional<fs::path>            _log_path;

public:
    executable() = default;
    explicit executable(std::string name)
        : _command{std::move(name)} {}
    explicit executable(std::vector<std::string> command)
        : _command(std::move(command)) {}

    /// The program name, as given
    const std::string& name() const noexcept { return _command.front(); }
    const std::vector<std::string>& command() const noexcept { return _command; }

    /// The absolute path of the program, if it can be found
    std::optional<fs::path> path() const { return find_program(name()); }

    void add_default_arg(std::string arg) { _command.push_back(std::move(arg)); }
    void add_default_env(std::string key, std::string value) {
        _default_env.insert_or_assign(std::move(key), std::move(value));
    }

    void attach_log(fs::path log_path) { _log_path = std::move(log_path); }
    const std::optional<fs::path>& log_path() const noexcept { return _log_path; }

    /**
     * @brief Run the program with the default arguments followed by @p args.
     *
     * Throws a process_error if the program fails and @p opts.fail_on_error is set. The caller's
     * location is recorded as a recipe frame on any error.
     */
    proc_result operator()(std::vector<std::string> args,
                           run_options              opts = {},
                           std::source_location     loc  = std::source_location::current()) const;
};

/// Options for one invocation of a make_executable (make_executable::options)
struct make_executable_options {
    /// Overrides whether this invocation runs in parallel. Defaults to jobs() > 1.
    std::optional<bool> parallel = std::nullopt;
    /// If non-empty, also name an environment variable that receives the job count
    std::string jobs_env = {};
    run_options run      = {};
};

/**
 * @brief An executable for make-like tools, which are given a -jN argument for parallel builds.
 *
 * Setting HATCH_NO_PARALLEL_MAKE to a truthy value disables parallel invocations globally.
 */
class make_executable : public executable {
    int _jobs = 1;

public:
    using options = make_executable_options;

    make_executable() = default;
    make_executable(std::string name, int jobs)
        : executable(std::move(name))
        , _jobs(jobs) {}

    int jobs() const noexcept { return _jobs; }

    /**
     * @brief Compute the arguments and environment of an invocation without running it.
     */
    std::vector<std::string> make_args(std::vector<std::string> args, options& opts) const;

    proc_result operator()(std::vector<std::string> args,
                           options                  opts = {},
                           std::source_location     loc  = std::source_location::current()) const;
};

}  // namespace hatch
