#pragma once

#include <hatch/error/errors.hpp>
#include <hatch/util/fs/path.hpp>

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <vector>

namespace hatch {

/**
 * @brief A failure inside an isolated build, as seen by the parent process.
 *
 * Carries only data, so that it can be sent across the process boundary. The type of the
 * original error is kept as a (module, name) pair: errors raised by external programs render an
 * excerpt of the build log, other errors render the recipe source around the failure.
 */
class child_error : public install_error {
    std::string              _module;
    std::string              _name;
    std::string              _trace;
    std::vector<std::string> _context;
    std::optional<fs::path>  _build_log;
    std::optional<fs::path>  _test_log;

    mutable bool _printed = false;

public:
    child_error(std::string              message,
                std::string              module,
                std::string              name,
                std::string              trace,
                std::vector<std::string> context,
                std::optional<fs::path>  build_log,
                std::optional<fs::path>  test_log);

    std::string message() const { return what(); }

    const std::string& module() const noexcept { return _module; }
    const std::string& name() const noexcept { return _name; }
    const std::string& trace() const noexcept { return _trace; }

    const std::vector<std::string>& context() const noexcept { return _context; }
    const std::optional<fs::path>&  build_log() const noexcept { return _build_log; }
    const std::optional<fs::path>&  test_log() const noexcept { return _test_log; }

    /// Whether the original error came from running an external program
    bool is_build_error() const noexcept;

    /**
     * @brief The diagnostic shown below the message: a log excerpt or recipe source context,
     * followed by the paths of the logs.
     */
    std::string long_message() const;

    /**
     * @brief Log the message and print the long message to stderr. Does nothing if the error
     * was already printed.
     */
    void print_context(bool with_trace = false) const;

    friend void to_json(nlohmann::json&, const child_error&);
    static child_error from_json(const nlohmann::json&);
};

void to_json(nlohmann::json&, const child_error&);

}  // namespace hatch
