#include "./fork.hpp"

#include "./context.hpp"

#include <hatch/error/try_catch.hpp>
#include <hatch/recipe/errors.hpp>
#include <hatch/spec/node.hpp>
#include <hatch/util/log.hpp>

#include <boost/core/demangle.hpp>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <cxxabi.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <typeinfo>

using namespace hatch;
using json = nlohmann::json;

namespace {

/// The name of a type, looking through the wrapper that BOOST_LEAF_THROW_EXCEPTION throws
std::string error_type_name(const std::type_info& type) {
    auto name = boost::core::demangle(type.name());
    if (name.starts_with("boost::leaf::")) {
        auto open  = name.find('<');
        auto close = name.rfind('>');
        if (open != name.npos && close != name.npos && close > open) {
            name = name.substr(open + 1, close - open - 1);
        }
    }
    return name;
}

/// Split "ns::sub::type" into ("ns::sub", "type")
std::pair<std::string, std::string> split_type_name(std::string_view qualified) {
    auto base = qualified.substr(0, qualified.find('<'));
    auto sep  = base.rfind("::");
    if (sep == base.npos) {
        return {"", std::string(qualified)};
    }
    return {std::string(qualified.substr(0, sep)), std::string(qualified.substr(sep + 2))};
}

std::string render_trace(const e_recipe_trace*                       trace,
                         const boost::leaf::verbose_diagnostic_info& info) {
    std::ostringstream out;
    if (trace && !trace->value.empty()) {
        out << "Recipe frames (most recent first):\n";
        for (auto& frame : trace->value) {
            out << "  " << frame.file << ":" << frame.line << ", in " << frame.function
                << (frame.test_helper ? " [test helper]" : "") << "\n";
        }
    }
    out << info;
    return out.str();
}

/**
 * @brief Runs in the child: prepare the environment, run the action, and describe the outcome
 * as a message envelope.
 */
json run_child(build_session& session, const build_action& action, const fork_options& opts) {
    const auto ctx       = opts.setup.context;
    const auto build_log = ctx == env_context::build ? opts.build_log : std::nullopt;
    const auto test_log  = ctx == env_context::test ? opts.test_log : std::nullopt;

    auto make_error = [&](std::string_view             type,
                          std::string_view             what,
                          std::vector<std::string>     context,
                          std::string                  trace) {
        auto [module, name] = split_type_name(type);
        child_error err{neo::ufmt("{}: {}", name, what),
                        module,
                        name,
                        std::move(trace),
                        std::move(context),
                        build_log,
                        test_log};
        return json{{"kind", "error"}, {"error", err}};
    };

    return hatch_leaf_try {
        if (opts.build_log) {
            session.toolkit().attach_log(*opts.build_log);
        }
        if (!opts.fake) {
            setup_package(session, opts.setup);
        }
        auto value = action(session);
        return json{{"kind", "value"}, {"value", std::move(value)}};
    }
    hatch_leaf_catch(const stop_phase& stop) {
        return json{
            {"kind", "stop"},
            {"message", stop.message()},
            {"long_message", stop.long_message()},
        };
    }
    hatch_leaf_catch(const std::exception&                       exc,
                     const boost::leaf::verbose_diagnostic_info& info,
                     const e_recipe_trace*                       trace) {
        std::vector<std::string> context;
        // Failed test assertions are explained by the test output
        if (trace && dynamic_cast<const test_failure*>(&exc) == nullptr) {
            context = get_package_context(trace->value);
        }
        return make_error(error_type_name(typeid(exc)),
                          exc.what(),
                          std::move(context),
                          render_trace(trace, info));
    }
    hatch_leaf_catch(const boost::leaf::verbose_diagnostic_info& info,
                     const e_recipe_trace*                       trace) {
        auto current = abi::__cxa_current_exception_type();
        auto type    = current ? error_type_name(*current) : std::string("unknown");
        std::vector<std::string> context;
        if (trace) {
            context = get_package_context(trace->value);
        }
        return make_error(type, "unknown error", std::move(context), render_trace(trace, info));
    };
}

bool write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        auto n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

/// Send one length-prefixed message
bool send_message(int fd, std::string_view payload) {
    std::uint64_t size = payload.size();
    char          header[sizeof size];
    std::memcpy(header, &size, sizeof size);
    return write_all(fd, std::string_view(header, sizeof header)) && write_all(fd, payload);
}

/// Read the single message of the channel. Returns nothing if the sender did not finish it.
std::optional<std::string> receive_message(int fd) {
    std::string data;
    char        buf[4096];
    while (true) {
        auto n = ::read(fd, buf, sizeof buf);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            hatch_log(debug, "Reading from the build process failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }
        data.append(buf, static_cast<std::size_t>(n));
    }
    std::uint64_t size = 0;
    if (data.size() < sizeof size) {
        return std::nullopt;
    }
    std::memcpy(&size, data.data(), sizeof size);
    if (data.size() - sizeof size != size) {
        return std::nullopt;
    }
    return data.substr(sizeof size);
}

[[noreturn]] void child_main(int                 out_fd,
                             int                 input_fd,
                             build_session&      session,
                             const build_action& action,
                             const fork_options& opts) {
    if (input_fd >= 0) {
        ::dup2(input_fd, STDIN_FILENO);
        ::close(input_fd);
    }
    int status = 0;
    try {
        auto envelope = run_child(session, action, opts);
        auto payload  = envelope.dump(-1, ' ', false, json::error_handler_t::replace);
        if (!send_message(out_fd, payload)) {
            hatch_log(error, "Failed to send the build result: {}", std::strerror(errno));
            status = 1;
        }
    } catch (const std::exception& e) {
        // Nothing may unwind out of the child into the caller's frames
        hatch_log(critical, "Failed to report the build result: {}", e.what());
        status = 2;
    } catch (...) {
        hatch_log(critical, "Failed to report the build result: unknown exception");
        status = 2;
    }
    ::close(out_fd);
    std::fflush(nullptr);
    ::_exit(status);
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            hatch_log(debug, "waitpid() failed: {}", std::strerror(errno));
            return -1;
        }
    }
    return status;
}

std::string describe_exit(int status) {
    if (status < 0) {
        return "could not be waited for";
    }
    if (WIFSIGNALED(status)) {
        return neo::ufmt("was terminated by signal {}", WTERMSIG(status));
    }
    return neo::ufmt("exited with status {}", WEXITSTATUS(status));
}

}  // namespace

isolated_result
hatch::run_isolated(build_session& session, const build_action& action, fork_options opts) {
    const auto& root = session.root();

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        BOOST_LEAF_THROW_EXCEPTION(install_error(neo::ufmt("Failed to create a channel to the "
                                                           "build process: {}",
                                                           std::strerror(errno))),
                                   e_package_id{root.short_spec()});
    }
    const int read_fd  = fds[0];
    const int write_fd = fds[1];

    // Interactive prompts of the build (passwords, licenses) still reach the terminal
    int input_fd = -1;
    if (::isatty(STDIN_FILENO)) {
        input_fd = ::dup(STDIN_FILENO);
    }

    std::fflush(nullptr);
    hatch_log(debug, "Starting isolated {} of {}", to_string(opts.setup.context), root.short_spec());
    auto pid = ::fork();
    if (pid < 0) {
        auto err = errno;
        ::close(read_fd);
        ::close(write_fd);
        if (input_fd >= 0) {
            ::close(input_fd);
        }
        BOOST_LEAF_THROW_EXCEPTION(install_error(neo::ufmt("Failed to start the build process: {}",
                                                           std::strerror(err))),
                                   e_package_id{root.short_spec()});
    }
    if (pid == 0) {
        ::close(read_fd);
        child_main(write_fd, input_fd, session, action, opts);
    }

    ::close(write_fd);
    if (input_fd >= 0) {
        ::close(input_fd);
    }
    auto message = receive_message(read_fd);
    ::close(read_fd);
    auto status = wait_child(pid);

    json envelope = message ? json::parse(*message, nullptr, false) : json{};
    if (!envelope.is_object() || !envelope.contains("kind") || !envelope["kind"].is_string()) {
        const auto ctx = opts.setup.context;
        return isolated_result{
            std::in_place_type<child_error>,
            neo::ufmt("Build process for {} {} without reporting a result",
                      root.short_spec(),
                      describe_exit(status)),
            "hatch",
            "child_error",
            "",
            std::vector<std::string>{},
            ctx == env_context::build ? opts.build_log : std::nullopt,
            ctx == env_context::test ? opts.test_log : std::nullopt,
        };
    }

    auto kind = envelope["kind"].get<std::string>();
    if (kind == "stop") {
        return isolated_result{std::in_place_type<stop_phase>,
                               envelope["message"].get<std::string>(),
                               envelope["long_message"].get<std::string>()};
    }
    if (kind == "error") {
        return isolated_result{std::in_place_type<child_error>,
                               child_error::from_json(envelope["error"])};
    }
    return isolated_result{std::in_place_type<json>, std::move(envelope["value"])};
}

json hatch::fork_build(build_session& session, const build_action& action, fork_options opts) {
    auto result = run_isolated(session, action, std::move(opts));
    if (auto stop = std::get_if<stop_phase>(&result)) {
        BOOST_LEAF_THROW_EXCEPTION(std::move(*stop));
    }
    if (auto err = std::get_if<child_error>(&result)) {
        // Shown here so the diagnostic is visible however shallow the caller's handling is
        err->print_context(session.config().debug);
        BOOST_LEAF_THROW_EXCEPTION(std::move(*err), e_package_id{session.root().short_spec()});
    }
    return std::move(std::get<json>(result));
}
