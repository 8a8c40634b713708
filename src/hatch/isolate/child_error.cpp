#include "./child_error.hpp"

#include "./log_parse.hpp"

#include <hatch/util/log.hpp>
#include <hatch/util/string.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

using namespace hatch;

namespace {

struct error_type {
    std::string_view module;
    std::string_view name;
};

/// Errors raised by running external programs. These are best explained by the build log.
constexpr error_type build_errors[] = {
    {"hatch", "process_error"},
};

bool log_exists(const std::optional<fs::path>& log) {
    std::error_code ec;
    return log && fs::exists(*log, ec);
}

std::optional<fs::path> optional_path(const nlohmann::json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    return fs::path(j.get<std::string>());
}

nlohmann::json path_or_null(const std::optional<fs::path>& p) {
    if (!p) {
        return nullptr;
    }
    return p->string();
}

}  // namespace

child_error::child_error(std::string              message,
                         std::string              module,
                         std::string              name,
                         std::string              trace,
                         std::vector<std::string> context,
                         std::optional<fs::path>  build_log,
                         std::optional<fs::path>  test_log)
    : install_error(std::move(message))
    , _module(std::move(module))
    , _name(std::move(name))
    , _trace(std::move(trace))
    , _context(std::move(context))
    , _build_log(std::move(build_log))
    , _test_log(std::move(test_log)) {}

bool child_error::is_build_error() const noexcept {
    return std::any_of(std::begin(build_errors), std::end(build_errors), [&](auto& err) {
        return err.module == _module && err.name == _name;
    });
}

std::string child_error::long_message() const {
    std::ostringstream out;

    if (is_build_error()) {
        if (log_exists(_build_log)) {
            write_log_summary(out, "build", *_build_log);
        }
        if (log_exists(_test_log)) {
            write_log_summary(out, "test", *_test_log);
        }
    } else if (!_context.empty()) {
        out << "\n" << joinstr("\n", _context) << "\n";
    }

    if (!out.str().empty()) {
        out << "\n";
    }

    if (log_exists(_build_log)) {
        out << "See build log for details:\n  " << _build_log->string() << "\n";
    }
    if (log_exists(_test_log)) {
        out << "See test log for details:\n  " << _test_log->string() << "\n";
    }
    return out.str();
}

void child_error::print_context(bool with_trace) const {
    if (_printed) {
        return;
    }
    hatch_log(error, "{}", message());
    auto long_msg = long_message();
    if (!long_msg.empty()) {
        fmt::print(stderr, "{}\n", long_msg);
    }
    if (with_trace && !_trace.empty()) {
        fmt::print(stderr, "{}\n", _trace);
    }
    _printed = true;
}

void hatch::to_json(nlohmann::json& j, const child_error& err) {
    j = nlohmann::json{
        {"message", err.message()},
        {"module", err._module},
        {"name", err._name},
        {"trace", err._trace},
        {"context", err._context},
        {"build_log", path_or_null(err._build_log)},
        {"test_log", path_or_null(err._test_log)},
    };
}

child_error child_error::from_json(const nlohmann::json& j) {
    return child_error{
        j.at("message").get<std::string>(),
        j.at("module").get<std::string>(),
        j.at("name").get<std::string>(),
        j.at("trace").get<std::string>(),
        j.at("context").get<std::vector<std::string>>(),
        optional_path(j.at("build_log")),
        optional_path(j.at("test_log")),
    };
}
