#include "./env.hpp"

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

extern char** environ;

std::optional<std::string> hatch::getenv(const std::string& varname) noexcept {
    auto cptr = std::getenv(varname.data());
    if (cptr) {
        return std::string(cptr);
    }
    return {};
}

bool hatch::getenv_bool(const std::string& varname) noexcept {
    auto s = getenv(varname);
    return s.has_value() && is_truthy_string(*s);
}

bool hatch::is_truthy_string(std::string_view s) noexcept {
    for (std::string_view t : {"1", "true", "on", "TRUE", "ON", "YES", "yes"}) {
        if (s == t) {
            return true;
        }
    }
    return false;
}

void hatch::setenv(const std::string& name, const std::string& value) {
    if (::setenv(name.c_str(), value.c_str(), 1) != 0) {
        auto ec = std::error_code(errno, std::system_category());
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     neo::ufmt("Failed to set environment "
                                                               "variable [{}]",
                                                               name)),
                                   ec);
    }
}

void hatch::unsetenv(const std::string& name) {
    if (::unsetenv(name.c_str()) != 0) {
        auto ec = std::error_code(errno, std::system_category());
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     neo::ufmt("Failed to unset environment "
                                                               "variable [{}]",
                                                               name)),
                                   ec);
    }
}

hatch::env_snapshot hatch::snapshot_environment() {
    env_snapshot ret;
    for (auto cur = environ; cur && *cur; ++cur) {
        std::string_view entry = *cur;
        auto             eq    = entry.find('=');
        if (eq == entry.npos) {
            continue;
        }
        ret.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return ret;
}

void hatch::restore_environment(const env_snapshot& snap) {
    auto current = snapshot_environment();
    for (auto& [key, _] : current) {
        if (!snap.contains(key)) {
            hatch::unsetenv(key);
        }
    }
    for (auto& [key, value] : snap) {
        auto found = current.find(key);
        if (found == current.end() || found->second != value) {
            hatch::setenv(key, value);
        }
    }
}
