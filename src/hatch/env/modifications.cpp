#include "./modifications.hpp"

#include <hatch/env/system_paths.hpp>
#include <hatch/util/algo.hpp>
#include <hatch/util/log.hpp>
#include <hatch/util/string.hpp>

#include <fmt/format.h>
#include <neo/assert.hpp>

#include <algorithm>
#include <set>

using namespace hatch;

namespace {

std::vector<std::string> split_flags(std::string_view value, std::string_view sep) {
    std::vector<std::string> ret;
    if (sep.empty()) {
        ret.emplace_back(value);
        return ret;
    }
    for (auto& part : split(value, sep)) {
        if (!part.empty()) {
            ret.push_back(std::move(part));
        }
    }
    return ret;
}

/// An empty element of a path list means the working directory, so it is kept
std::vector<std::string> split_path_elems(std::string_view value, std::string_view sep) {
    if (value.empty()) {
        return {};
    }
    if (sep.empty()) {
        return {std::string(value)};
    }
    return split(value, sep);
}

std::string_view sep_or(std::string_view sep, std::string_view dflt) {
    return sep.empty() ? dflt : sep;
}

std::string sh_quote(std::string_view s) {
    return "'" + replace(s, "'", "'\\''") + "'";
}

}  // namespace

std::string_view hatch::to_string(env_op op) noexcept {
    switch (op) {
    case env_op::set:
        return "set";
    case env_op::unset:
        return "unset";
    case env_op::append_flags:
        return "append-flags";
    case env_op::remove_flags:
        return "remove-flags";
    case env_op::set_path:
        return "set-path";
    case env_op::append_path:
        return "append-path";
    case env_op::prepend_path:
        return "prepend-path";
    case env_op::remove_path:
        return "remove-path";
    case env_op::deprioritize_system_paths:
        return "deprioritize-system-paths";
    case env_op::prune_duplicate_paths:
        return "prune-duplicate-paths";
    }
    neo_assert_always(invariant, false, "Invalid env_op value", int(op));
}

void env_modification::execute(env_snapshot& env) const {
    auto found   = env.find(name);
    auto present = found != env.end();
    auto current = present ? std::string_view(found->second) : std::string_view();

    switch (kind) {
    case env_op::set:
        env[name] = values.front();
        return;
    case env_op::unset:
        env.erase(name);
        return;
    case env_op::append_flags: {
        auto flags = split_flags(current, sep_or(separator, " "));
        for (auto& flag : split_flags(values.front(), sep_or(separator, " "))) {
            if (std::find(flags.begin(), flags.end(), flag) == flags.end()) {
                flags.push_back(flag);
            }
        }
        env[name] = joinstr(sep_or(separator, " "), flags);
        return;
    }
    case env_op::remove_flags: {
        if (!present) {
            return;
        }
        auto flags   = split_flags(current, sep_or(separator, " "));
        auto removed = split_flags(values.front(), sep_or(separator, " "));
        erase_if(flags, [&](const std::string& f) {
            return std::find(removed.begin(), removed.end(), f) != removed.end();
        });
        env[name] = joinstr(sep_or(separator, " "), flags);
        return;
    }
    case env_op::set_path:
        env[name] = joinstr(separator, values);
        return;
    case env_op::append_path:
    case env_op::prepend_path: {
        auto elems = split_path_elems(current, separator);
        erase_if(elems, [&](const std::string& e) { return e == values.front(); });
        if (kind == env_op::append_path) {
            elems.push_back(values.front());
        } else {
            elems.insert(elems.begin(), values.front());
        }
        env[name] = joinstr(separator, elems);
        return;
    }
    case env_op::remove_path: {
        if (!present) {
            return;
        }
        auto elems = split_path_elems(current, separator);
        erase_if(elems, [&](const std::string& e) { return e == values.front(); });
        env[name] = joinstr(separator, elems);
        return;
    }
    case env_op::deprioritize_system_paths: {
        if (!present) {
            return;
        }
        auto elems = split_path_elems(current, separator);
        std::stable_partition(elems.begin(), elems.end(), [](const std::string& e) {
            return !is_system_path(e);
        });
        env[name] = joinstr(separator, elems);
        return;
    }
    case env_op::prune_duplicate_paths: {
        if (!present) {
            return;
        }
        auto elems = split_path_elems(current, separator);
        dedupe(elems);
        env[name] = joinstr(separator, elems);
        return;
    }
    }
    neo_assert_always(invariant, false, "Unhandled environment operation", int(kind), name);
}

void environment_modifications::_push(env_op                   kind,
                                      std::string_view         name,
                                      std::vector<std::string> values,
                                      std::string_view         sep) {
    _mods.push_back(env_modification{
        .kind      = kind,
        .name      = std::string(name),
        .values    = std::move(values),
        .separator = std::string(sep),
        .origin    = _origin,
    });
}

void environment_modifications::set(std::string_view name, std::string_view value) {
    _push(env_op::set, name, {std::string(value)}, "");
}

void environment_modifications::unset(std::string_view name) {
    _push(env_op::unset, name, {}, "");
}

void environment_modifications::append_flags(std::string_view name,
                                             std::string_view value,
                                             std::string_view sep) {
    _push(env_op::append_flags, name, {std::string(value)}, sep);
}

void environment_modifications::remove_flags(std::string_view name,
                                             std::string_view value,
                                             std::string_view sep) {
    _push(env_op::remove_flags, name, {std::string(value)}, sep);
}

void environment_modifications::set_path(std::string_view                name,
                                         const std::vector<std::string>& elements,
                                         std::string_view                sep) {
    _push(env_op::set_path, name, elements, sep);
}

void environment_modifications::append_path(std::string_view name,
                                            std::string_view path,
                                            std::string_view sep) {
    _push(env_op::append_path, name, {std::string(path)}, sep);
}

void environment_modifications::prepend_path(std::string_view name,
                                             std::string_view path,
                                             std::string_view sep) {
    _push(env_op::prepend_path, name, {std::string(path)}, sep);
}

void environment_modifications::remove_path(std::string_view name,
                                            std::string_view path,
                                            std::string_view sep) {
    _push(env_op::remove_path, name, {std::string(path)}, sep);
}

void environment_modifications::deprioritize_system_paths(std::string_view name,
                                                          std::string_view sep) {
    _push(env_op::deprioritize_system_paths, name, {}, sep);
}

void environment_modifications::prune_duplicate_paths(std::string_view name,
                                                      std::string_view sep) {
    _push(env_op::prune_duplicate_paths, name, {}, sep);
}

void environment_modifications::extend(const environment_modifications& other) {
    hatch::extend(_mods, other._mods);
}

bool environment_modifications::is_unset(std::string_view name) const noexcept {
    auto last = std::find_if(_mods.rbegin(), _mods.rend(), [&](const env_modification& m) {
        return m.name == name;
    });
    return last != _mods.rend() && last->kind == env_op::unset;
}

std::map<std::string, std::vector<const env_modification*>>
environment_modifications::group_by_name() const {
    std::map<std::string, std::vector<const env_modification*>> ret;
    for (auto& mod : _mods) {
        ret[mod.name].push_back(&mod);
    }
    return ret;
}

void environment_modifications::apply_to(env_snapshot& env) const {
    for (auto& mod : _mods) {
        mod.execute(env);
    }
}

void environment_modifications::apply() const {
    const auto before = snapshot_environment();
    auto       after  = before;
    apply_to(after);

    std::set<std::string> touched;
    for (auto& mod : _mods) {
        touched.insert(mod.name);
    }
    for (auto& name : touched) {
        auto now = after.find(name);
        auto was = before.find(name);
        if (now == after.end()) {
            if (was != before.end()) {
                hatch_log(trace, "Environment: unset {}", name);
                hatch::unsetenv(name);
            }
        } else if (was == before.end() || was->second != now->second) {
            hatch_log(trace, "Environment: {}={}", name, now->second);
            hatch::setenv(name, now->second);
        }
    }
}

std::string environment_modifications::shell_modifications(shell_kind shell) const {
    const auto before = snapshot_environment();
    auto       after  = before;
    apply_to(after);

    std::set<std::string> touched;
    for (auto& mod : _mods) {
        touched.insert(mod.name);
    }
    std::string out;
    for (auto& name : touched) {
        auto now = after.find(name);
        if (now == after.end()) {
            if (before.contains(name)) {
                out += shell == shell_kind::sh ? fmt::format("unset {};\n", name)
                                               : fmt::format("unsetenv {};\n", name);
            }
            continue;
        }
        auto was = before.find(name);
        if (was != before.end() && was->second == now->second) {
            continue;
        }
        out += shell == shell_kind::sh
            ? fmt::format("export {}={};\n", name, sh_quote(now->second))
            : fmt::format("setenv {} {};\n", name, sh_quote(now->second));
    }
    return out;
}

std::vector<std::string> environment_modifications::validation_warnings() const {
    std::vector<std::string> ret;
    for (auto& [name, mods] : group_by_name()) {
        const bool suspicious = std::any_of(mods.begin() + 1, mods.end(), [](auto m) {
            return m->kind == env_op::set || m->kind == env_op::unset;
        });
        if (!suspicious) {
            continue;
        }
        auto msg = fmt::format("Suspicious requests to set or unset '{}' found", name);
        for (auto m : mods) {
            msg += fmt::format("\n    {} {} [{}]",
                               to_string(m->kind),
                               name,
                               m->origin.empty() ? "unknown origin" : m->origin);
        }
        ret.push_back(std::move(msg));
    }
    return ret;
}

void hatch::validate(const environment_modifications&                 env,
                     const std::function<void(std::string_view)>& warn) {
    for (auto& w : env.validation_warnings()) {
        warn(w);
    }
}
