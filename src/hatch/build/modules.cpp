#include "./modules.hpp"

#include <hatch/util/log.hpp>
#include <hatch/util/proc.hpp>
#include <hatch/util/string.hpp>

#include <neo/ufmt.hpp>

#include <algorithm>
#include <cctype>

using namespace hatch;

namespace {

constexpr std::string_view diff_marker = "HATCH-MODULE-ENV-DIFF";

bool is_word_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// Whether the variable name appears in the line following a non-word character
bool mentions_variable(std::string_view line, std::string_view var) {
    auto pos = line.find(var);
    while (pos != line.npos) {
        if (pos > 0 && !is_word_char(line[pos - 1])) {
            return true;
        }
        pos = line.find(var, pos + 1);
    }
    return false;
}

/// The path argument of a Tcl ("prepend-path PATH /x") or Lua ('prepend_path("PATH","/x")') line
std::string path_arg_of_line(std::string_view line) {
    if (contains(line, "(")) {
        auto parts = split(line, "\"");
        return parts.size() > 3 ? parts[3] : "";
    }
    std::vector<std::string> words;
    for (auto& w : split(trim(line), " ")) {
        if (!trim(w).empty()) {
            words.emplace_back(trim(w));
        }
    }
    return words.size() > 2 ? words[2] : "";
}

std::string cut_at(std::string path, std::string_view key) {
    auto pos = path.find(key);
    if (pos != path.npos) {
        path.erase(pos);
    }
    return path;
}

}  // namespace

env_snapshot hatch::parse_env_dump(std::string_view dump) {
    env_snapshot ret;
    while (!dump.empty()) {
        auto end   = dump.find('\0');
        auto entry = dump.substr(0, end);
        auto eq    = entry.find('=');
        if (eq != entry.npos && eq != 0) {
            ret.insert_or_assign(std::string(entry.substr(0, eq)),
                                 std::string(entry.substr(eq + 1)));
        }
        if (end == dump.npos) {
            break;
        }
        dump.remove_prefix(end + 1);
    }
    return ret;
}

void hatch::apply_environment_diff(const env_snapshot& before, const env_snapshot& after) {
    for (auto& [key, value] : after) {
        auto prev = before.find(key);
        if (prev == before.end() || prev->second != value) {
            hatch_log(trace, "Module changed environment variable {}", key);
            hatch::setenv(key, value);
        }
    }
    for (auto& [key, _] : before) {
        if (!after.contains(key)) {
            hatch_log(trace, "Module removed environment variable {}", key);
            hatch::unsetenv(key);
        }
    }
}

void shell_module_system::_change(std::string_view verb, std::string_view name) {
    hatch_log(debug, "module {} {}", verb, name);
    auto script = neo::ufmt("env -0; printf '\\0{}\\0'; module {} {} >/dev/null 2>&1; env -0",
                            diff_marker,
                            verb,
                            quote_argument(name));
    auto res    = run_proc({"bash", "-c", script});
    if (!res.okay()) {
        hatch_log(warn, "Failed to run 'module {} {}':\n{}", verb, name, res.output);
        return;
    }
    std::string_view out    = res.output;
    auto             marker = std::string(1, '\0') + std::string(diff_marker) + '\0';
    auto             marker_pos = out.find(marker);
    if (marker_pos == out.npos) {
        hatch_log(warn, "Unexpected output from 'module {} {}'", verb, name);
        return;
    }
    auto before = parse_env_dump(out.substr(0, marker_pos));
    auto after  = parse_env_dump(out.substr(marker_pos + marker.size()));
    apply_environment_diff(before, after);
}

std::string shell_module_system::show(std::string_view name) {
    auto res = run_proc({"bash", "-c", neo::ufmt("module show {} 2>&1", quote_argument(name))});
    return res.output;
}

std::optional<fs::path> hatch::path_from_module_contents(std::string_view text,
                                                         std::string_view module_name) {
    auto lines = split(text, "\n");

    std::string pkg_var_prefix = replace(module_name, "-", "_");
    std::transform(pkg_var_prefix.begin(),
                   pkg_var_prefix.end(),
                   pkg_var_prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    // "foo/1.0" names the package "FOO"
    auto components = split(pkg_var_prefix, "/");
    if (components.size() > 1) {
        pkg_var_prefix = components[components.size() - 2];
    }

    for (auto& line : lines) {
        if (mentions_variable(line, "LD_LIBRARY_PATH")
            || mentions_variable(line, "CRAY_LD_LIBRARY_PATH")) {
            return cut_at(path_arg_of_line(line), "/lib");
        }
    }
    for (auto suffix : {"_DIR", "_ROOT"}) {
        auto var = pkg_var_prefix + suffix;
        for (auto& line : lines) {
            if (mentions_variable(line, var)) {
                return path_arg_of_line(line);
            }
        }
    }
    for (auto& line : lines) {
        if (mentions_variable(line, "PATH")) {
            return cut_at(path_arg_of_line(line), "/bin");
        }
    }
    return std::nullopt;
}

std::optional<fs::path> module_system::path_from_modules(const std::vector<std::string>& names) {
    std::optional<fs::path> best_choice;
    for (auto& name : names) {
        auto candidate = path_from_module_contents(show(name), name);
        if (!candidate) {
            continue;
        }
        std::error_code ec;
        if (!fs::exists(*candidate, ec)) {
            hatch_log(warn,
                      "Extracted path from module does not exist [module={}, path={}]",
                      name,
                      candidate->string());
        }
        best_choice = candidate;
    }
    return best_choice;
}
