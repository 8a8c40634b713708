#include "./proc.hpp"

#include <hatch/util/env.hpp>
#include <hatch/util/string.hpp>

#include <unistd.h>

#include <algorithm>
#include <cctype>

using namespace hatch;

bool hatch::needs_quoting(std::string_view s) {
    std::string_view okay_chars = "@%-+=:,./|_";
    const bool       all_okay   = std::all_of(s.begin(), s.end(), [&](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || (okay_chars.find(c) != okay_chars.npos);
    });
    return !all_okay;
}

std::string hatch::quote_argument(std::string_view s) {
    if (!needs_quoting(s)) {
        return std::string(s);
    }
    auto new_s = replace(s, "\\", "\\\\");
    new_s      = replace(new_s, "\"", "\\\"");
    return "\"" + new_s + "\"";
}

std::optional<std::filesystem::path> hatch::find_program(std::string_view name) {
    namespace fs = std::filesystem;
    auto is_exec = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };
    if (contains(name, "/")) {
        fs::path p{name};
        if (is_exec(p)) {
            return p;
        }
        return std::nullopt;
    }
    for (auto& dir : split_path_list(hatch::getenv("PATH").value_or(""))) {
        auto cand = fs::path(dir) / name;
        if (is_exec(cand)) {
            return cand;
        }
    }
    return std::nullopt;
}
