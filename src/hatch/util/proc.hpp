#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

bool needs_quoting(std::string_view);

std::string quote_argument(std::string_view);

template <typename Container>
std::string quote_command(const Container& c) {
    std::string acc;
    for (const auto& arg : c) {
        acc += quote_argument(arg) + " ";
    }
    if (!acc.empty()) {
        acc.pop_back();
    }
    return acc;
}

struct proc_result {
    int         signal    = 0;
    int         retc      = 0;
    bool        timed_out = false;
    std::string output;

    bool okay() const noexcept { return retc == 0 && signal == 0; }
};

struct proc_options {
    std::vector<std::string> command;

    std::optional<std::filesystem::path> cwd = std::nullopt;

    /**
     * Variables set in the subprocess environment in addition to the inherited environment
     */
    std::map<std::string, std::string> extra_env = {};

    /**
     * Data written to the subprocess's stdin
     */
    std::string stdin_ = {};

    /**
     * Timeout for the subprocess, in milliseconds. If zero, will wait forever
     */
    std::optional<std::chrono::milliseconds> timeout = std::nullopt;
};

proc_result run_proc(const proc_options& opts);

inline proc_result run_proc(std::vector<std::string> args) {
    return run_proc(proc_options{.command = std::move(args)});
}

/**
 * @brief Search the directories of the PATH environment variable for an executable file with the
 * given name. A name containing a slash is checked as-is.
 */
std::optional<std::filesystem::path> find_program(std::string_view name);

}  // namespace hatch
