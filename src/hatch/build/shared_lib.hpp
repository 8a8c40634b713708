#pragma once

#include <hatch/util/fs/path.hpp>
#include <hatch/util/proc.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hatch {

class executable;

struct shared_library_options {
    /// The output library. Defaults to the static library's path with the platform's DSO suffix.
    std::optional<fs::path> shared_lib = std::nullopt;
    /// Extra arguments for the compiler
    std::vector<std::string> arguments = {};
    std::optional<std::string> version = std::nullopt;
    /// Defaults to the version
    std::optional<std::string> compat_version = std::nullopt;
};

/**
 * @brief The compiler invocation and symlinks that turn a static library into a shared one.
 */
struct shared_library_plan {
    std::vector<std::string> args;
    fs::path                 output;
    /// (link, target) pairs. Targets are relative to the link's directory.
    std::vector<std::pair<fs::path, fs::path>> symlinks;
};

/**
 * @brief The shared library suffix for an architecture string: "dylib" on Darwin, else "so".
 */
std::string_view dso_suffix(std::string_view arch) noexcept;

/**
 * @brief Compute how to convert the static library for the given architecture string. ELF
 * platforms (linux, cray) link with -shared and a soname; Mach-O platforms (darwin) link with
 * -dynamiclib and an install name.
 */
shared_library_plan plan_static_to_shared(std::string_view              arch,
                                          path_ref                      static_lib,
                                          const shared_library_options& opts);

/**
 * @brief Convert a static library (built as position-independent code) into a shared library.
 *
 * The version symlinks are created first, then the compiler is run. Compiler failures propagate
 * to the caller.
 */
proc_result static_to_shared_library(std::string_view              arch,
                                     const executable&             compiler,
                                     path_ref                      static_lib,
                                     const shared_library_options& opts = {});

}  // namespace hatch
