#pragma once

#include <hatch/util/fs/path.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hatch {

class toolchain;

/**
 * @brief Mutable description of a toolchain, filled in piecemeal before being realized into an
 * immutable toolchain.
 */
struct toolchain_prep {
    std::string name;
    std::string version;

    std::optional<fs::path> cc;
    std::optional<fs::path> cxx;
    std::optional<fs::path> f77;
    std::optional<fs::path> fc;

    /// Wrapper paths relative to the wrapper directory, keyed by "cc", "cxx", "f77" and "fc"
    std::map<std::string, std::string> link_paths;

    std::string rpath_arg         = "-Wl,-rpath,";
    std::string linker_arg        = "-Wl,";
    std::string enable_new_dtags  = "--enable-new-dtags";
    std::string disable_new_dtags = "--disable-new-dtags";

    std::vector<fs::path>    extra_rpaths;
    std::vector<fs::path>    implicit_rpaths;
    std::vector<std::string> modules;

    std::map<std::string, std::string> env_set;
    std::vector<std::string>           env_unset;
    std::map<std::string, std::string> env_prepend_path;
    std::map<std::string, std::string> env_append_path;

    /// Per-target optimization flags that override the built-in table
    std::map<std::string, std::string> target_flags;

    toolchain realize() const;
};

}  // namespace hatch
