#pragma once

#include "./compiler.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

struct toolchain_prep;

/**
 * @brief A data-driven compiler_adapter. Every capability is a value supplied by a toolchain_prep.
 */
class toolchain final : public compiler_adapter {
    using string_seq = std::vector<std::string>;
    using path_seq   = std::vector<fs::path>;

    std::string _name;
    std::string _version;

    std::optional<fs::path> _cc;
    std::optional<fs::path> _cxx;
    std::optional<fs::path> _f77;
    std::optional<fs::path> _fc;

    std::map<std::string, std::string> _link_paths;

    std::string _rpath_arg;
    std::string _linker_arg;
    std::string _enable_new_dtags;
    std::string _disable_new_dtags;

    path_seq   _extra_rpaths;
    path_seq   _implicit_rpaths;
    string_seq _modules;

    environment_modifications _env;

    std::map<std::string, std::string> _target_flags;

public:
    toolchain() = default;

    static toolchain realize(const toolchain_prep&);

    /**
     * @brief Create a toolchain for a well-known compiler family found on PATH.
     *
     * The identifier is "gcc" or "clang", optionally with a version suffix ("gcc-10") naming the
     * versioned executables.
     */
    static toolchain get_builtin(std::string_view id);

    /**
     * @brief Load a toolchain from a YAML file
     */
    static toolchain from_file(path_ref);

    std::string name() const override { return _name; }
    std::string spec_string() const override;

    std::optional<fs::path> executable(language) const override;
    std::string             link_path(language) const override;

    std::string rpath_arg(language) const override { return _rpath_arg; }
    std::string linker_arg() const override { return _linker_arg; }
    std::string enable_new_dtags() const override { return _enable_new_dtags; }
    std::string disable_new_dtags() const override { return _disable_new_dtags; }

    path_seq   extra_rpaths() const override { return _extra_rpaths; }
    path_seq   implicit_rpaths() const override { return _implicit_rpaths; }
    string_seq modules() const override { return _modules; }

    environment_modifications environment() const override { return _env; }

    std::string target_args(const arch_spec&) const override;

    void verify_executables() const override;
};

}  // namespace hatch
