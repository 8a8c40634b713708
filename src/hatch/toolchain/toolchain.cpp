#include "./toolchain.hpp"

#include "./errors.hpp"
#include "./from_yaml.hpp"
#include "./prep.hpp"

#include <hatch/error/errors.hpp>
#include <hatch/error/on_error.hpp>
#include <hatch/util/log.hpp>
#include <hatch/util/proc.hpp>
#include <hatch/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <unistd.h>

using namespace hatch;

using std::optional;
using std::string;

std::string_view hatch::language_key(language lang) noexcept {
    switch (lang) {
    case language::c:
        return "cc";
    case language::cxx:
        return "cxx";
    case language::f77:
        return "f77";
    case language::fc:
        return "fc";
    }
    neo_assert_always(invariant, false, "Invalid language enumerator", int(lang));
}

toolchain toolchain_prep::realize() const { return toolchain::realize(*this); }

toolchain toolchain::realize(const toolchain_prep& prep) {
    toolchain ret;
    ret._name              = prep.name;
    ret._version           = prep.version;
    ret._cc                = prep.cc;
    ret._cxx               = prep.cxx;
    ret._f77               = prep.f77;
    ret._fc                = prep.fc;
    ret._link_paths        = prep.link_paths;
    ret._rpath_arg         = prep.rpath_arg;
    ret._linker_arg        = prep.linker_arg;
    ret._enable_new_dtags  = prep.enable_new_dtags;
    ret._disable_new_dtags = prep.disable_new_dtags;
    ret._extra_rpaths      = prep.extra_rpaths;
    ret._implicit_rpaths   = prep.implicit_rpaths;
    ret._modules           = prep.modules;
    ret._target_flags      = prep.target_flags;

    ret._env.set_origin("toolchain " + ret.spec_string());
    for (auto& [name, value] : prep.env_set) {
        ret._env.set(name, value);
    }
    for (auto& name : prep.env_unset) {
        ret._env.unset(name);
    }
    for (auto& [name, value] : prep.env_prepend_path) {
        ret._env.prepend_path(name, value);
    }
    for (auto& [name, value] : prep.env_append_path) {
        ret._env.append_path(name, value);
    }
    return ret;
}

std::string toolchain::spec_string() const {
    if (_version.empty()) {
        return _name;
    }
    return _name + "@" + _version;
}

optional<fs::path> toolchain::executable(language lang) const {
    switch (lang) {
    case language::c:
        return _cc;
    case language::cxx:
        return _cxx;
    case language::f77:
        return _f77;
    case language::fc:
        return _fc;
    }
    neo_assert_always(invariant, false, "Invalid language enumerator", int(lang));
}

std::string toolchain::link_path(language lang) const {
    auto key   = string(language_key(lang));
    auto found = _link_paths.find(key);
    if (found != _link_paths.end()) {
        return found->second;
    }
    // Wrappers are named after the language, inside a directory named after the compiler
    return _name + "/" + key;
}

namespace {

struct target_flag_entry {
    std::string_view target;
    std::string_view gnu;
    std::string_view clang;
};

// Optimization flags for well-known microarchitectures, per compiler family
constexpr target_flag_entry builtin_target_flags[] = {
    {"x86_64", "-march=x86-64 -mtune=generic", "-march=x86-64 -mtune=generic"},
    {"nehalem", "-march=nehalem -mtune=nehalem", "-march=nehalem -mtune=nehalem"},
    {"sandybridge", "-march=sandybridge -mtune=sandybridge", "-march=sandybridge -mtune=sandybridge"},
    {"haswell", "-march=haswell -mtune=haswell", "-march=haswell -mtune=haswell"},
    {"broadwell", "-march=broadwell -mtune=broadwell", "-march=broadwell -mtune=broadwell"},
    {"skylake", "-march=skylake -mtune=skylake", "-march=skylake -mtune=skylake"},
    {"skylake_avx512",
     "-march=skylake-avx512 -mtune=skylake-avx512",
     "-march=skylake-avx512 -mtune=skylake-avx512"},
    {"zen", "-march=znver1 -mtune=znver1", "-march=znver1 -mtune=znver1"},
    {"zen2", "-march=znver2 -mtune=znver2", "-march=znver2 -mtune=znver2"},
    {"aarch64", "-march=armv8-a -mtune=generic", "-march=armv8-a -mtune=generic"},
    {"power8le", "-mcpu=power8 -mtune=power8", "-mcpu=power8 -mtune=power8"},
    {"power9le", "-mcpu=power9 -mtune=power9", "-mcpu=power9 -mtune=power9"},
};

}  // namespace

std::string toolchain::target_args(const arch_spec& arch) const {
    auto custom = _target_flags.find(arch.target);
    if (custom != _target_flags.end()) {
        return custom->second;
    }
    const bool is_clang = _name == "clang" || _name == "apple-clang";
    const bool is_gnu   = _name == "gcc";
    if (!is_clang && !is_gnu) {
        return "";
    }
    for (auto& entry : builtin_target_flags) {
        if (entry.target == arch.target) {
            return string(is_clang ? entry.clang : entry.gnu);
        }
    }
    hatch_log(debug,
              "No optimization flags are known for target '{}' with compiler {}",
              arch.target,
              spec_string());
    return "";
}

void toolchain::verify_executables() const {
    std::vector<string> missing;
    for (auto lang : all_languages) {
        auto exe = executable(lang);
        if (!exe) {
            continue;
        }
        std::error_code ec;
        if (!fs::is_regular_file(*exe, ec) || ::access(exe->c_str(), X_OK) != 0) {
            missing.push_back(exe->string());
        }
    }
    if (missing.empty()) {
        return;
    }
    BOOST_LEAF_THROW_EXCEPTION(
        setup_error(neo::ufmt("Compiler '{}' has executables that are missing or are not "
                              "executable: {}",
                              spec_string(),
                              joinstr(", ", missing))),
        e_missing_executable{missing.front()});
}

toolchain toolchain::get_builtin(std::string_view tc_id) {
    HATCH_E_SCOPE(e_builtin_toolchain_str{string(tc_id)});
    toolchain_prep prep;

    string suffix;
    auto   family = tc_id;
    if (auto dash = tc_id.find('-'); dash != tc_id.npos) {
        family = tc_id.substr(0, dash);
        suffix = string(tc_id.substr(dash));
    }

    string c_name;
    string cxx_name;
    string fortran_name;
    if (family == "gcc") {
        c_name       = "gcc";
        cxx_name     = "g++";
        fortran_name = "gfortran";
    } else if (family == "clang") {
        c_name   = "clang";
        cxx_name = "clang++";
    } else {
        BOOST_LEAF_THROW_EXCEPTION(
            std::runtime_error(neo::ufmt("Invalid built-in toolchain name '{}'", tc_id)),
            e_human_message{neo::ufmt("Unknown built-in toolchain '{}'", tc_id)});
    }

    prep.name = string(family);
    if (suffix.size() > 1) {
        prep.version = suffix.substr(1);
    }

    // Executables that cannot be found are kept by name, so that verification reports them
    auto locate = [&](const string& exe) {
        auto name = exe + suffix;
        return find_program(name).value_or(fs::path(name));
    };
    prep.cc  = locate(c_name);
    prep.cxx = locate(cxx_name);
    if (!fortran_name.empty()) {
        prep.f77 = locate(fortran_name);
        prep.fc  = locate(fortran_name);
    }
    for (auto lang : all_languages) {
        auto key             = string(language_key(lang));
        prep.link_paths[key] = prep.name + "/" + key;
    }
    return prep.realize();
}

toolchain toolchain::from_file(path_ref fpath) {
    HATCH_E_SCOPE(e_toolchain_path{fpath});
    return parse_toolchain_yaml_file(fpath);
}
