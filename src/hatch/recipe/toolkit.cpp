#include "./toolkit.hpp"

#include "./recipe.hpp"

#include <hatch/build/config.hpp>
#include <hatch/build/modules.hpp>
#include <hatch/build/rpath.hpp>
#include <hatch/env/system_paths.hpp>
#include <hatch/error/errors.hpp>
#include <hatch/spec/node.hpp>
#include <hatch/toolchain/compiler.hpp>
#include <hatch/util/log.hpp>
#include <hatch/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

using namespace hatch;

namespace {

std::string cmake_bool(std::string_view name, bool value) {
    return neo::ufmt("-D{}:BOOL={}", name, value ? "ON" : "OFF");
}

std::string cmake_string(std::string_view name, std::string_view value) {
    return neo::ufmt("-D{}:STRING={}", name, value);
}

std::string cmake_path_list(std::string_view name, const std::vector<fs::path>& paths) {
    std::vector<std::string> strs;
    for (auto& p : paths) {
        strs.push_back(p.string());
    }
    return cmake_string(name, joinstr(";", strs));
}

}  // namespace

const executable& build_toolkit::get_executable(std::string_view name) const {
    auto found = executables.find(name);
    if (found == executables.end()) {
        BOOST_LEAF_THROW_EXCEPTION(
            setup_error(neo::ufmt("No executable '{}' was provided to this build", name)),
            e_missing_executable{std::string(name)});
    }
    return found->second;
}

void build_toolkit::attach_log(path_ref log_path) {
    for (auto exe : {&make, &gmake, &scons, &ninja, &ctest}) {
        exe->attach_log(log_path);
    }
    for (auto exe : {&configure, &cmake, &meson}) {
        exe->attach_log(log_path);
    }
    for (auto& [_, exe] : executables) {
        exe.attach_log(log_path);
    }
}

proc_result build_toolkit::static_to_shared_library(path_ref                      static_lib,
                                                    const shared_library_options& opts,
                                                    std::optional<fs::path>       compiler) const {
    executable exe{compiler.value_or(cc).string()};
    if (make.log_path()) {
        exe.attach_log(*make.log_path());
    }
    return hatch::static_to_shared_library(arch, exe, static_lib, opts);
}

std::vector<std::string> hatch::std_cmake_args(const spec_node& node, module_system& modules) {
    std::vector<std::string> args = {
        "-G",
        "Unix Makefiles",
        cmake_string("CMAKE_INSTALL_PREFIX", node.prefix.string()),
        cmake_string("CMAKE_BUILD_TYPE", node.package().cmake_build_type()),
        cmake_bool("CMAKE_VERBOSE_MAKEFILE", true),
    };
    if (node.arch.is_darwin()) {
        args.push_back(cmake_string("CMAKE_FIND_FRAMEWORK", "LAST"));
        args.push_back(cmake_string("CMAKE_FIND_APPBUNDLE", "LAST"));
    }
    args.push_back(cmake_bool("CMAKE_INSTALL_RPATH_USE_LINK_PATH", false));
    args.push_back(cmake_path_list("CMAKE_INSTALL_RPATH", get_rpaths(node, modules)));

    // Direct build and link dependencies are found first by find_package()
    std::vector<fs::path> dep_prefixes;
    for (auto dep : node.dependencies(dep_type::build | dep_type::link)) {
        dep_prefixes.push_back(dep->prefix);
    }
    args.push_back(cmake_path_list("CMAKE_PREFIX_PATH", filter_system_paths(dep_prefixes)));
    return args;
}

std::vector<std::string> hatch::std_meson_args(const spec_node& node) {
    return {
        "--prefix=" + node.prefix.string(),
        "--libdir=" + (node.prefix / "lib").string(),
        "--buildtype=" + node.package().meson_build_type(),
        "--strip=false",
        "--default-library=shared",
    };
}

build_toolkit
hatch::make_build_toolkit(const spec_node& node, const build_config& config, module_system& modules) {
    auto jobs = config.effective_jobs(node.package().parallel());

    build_toolkit tk;
    tk.make_jobs = jobs;
    tk.make      = make_executable("make", jobs);
    tk.gmake     = make_executable("gmake", jobs);
    tk.scons     = make_executable("scons", jobs);
    tk.ninja     = make_executable("ninja", jobs);
    tk.ctest     = make_executable("ctest", jobs);

    // The configure script of the package being built, not one on PATH
    tk.configure = executable("./configure");
    tk.cmake     = executable("cmake");
    tk.meson     = executable("meson");

    tk.std_cmake_args = std_cmake_args(node, modules);
    tk.std_meson_args = std_meson_args(node);

    const auto& compiler = node.toolchain();
    tk.cc                = config.build_env_path / compiler.link_path(language::c);
    tk.cxx               = config.build_env_path / compiler.link_path(language::cxx);
    tk.f77               = config.build_env_path / compiler.link_path(language::f77);
    tk.fc                = config.build_env_path / compiler.link_path(language::fc);

    tk.prefix     = node.prefix;
    tk.arch       = node.arch.to_string();
    tk.dso_suffix = std::string(dso_suffix(tk.arch));
    return tk;
}

build_toolkit&
toolkit_registry::bind(const spec_node& node, const build_config& config, module_system& modules) {
    const auto& recipe = node.package();
    for (auto& scope : _table.scopes_for(recipe.recipe_name())) {
        if (is_bound(scope)) {
            continue;
        }
        hatch_log(trace, "Binding build toolkit for scope '{}' ({})", scope, node.log_id());
        _bound.emplace(scope, make_build_toolkit(node, config, modules));
    }
    auto primary = find(recipe.recipe_name());
    neo_assert(invariant,
               primary != nullptr,
               "A recipe's own capability scope was not bound",
               recipe.recipe_name());
    return *primary;
}

build_toolkit* toolkit_registry::find(std::string_view scope) noexcept {
    auto found = _bound.find(scope);
    if (found == _bound.end()) {
        return nullptr;
    }
    return &found->second;
}
