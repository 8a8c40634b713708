#include "./synthesize.hpp"

#include "./config.hpp"
#include "./rpath.hpp"

#include <hatch/env/system_paths.hpp>
#include <hatch/error/errors.hpp>
#include <hatch/error/try_catch.hpp>
#include <hatch/recipe/errors.hpp>
#include <hatch/recipe/recipe.hpp>
#include <hatch/spec/node.hpp>
#include <hatch/toolchain/compiler.hpp>
#include <hatch/util/algo.hpp>
#include <hatch/util/log.hpp>
#include <hatch/util/proc.hpp>
#include <hatch/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cctype>

using namespace hatch;

namespace {

std::string upper(std::string_view s) {
    std::string ret{s};
    std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return ret;
}

std::vector<std::string> path_strings(const std::vector<fs::path>& paths) {
    return paths | ranges::views::transform([](auto& p) { return p.string(); })
        | ranges::to_vector;
}

std::string join_paths(const std::vector<fs::path>& paths) {
    return joinstr(":", path_strings(paths));
}

std::vector<fs::path> query_lib_dirs(const spec_node& dep) {
    return hatch_leaf_try { return file_directories(dep.package().libs(dep)); }
    hatch_leaf_catch(e_no_libraries) {
        hatch_log(debug, "No libraries found for {}", dep.name);
        return std::vector<fs::path>{};
    };
}

std::vector<fs::path> query_include_dirs(const spec_node& dep) {
    return hatch_leaf_try { return header_directories(dep.package().headers(dep)); }
    hatch_leaf_catch(e_no_headers) {
        hatch_log(debug, "No headers found for {}", dep.name);
        return std::vector<fs::path>{};
    };
}

/// Direct build and test dependencies
std::vector<const spec_node*> build_deps_of(const spec_node& node) {
    return node.dependencies(dep_type::build | dep_type::test);
}

/// Every dependency reachable through link edges
std::vector<const spec_node*> link_deps_of(const spec_node& node) {
    return node.traverse({.deptypes = dep_type::link, .root = false});
}

bool contains_node(const std::vector<const spec_node*>& nodes, const spec_node* n) {
    return std::find(nodes.begin(), nodes.end(), n) != nodes.end();
}

}  // namespace

dependency_dirs hatch::compute_dependency_dirs(const spec_node& node) {
    dependency_dirs dirs;

    // The node is not installed yet, so its own RPATHs cannot be checked for existence
    dirs.rpath_dirs = {node.prefix / "lib", node.prefix / "lib64"};

    auto link_deps  = link_deps_of(node);
    auto rpath_deps = get_rpath_deps(node);

    for (auto dep : link_deps) {
        if (is_system_path(dep->prefix)) {
            continue;
        }
        auto dep_link_dirs = query_lib_dirs(*dep);
        for (auto subdir : {"lib", "lib64"}) {
            auto dir = dep->prefix / subdir;
            if (is_directory_nothrow(dir)) {
                dep_link_dirs.push_back(dir);
            }
        }
        extend(dirs.link_dirs, dep_link_dirs);
        if (contains_node(rpath_deps, dep)) {
            extend(dirs.rpath_dirs, dep_link_dirs);
        }
        extend(dirs.include_dirs, query_include_dirs(*dep));
    }

    // Headers of build-only tools (code generators, header-only libraries) are also visible
    for (auto dep : build_deps_of(node)) {
        if (contains_node(link_deps, dep) || is_system_path(dep->prefix)) {
            continue;
        }
        extend(dirs.include_dirs, query_include_dirs(*dep));
    }

    dirs.link_dirs    = filter_and_dedupe(std::move(dirs.link_dirs));
    dirs.include_dirs = filter_and_dedupe(std::move(dirs.include_dirs));
    dirs.rpath_dirs   = filter_and_dedupe(std::move(dirs.rpath_dirs));
    return dirs;
}

void hatch::set_compiler_environment_variables(const spec_node&           node,
                                               const build_config&        config,
                                               build_toolkit&             toolkit,
                                               environment_modifications& env) {
    const auto& compiler = node.toolchain();
    const auto& recipe   = node.package();

    compiler.verify_executables();

    env.set_origin("compiler " + compiler.spec_string());
    for (auto lang : all_languages) {
        auto exe = compiler.executable(lang);
        if (!exe) {
            continue;
        }
        auto var = upper(language_key(lang));
        env.set("HATCH_" + var, exe->string());
        env.set(var, (config.build_env_path / compiler.link_path(lang)).string());
    }

    for (auto lang : all_languages) {
        env.set(neo::ufmt("HATCH_{}_RPATH_ARG", upper(language_key(lang))),
                compiler.rpath_arg(lang));
    }
    env.set("HATCH_LINKER_ARG", compiler.linker_arg());

    if (config.shared_linking == linking_policy::rpath) {
        env.set("HATCH_DTAGS_TO_STRIP", compiler.enable_new_dtags());
        env.set("HATCH_DTAGS_TO_ADD", compiler.disable_new_dtags());
    } else {
        env.set("HATCH_DTAGS_TO_STRIP", compiler.disable_new_dtags());
        env.set("HATCH_DTAGS_TO_ADD", compiler.enable_new_dtags());
    }

    env.set("HATCH_TARGET_ARGS", compiler.target_args(node.arch));

    flag_map build_system_flags;
    for (auto category : all_flag_categories) {
        std::vector<std::string> given;
        if (auto found = node.compiler_flags.find(category); found != node.compiler_flags.end()) {
            given = found->second;
        }
        auto routed = recipe.flag_handler(category, std::move(given));
        auto var    = env_var_name(category);
        if (!routed.inject.empty()) {
            env.set("HATCH_" + var, joinstr(" ", routed.inject));
        }
        if (!routed.env.empty()) {
            env.set(var, joinstr(" ", routed.env));
        }
        build_system_flags[category] = std::move(routed.build_system);
    }
    recipe.flags_to_build_system_args(build_system_flags, toolkit);

    env.set("HATCH_COMPILER_SPEC",
            node.compiler_spec.empty() ? compiler.spec_string() : node.compiler_spec);
    env.set("HATCH_SYSTEM_DIRS", joinstr(":", system_dirs()));

    compiler.setup_custom_environment(node, env);
}

void hatch::set_build_environment_variables(const spec_node&           node,
                                            const build_config&        config,
                                            environment_modifications& env) {
    env.set_origin("build environment of " + node.name);

    auto dirs = compute_dependency_dirs(node);
    env.set("HATCH_LINK_DIRS", join_paths(dirs.link_dirs));
    env.set("HATCH_INCLUDE_DIRS", join_paths(dirs.include_dirs));
    env.set("HATCH_RPATH_DIRS", join_paths(dirs.rpath_dirs));

    auto build_deps = build_deps_of(node);
    auto link_deps  = link_deps_of(node);

    std::vector<fs::path> build_prefixes;
    std::vector<fs::path> build_link_prefixes;
    for (auto dep : build_deps) {
        build_prefixes.push_back(dep->prefix);
        build_link_prefixes.push_back(dep->prefix);
    }
    for (auto dep : link_deps) {
        build_link_prefixes.push_back(dep->prefix);
    }
    // Tools used at build time need their own run-time dependencies
    for (auto dep : build_deps) {
        for (auto run_dep : dep->traverse({.deptypes = dep_type::run})) {
            build_prefixes.push_back(run_dep->prefix);
        }
    }

    // System prefixes hold many unrelated packages that would shadow the dependencies
    build_prefixes      = filter_and_dedupe(std::move(build_prefixes));
    build_link_prefixes = filter_and_dedupe(std::move(build_link_prefixes));

    env.set_path("CMAKE_PREFIX_PATH", path_strings(build_link_prefixes));

    const auto& compiler = node.toolchain();
    env.extend(compiler.environment());

    if (auto extra = compiler.extra_rpaths(); !extra.empty()) {
        env.set("HATCH_COMPILER_EXTRA_RPATHS", join_paths(extra));
    }

    for (auto& prefix : build_prefixes) {
        for (auto subdir : {"bin", "bin64"}) {
            auto bin_dir = prefix / subdir;
            if (is_directory_nothrow(bin_dir)) {
                env.prepend_path("PATH", bin_dir.string());
            }
        }
    }

    // The wrapper directories go in front of everything else, the compiler-specific one first,
    // so that builds sensitive to the name of the compiler see the right name
    std::vector<fs::path> env_paths;
    for (auto item : {config.build_env_path, config.build_env_path / compiler.name()}) {
        env_paths.push_back(item);
        auto ci = item / "case-insensitive";
        if (is_directory_nothrow(ci)) {
            env_paths.push_back(ci);
        }
    }
    for (auto& item : env_paths) {
        env.prepend_path("PATH", item.string());
    }
    env.set_path("HATCH_ENV_PATH", path_strings(env_paths));

    if (config.debug) {
        env.set("HATCH_DEBUG", "TRUE");
    }
    env.set("HATCH_SHORT_SPEC", node.short_spec());
    env.set("HATCH_DEBUG_LOG_ID", node.log_id());
    env.set("HATCH_DEBUG_LOG_DIR", config.working_dir.string());

    if (config.ccache) {
        auto ccache = find_program("ccache");
        if (!ccache) {
            BOOST_LEAF_THROW_EXCEPTION(setup_error("No ccache binary found in PATH"),
                                       e_missing_executable{"ccache"});
        }
        env.set("HATCH_CCACHE_BINARY", ccache->string());
    }

    for (auto& prefix : build_link_prefixes) {
        for (auto subdir : {"lib", "lib64", "share"}) {
            auto pc_dir = prefix / subdir / "pkgconfig";
            if (is_directory_nothrow(pc_dir)) {
                env.prepend_path("PKG_CONFIG_PATH", pc_dir.string());
            }
        }
    }
}
