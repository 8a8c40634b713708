#include "./compose.hpp"

#include <hatch/env/system_paths.hpp>
#include <hatch/recipe/recipe.hpp>
#include <hatch/recipe/toolkit.hpp>
#include <hatch/spec/node.hpp>
#include <hatch/util/log.hpp>

#include <neo/assert.hpp>

using namespace hatch;

std::string_view hatch::to_string(env_context ctx) noexcept {
    switch (ctx) {
    case env_context::build:
        return "build";
    case env_context::run:
        return "run";
    case env_context::test:
        return "test";
    }
    neo_assert_always(invariant, false, "Invalid env_context", int(ctx));
}

environment_modifications hatch::modifications_from_dependencies(const spec_node&    root,
                                                                 env_context         context,
                                                                 toolkit_registry&   toolkits,
                                                                 const build_config& config,
                                                                 module_system&      modules) {
    dep_type deptypes = dep_type::none;
    switch (context) {
    case env_context::build:
        deptypes = dep_type::build | dep_type::link | dep_type::test;
        break;
    case env_context::run:
        deptypes = dep_type::link | dep_type::run;
        break;
    case env_context::test:
        deptypes = dep_type::link | dep_type::run | dep_type::test;
        break;
    }

    environment_modifications env;
    auto& root_toolkit = toolkits.bind(root, config, modules);
    for (auto dep : root.traverse({
             .deptypes = deptypes,
             .order    = traversal_order::post,
             .root     = false,
         })) {
        hatch_log(trace, "Composing {} environment of {} from {}", to_string(context), root.name, dep->name);
        const auto& recipe = dep->package();
        toolkits.bind(*dep, config, modules);
        recipe.setup_dependent_package(root_toolkit, *dep, root);

        env.set_origin("dependency " + dep->name);
        if (context == env_context::build) {
            recipe.setup_dependent_build_environment(env, *dep, root);
        } else {
            recipe.setup_dependent_run_environment(env, *dep, root);
        }
    }
    return env;
}

const std::vector<std::pair<std::string_view, std::string_view>>& hatch::prefix_inspections() {
    static const std::vector<std::pair<std::string_view, std::string_view>> inspections = {
        {"bin", "PATH"},
        {"man", "MANPATH"},
        {"share/man", "MANPATH"},
        {"share/aclocal", "ACLOCAL_PATH"},
        {"lib/pkgconfig", "PKG_CONFIG_PATH"},
        {"lib64/pkgconfig", "PKG_CONFIG_PATH"},
        {"share/pkgconfig", "PKG_CONFIG_PATH"},
        {"", "CMAKE_PREFIX_PATH"},
    };
    return inspections;
}

environment_modifications hatch::inspect_prefix(path_ref prefix) {
    environment_modifications env;
    if (is_system_path(prefix)) {
        return env;
    }
    env.set_origin("prefix " + prefix.string());
    for (auto& [subdir, var] : prefix_inspections()) {
        auto dir = subdir.empty() ? prefix : prefix / subdir;
        if (is_directory_nothrow(dir)) {
            env.prepend_path(var, normalize_path(dir).string());
        }
    }
    return env;
}

environment_modifications hatch::run_environment(const spec_node&    node,
                                                 env_context         context,
                                                 toolkit_registry&   toolkits,
                                                 const build_config& config,
                                                 module_system&      modules) {
    auto env = inspect_prefix(node.prefix);
    env.extend(modifications_from_dependencies(node, context, toolkits, config, modules));
    toolkits.bind(node, config, modules);
    env.set_origin(node.name);
    node.package().setup_run_environment(env, node);
    return env;
}
