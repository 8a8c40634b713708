#include "./setup.hpp"

#include "./modules.hpp"
#include "./platform.hpp"
#include "./sanitize.hpp"
#include "./synthesize.hpp"

#include <hatch/env/preserve.hpp>
#include <hatch/spec/node.hpp>
#include <hatch/toolchain/compiler.hpp>
#include <hatch/util/env.hpp>
#include <hatch/util/log.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

using namespace hatch;

build_session::build_session(const spec_node& root, build_config config, module_system& modules)
    : _root(root)
    , _config(std::move(config))
    , _modules(modules) {
    _table.register_dag(root);
}

build_toolkit& build_session::toolkit() { return _toolkits.bind(_root, _config, _modules); }

namespace {

void load_modules(const spec_node& root, bool need_compiler, module_system& modules) {
    // Compiler wrappers on Cray read these, and module loads must not change them
    preserve_environment keep{"CC", "CXX", "FC", "F77"};

    if (need_compiler) {
        if (hatch::getenv("CRAY_CPU_TARGET") == "mic-knl") {
            // The KNL target module only loads after the Cray compiler module
            modules.load("cce");
        }
        for (auto& mod : root.toolchain().modules()) {
            modules.load(mod);
        }
    }

    if (root.arch.is_cray()) {
        modules.unload("cray-libsci");
    }

    if (root.arch.target_module) {
        modules.load(*root.arch.target_module);
    }

    for (auto node : root.traverse()) {
        for (auto& mod : node->external_modules) {
            modules.load(mod);
        }
    }
}

}  // namespace

environment_modifications hatch::setup_package(build_session& session, setup_options opts) {
    const auto& root   = session.root();
    const auto& config = session.config();
    const auto& recipe = root.package();

    hatch_log(debug,
              "Setting up the {} environment of {}{}",
              to_string(opts.context),
              root.short_spec(),
              opts.dirty ? " (dirty)" : "");

    auto& toolkit = session.toolkit();

    if (!opts.dirty) {
        clean_environment(arch_spec::host(), config);
    }

    const bool need_compiler
        = opts.context == env_context::build
        || (opts.context == env_context::test && recipe.test_requires_compiler());

    environment_modifications env;
    if (need_compiler) {
        set_compiler_environment_variables(root, config, toolkit, env);
        set_build_environment_variables(root, config, env);
    }

    setup_platform_environment(root, config, env);

    if (opts.context == env_context::build) {
        env.extend(modifications_from_dependencies(root,
                                                   env_context::build,
                                                   session.toolkits(),
                                                   config,
                                                   session.modules()));
        if (!opts.dirty && env.group_by_name().contains("CPATH") && !env.is_unset("CPATH")) {
            hatch_log(debug,
                      "A dependency has modified CPATH, which might prevent build isolation. "
                      "Consider using a dirty build if this causes problems.");
        }
        env.set_origin(root.name);
        recipe.setup_build_environment(env, root);
    } else if (opts.context == env_context::test) {
        env.extend(run_environment(root,
                                   env_context::test,
                                   session.toolkits(),
                                   config,
                                   session.modules()));
        env.prepend_path("PATH", ".");
    }

    load_modules(root, need_compiler, session.modules());

    auto implicit = root.toolchain().implicit_rpaths();
    if (!implicit.empty()) {
        env.set_origin("compiler " + root.toolchain().spec_string());
        env.set_path("HATCH_COMPILER_IMPLICIT_RPATHS",
                     implicit | ranges::views::transform([](auto& p) { return p.string(); })
                         | ranges::to_vector);
    }

    validate(env, [](std::string_view warning) { hatch_log(warn, "{}", warning); });
    env.apply();
    return env;
}
