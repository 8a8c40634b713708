#pragma once

#include "./compose.hpp"
#include "./config.hpp"

#include <hatch/env/modifications.hpp>
#include <hatch/recipe/recipe.hpp>
#include <hatch/recipe/toolkit.hpp>

namespace hatch {

class spec_node;
class module_system;

/**
 * @brief Everything needed to prepare and run the build of one root node: the DAG, the site
 * configuration, the module system, and the build toolkits bound for the recipes of the DAG.
 *
 * Toolkits are bound lazily and live as long as the session.
 */
class build_session {
    const spec_node& _root;
    build_config     _config;
    module_system&   _modules;
    capability_table _table;
    toolkit_registry _toolkits{_table};

public:
    build_session(const spec_node& root, build_config config, module_system& modules);

    build_session(const build_session&) = delete;
    build_session& operator=(const build_session&) = delete;

    const spec_node&    root() const noexcept { return _root; }
    const build_config& config() const noexcept { return _config; }
    module_system&      modules() const noexcept { return _modules; }
    toolkit_registry&   toolkits() noexcept { return _toolkits; }

    /// The toolkit bound for the root node's recipe
    build_toolkit& toolkit();
};

struct setup_options {
    /// Keep the caller's environment instead of sanitizing it first
    bool        dirty   = false;
    env_context context = env_context::build;
};

/**
 * @brief Prepare the live process environment for building or testing the root node of the
 * session.
 *
 * This mutates the process environment and is meant to run inside an isolated child process.
 * Returns the ledger of the modifications that were applied after sanitization and module loads.
 */
environment_modifications setup_package(build_session&, setup_options);

}  // namespace hatch
