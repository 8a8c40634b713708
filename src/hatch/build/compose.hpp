#pragma once

#include <hatch/env/modifications.hpp>
#include <hatch/util/fs/path.hpp>

#include <string_view>
#include <utility>
#include <vector>

namespace hatch {

class spec_node;
class toolkit_registry;
class module_system;
struct build_config;

/**
 * @brief The purpose an environment is composed for. It selects which dependency edges are
 * followed and which recipe hook contributes.
 */
enum class env_context {
    /// build, link and test edges; setup_dependent_build_environment
    build,
    /// link and run edges; setup_dependent_run_environment
    run,
    /// link, run and test edges; setup_dependent_run_environment
    test,
};

std::string_view to_string(env_context) noexcept;

/**
 * @brief The environment contributions of every dependency of @p root, for the given context.
 *
 * Dependencies are visited in post-order, so a dependent's contribution is recorded after the
 * contributions of its own dependencies and can override them. Each dependency gets its build
 * toolkit bound and may customize the toolkit of @p root before contributing.
 */
environment_modifications modifications_from_dependencies(const spec_node&    root,
                                                          env_context         context,
                                                          toolkit_registry&   toolkits,
                                                          const build_config& config,
                                                          module_system&      modules);

/**
 * @brief Conventional subdirectories of a prefix and the variables they are added to.
 */
const std::vector<std::pair<std::string_view, std::string_view>>& prefix_inspections();

/**
 * @brief Prepend the existing conventional subdirectories of @p prefix to their variables.
 * System prefixes are ignored.
 */
environment_modifications inspect_prefix(path_ref prefix);

/**
 * @brief The environment in which the installed node is used: its prefix layout, the run
 * contributions of its dependencies, and its own run environment.
 */
environment_modifications run_environment(const spec_node&    node,
                                          env_context         context,
                                          toolkit_registry&   toolkits,
                                          const build_config& config,
                                          module_system&      modules);

}  // namespace hatch
