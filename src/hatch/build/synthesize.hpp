#pragma once

#include <hatch/env/modifications.hpp>
#include <hatch/util/fs/path.hpp>

#include <vector>

namespace hatch {

class spec_node;
class build_toolkit;
struct build_config;

/**
 * @brief Directories handed to the compiler wrappers.
 */
struct dependency_dirs {
    std::vector<fs::path> link_dirs;
    std::vector<fs::path> include_dirs;
    std::vector<fs::path> rpath_dirs;
};

/**
 * @brief Compute the link, include and RPATH directories of a node.
 *
 * Link and RPATH directories come from the dependencies reachable through link edges (RPATHs only
 * for the dependencies chosen by get_rpath_deps()). Include directories come from those and from
 * the direct build dependencies. Dependencies installed in system prefixes are skipped. The RPATHs
 * always start with the node's own lib and lib64 directories, whether or not they exist yet.
 */
dependency_dirs compute_dependency_dirs(const spec_node& node);

/**
 * @brief Record the compiler variables of the node in the ledger: wrapper and real compiler
 * paths, RPATH arguments, dtag policy, target flags and the per-category compiler flags.
 *
 * Throws a setup_error before recording anything if any compiler executable is missing.
 */
void set_compiler_environment_variables(const spec_node&           node,
                                        const build_config&        config,
                                        build_toolkit&             toolkit,
                                        environment_modifications& env);

/**
 * @brief Record the dependency-derived variables of the node in the ledger: wrapper directories,
 * CMAKE_PREFIX_PATH, PATH, PKG_CONFIG_PATH and debugging variables.
 *
 * Throws a setup_error if ccache is requested but cannot be found.
 */
void set_build_environment_variables(const spec_node&           node,
                                     const build_config&        config,
                                     environment_modifications& env);

}  // namespace hatch
