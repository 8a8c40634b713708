#pragma once

#include <hatch/util/fs/path.hpp>

#include <vector>

namespace hatch {

class spec_node;
class module_system;

/**
 * @brief The dependencies whose libraries are RPATHed into the node's binaries: every
 * dependency reachable through link edges if the recipe asks for transitive RPATHs, otherwise
 * only the direct link dependencies.
 */
std::vector<const spec_node*> get_rpath_deps(const spec_node& node);

/**
 * @brief Every RPATH of the node: its own lib and lib64 directories, the existing lib and lib64
 * directories of its RPATH dependencies, and the prefix derived from the compiler's second
 * module, if the compiler has one. System directories are removed and repeats dropped.
 */
std::vector<fs::path> get_rpaths(const spec_node& node, module_system& modules);

}  // namespace hatch
