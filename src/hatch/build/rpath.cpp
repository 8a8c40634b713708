#include "./rpath.hpp"

#include "./modules.hpp"

#include <hatch/env/system_paths.hpp>
#include <hatch/recipe/recipe.hpp>
#include <hatch/spec/node.hpp>
#include <hatch/toolchain/compiler.hpp>

using namespace hatch;

std::vector<const spec_node*> hatch::get_rpath_deps(const spec_node& node) {
    if (node.package().transitive_rpaths()) {
        return node.traverse({.deptypes = dep_type::link, .root = false});
    }
    return node.dependencies(dep_type::link);
}

std::vector<fs::path> hatch::get_rpaths(const spec_node& node, module_system& modules) {
    std::vector<fs::path> rpaths = {node.prefix / "lib", node.prefix / "lib64"};
    auto                  deps   = get_rpath_deps(node);
    for (auto subdir : {"lib", "lib64"}) {
        for (auto dep : deps) {
            auto dir = dep->prefix / subdir;
            if (is_directory_nothrow(dir)) {
                rpaths.push_back(dir);
            }
        }
    }
    // The second module of a compiler is the one that carries its runtime libraries
    auto compiler_modules = node.toolchain().modules();
    if (compiler_modules.size() > 1) {
        if (auto path = modules.path_from_modules({compiler_modules[1]})) {
            rpaths.push_back(*path);
        }
    }
    return filter_and_dedupe(std::move(rpaths));
}
