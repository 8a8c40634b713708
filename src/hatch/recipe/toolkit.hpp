#pragma once

#include "./executable.hpp"

#include <hatch/build/shared_lib.hpp>
#include <hatch/util/fs/path.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

class spec_node;
class capability_table;
class module_system;
struct build_config;

/**
 * @brief The tools and values a recipe uses to build its package.
 *
 * A toolkit is passed explicitly to recipe code. Dependencies may add named values and
 * executables to the toolkit of a package that depends on them.
 */
class build_toolkit {
public:
    /// Parallelism for make-like tools
    int make_jobs = 1;

    make_executable make;
    make_executable gmake;
    make_executable scons;
    make_executable ninja;
    make_executable ctest;

    executable configure;
    executable cmake;
    executable meson;

    std::vector<std::string> std_cmake_args;
    std::vector<std::string> std_meson_args;

    /// Paths of the compiler wrappers
    fs::path cc;
    fs::path cxx;
    fs::path f77;
    fs::path fc;

    fs::path    prefix;
    std::string arch;
    std::string dso_suffix;

    /// Values injected by dependencies
    std::map<std::string, std::string, std::less<>> values;
    /// Executables injected by dependencies
    std::map<std::string, executable, std::less<>> executables;

    /**
     * @brief Look up an injected executable. Throws a setup_error if there is none by that name.
     */
    const executable& get_executable(std::string_view name) const;

    /**
     * @brief Append the output of every tool run through this toolkit to the given log file.
     */
    void attach_log(path_ref log_path);

    /**
     * @brief Convert a static library into a shared library for this package's architecture.
     * Uses the C compiler wrapper unless another compiler is given.
     */
    proc_result static_to_shared_library(path_ref                      static_lib,
                                         const shared_library_options& opts     = {},
                                         std::optional<fs::path>       compiler = std::nullopt) const;
};

/**
 * @brief Standard CMake arguments for the node (install prefix, build type, RPATHs, prefix path).
 */
std::vector<std::string> std_cmake_args(const spec_node& node, module_system& modules);

/**
 * @brief Standard Meson arguments for the node.
 */
std::vector<std::string> std_meson_args(const spec_node& node);

/**
 * @brief Create the toolkit for building the given node.
 */
build_toolkit make_build_toolkit(const spec_node& node, const build_config&, module_system&);

/**
 * @brief The toolkits bound during one build session, by capability scope.
 *
 * Each scope is bound at most once. Binding a recipe binds every scope registered for it.
 */
class toolkit_registry {
    const capability_table&                           _table;
    std::map<std::string, build_toolkit, std::less<>> _bound;

public:
    explicit toolkit_registry(const capability_table& table)
        : _table(table) {}

    /**
     * @brief Bind a toolkit to each unbound capability scope of the node's recipe. Returns the
     * toolkit of the recipe's own scope.
     */
    build_toolkit& bind(const spec_node& node, const build_config&, module_system&);

    [[nodiscard]] build_toolkit* find(std::string_view scope) noexcept;

    [[nodiscard]] bool is_bound(std::string_view scope) const noexcept {
        return _bound.find(scope) != _bound.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return _bound.size(); }
};

}  // namespace hatch
