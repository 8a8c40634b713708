#pragma once

#include <hatch/env/modifications.hpp>
#include <hatch/spec/flags.hpp>
#include <hatch/util/fs/path.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

class spec_node;
class build_toolkit;

/**
 * @brief Where each flag of one category should be delivered.
 */
struct flag_handler_result {
    /// Injected into every compile line by the compiler wrappers
    std::vector<std::string> inject;
    /// Placed into the conventional environment variable (CFLAGS, LDFLAGS, ...)
    std::vector<std::string> env;
    /// Given to the build system on its command line
    std::vector<std::string> build_system;
};

/**
 * @brief The hooks a package recipe offers to the build-environment engine.
 *
 * A recipe object is shared by every node built from it, so each hook receives the node it is
 * acting for. All hooks have do-nothing defaults.
 */
class package_recipe {
public:
    virtual ~package_recipe() = default;

    /// Unique name of the recipe. Also names its primary capability scope.
    virtual std::string recipe_name() const = 0;

    /**
     * @brief The capability scopes that need a build toolkit bound, in binding order. The
     * recipe's own scope comes first; scopes of build-system base recipes follow.
     */
    virtual std::vector<std::string> capability_scopes() const { return {recipe_name()}; }

    /// Whether RPATHs cover every transitive link dependency, or only the direct ones
    virtual bool transitive_rpaths() const { return true; }
    /// Whether make-like tools may run parallel jobs for this recipe
    virtual bool parallel() const { return true; }
    /// Whether the recipe's tests need the compiler environment
    virtual bool test_requires_compiler() const { return false; }

    virtual std::string cmake_build_type() const { return "RelWithDebInfo"; }
    virtual std::string meson_build_type() const { return "release"; }

    virtual flag_handler_result flag_handler(flag_category, std::vector<std::string> flags) const;

    /**
     * @brief Receive the flags the flag handler routed to the build system. Recipes that cannot
     * take flags on a build-system command line throw a setup_error if any are given.
     */
    virtual void flags_to_build_system_args(const flag_map& flags, build_toolkit&) const;

    virtual void setup_build_environment(environment_modifications&, const spec_node& self) const {}
    virtual void setup_run_environment(environment_modifications&, const spec_node& self) const {}

    virtual void setup_dependent_build_environment(environment_modifications&,
                                                   const spec_node& self,
                                                   const spec_node& dependent) const {}
    virtual void setup_dependent_run_environment(environment_modifications&,
                                                 const spec_node& self,
                                                 const spec_node& dependent) const {}

    /**
     * @brief Customize the toolkit of a package that depends on this one (e.g. to provide
     * wrapper executables or variables to it).
     */
    virtual void setup_dependent_package(build_toolkit& dependent_toolkit,
                                         const spec_node& self,
                                         const spec_node& dependent) const {}

    /**
     * @brief The libraries installed by the node. The default searches the prefix for a library
     * named after the package, and throws an e_no_libraries error if none is found.
     */
    virtual std::vector<fs::path> libs(const spec_node& self) const;

    /**
     * @brief The header files installed by the node. The default lists every header below the
     * prefix's include directory, and throws an e_no_headers error if there are none.
     */
    virtual std::vector<fs::path> headers(const spec_node& self) const;
};

/**
 * @brief The distinct parent directories of the given files, in first-seen order.
 */
std::vector<fs::path> file_directories(const std::vector<fs::path>& files);

/**
 * @brief The directories to put on an include path for the given headers. A header inside an
 * "include" directory contributes that directory rather than its own parent.
 */
std::vector<fs::path> header_directories(const std::vector<fs::path>& headers);

/**
 * @brief Find libraries named @p libname (a "lib" prefix is added if missing) with the given file
 * suffix ("so", "dylib" or "a"). The prefix's lib and lib64 directories are searched before the
 * whole tree.
 */
std::vector<fs::path>
find_libraries(std::string_view libname, path_ref root, std::string_view suffix);

/**
 * @brief Find every C/C++/Fortran header file below @p root.
 */
std::vector<fs::path> find_headers(path_ref root);

/**
 * @brief Maps recipe names to the ordered capability scopes that need toolkit bindings.
 *
 * Recipes are registered once, when they are made available to a build session.
 */
class capability_table {
    std::map<std::string, std::vector<std::string>, std::less<>> _scopes;

public:
    void register_recipe(const package_recipe&);

    /**
     * @brief Register the recipe of every node reachable from @p root
     */
    void register_dag(const spec_node& root);

    bool contains(std::string_view recipe_name) const noexcept {
        return _scopes.find(recipe_name) != _scopes.end();
    }

    /**
     * @brief The scopes registered for the recipe. Throws if the recipe was never registered.
     */
    const std::vector<std::string>& scopes_for(std::string_view recipe_name) const;
};

}  // namespace hatch
