#pragma once

#include <hatch/util/env.hpp>
#include <hatch/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

/**
 * @brief Access to an environment-modules system (Lmod, Environment Modules, Cray PE).
 */
class module_system {
public:
    virtual ~module_system() = default;

    /// Load a module into the live process environment
    virtual void load(std::string_view name) = 0;
    /// Unload a module from the live process environment. Unloading an absent module is harmless.
    virtual void unload(std::string_view name) = 0;
    /// The text of "module show <name>"
    virtual std::string show(std::string_view name) = 0;

    /**
     * @brief Infer an installation prefix from the contents of the given modules. Later modules
     * take precedence.
     */
    std::optional<fs::path> path_from_modules(const std::vector<std::string>& names);
};

/**
 * @brief A module_system that runs the "module" shell function through bash and copies the
 * resulting environment changes into this process.
 */
class shell_module_system final : public module_system {
    void _change(std::string_view verb, std::string_view name);

public:
    void        load(std::string_view name) override { _change("load", name); }
    void        unload(std::string_view name) override { _change("unload", name); }
    std::string show(std::string_view name) override;
};

/**
 * @brief Parse the output of "env -0".
 */
env_snapshot parse_env_dump(std::string_view dump);

/**
 * @brief Make the live environment reflect what changed between @p before and @p after. Variables
 * that did not change are not touched.
 */
void apply_environment_diff(const env_snapshot& before, const env_snapshot& after);

/**
 * @brief Extract an installation prefix from the "module show" text of a module.
 *
 * Looks for, in order: a library path variable, a <PACKAGE>_DIR or <PACKAGE>_ROOT variable, and
 * a PATH entry.
 */
std::optional<fs::path> path_from_module_contents(std::string_view text,
                                                  std::string_view module_name);

}  // namespace hatch
