#pragma once

#include <hatch/util/env.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

enum class env_op {
    set,
    unset,
    append_flags,
    remove_flags,
    set_path,
    append_path,
    prepend_path,
    remove_path,
    deprioritize_system_paths,
    prune_duplicate_paths,
};

std::string_view to_string(env_op) noexcept;

/**
 * @brief A single recorded operation on one environment variable.
 */
struct env_modification {
    env_op kind;

    std::string name;

    /// The value for set/flag operations, or the path elements for path operations
    std::vector<std::string> values;

    std::string separator;

    /// Who requested this modification (e.g. "dependency zlib"). Only used for diagnostics.
    std::string origin;

    /**
     * @brief Apply this modification to the given environment mapping.
     */
    void execute(env_snapshot& env) const;
};

enum class shell_kind {
    sh,
    csh,
};

/**
 * @brief An ordered, replayable list of environment operations.
 *
 * Operations are recorded rather than executed. Later operations on the same variable are applied
 * after earlier ones, so the last set/unset of a variable wins, and path operations accumulate in
 * insertion order. Path insertions are idempotent: inserting a path that is already present moves
 * it rather than duplicating it.
 */
class environment_modifications {
    std::vector<env_modification> _mods;
    std::string                   _origin;

    void _push(env_op kind, std::string_view name, std::vector<std::string> values,
               std::string_view sep);

public:
    using const_iterator = std::vector<env_modification>::const_iterator;

    /**
     * @brief Set the origin label attached to operations recorded from now on.
     */
    void set_origin(std::string origin) noexcept { _origin = std::move(origin); }
    const std::string& origin() const noexcept { return _origin; }

    void set(std::string_view name, std::string_view value);
    void unset(std::string_view name);
    void append_flags(std::string_view name, std::string_view value, std::string_view sep = " ");
    void remove_flags(std::string_view name, std::string_view value, std::string_view sep = " ");
    void set_path(std::string_view                name,
                  const std::vector<std::string>& elements,
                  std::string_view                sep = ":");
    void append_path(std::string_view name, std::string_view path, std::string_view sep = ":");
    void prepend_path(std::string_view name, std::string_view path, std::string_view sep = ":");
    void remove_path(std::string_view name, std::string_view path, std::string_view sep = ":");
    void deprioritize_system_paths(std::string_view name, std::string_view sep = ":");
    void prune_duplicate_paths(std::string_view name, std::string_view sep = ":");

    /**
     * @brief Append all operations of another ledger after the operations of this one.
     */
    void extend(const environment_modifications& other);

    /**
     * @brief Determine whether the last recorded operation on the variable is an unset.
     */
    [[nodiscard]] bool is_unset(std::string_view name) const noexcept;

    [[nodiscard]] std::map<std::string, std::vector<const env_modification*>>
    group_by_name() const;

    /**
     * @brief Apply every operation, in order, to the given environment mapping.
     */
    void apply_to(env_snapshot& env) const;

    /**
     * @brief Apply every operation to the live process environment. Only variables named by some
     * operation are touched.
     */
    void apply() const;

    /**
     * @brief Render the changes this ledger would make to the current environment as shell
     * commands.
     */
    [[nodiscard]] std::string shell_modifications(shell_kind shell = shell_kind::sh) const;

    /**
     * @brief Generate a warning for every variable that is set or unset after other operations on
     * it were already recorded.
     */
    [[nodiscard]] std::vector<std::string> validation_warnings() const;

    void clear() noexcept { _mods.clear(); }

    [[nodiscard]] bool        empty() const noexcept { return _mods.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return _mods.size(); }

    const_iterator begin() const noexcept { return _mods.begin(); }
    const_iterator end() const noexcept { return _mods.end(); }
};

/**
 * @brief Emit each validation warning of the ledger through the given callback.
 */
void validate(const environment_modifications&, const std::function<void(std::string_view)>& warn);

}  // namespace hatch
