#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace hatch {

std::optional<std::string> getenv(const std::string& env) noexcept;

bool getenv_bool(const std::string& env) noexcept;

bool is_truthy_string(std::string_view s) noexcept;

template <std::invocable Func>
std::string getenv(const std::string& name, Func&& fn) noexcept(noexcept(fn())) {
    auto val = getenv(name);
    if (!val) {
        return std::string(fn());
    }
    return *val;
}

/**
 * @brief Write a variable into the live process environment.
 */
void setenv(const std::string& name, const std::string& value);

/**
 * @brief Remove a variable from the live process environment. Removing an absent variable is not
 * an error.
 */
void unsetenv(const std::string& name);

/**
 * @brief A copy of the live process environment, ordered by variable name.
 */
using env_snapshot = std::map<std::string, std::string>;

[[nodiscard]] env_snapshot snapshot_environment();

/**
 * @brief Make the live environment exactly equal to the given snapshot.
 */
void restore_environment(const env_snapshot&);

}  // namespace hatch
