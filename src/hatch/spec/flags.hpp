#pragma once

#include <array>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

/**
 * @brief The categories of compiler flags tracked per-spec.
 */
enum class flag_category {
    cflags,
    cxxflags,
    fflags,
    cppflags,
    ldflags,
    ldlibs,
};

inline constexpr std::array all_flag_categories = {
    flag_category::cflags,
    flag_category::cxxflags,
    flag_category::fflags,
    flag_category::cppflags,
    flag_category::ldflags,
    flag_category::ldlibs,
};

/**
 * @brief The lower-case name of the category (e.g. "cflags")
 */
std::string_view to_string(flag_category) noexcept;

/**
 * @brief The environment variable name of the category (e.g. "CFLAGS")
 */
std::string env_var_name(flag_category);

using flag_map = std::map<flag_category, std::vector<std::string>>;

}  // namespace hatch
