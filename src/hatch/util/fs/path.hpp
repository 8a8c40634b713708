#pragma once

#include <filesystem>

namespace hatch {

namespace fs = std::filesystem;

/**
 * @brief Alias of a const& to a std::filesystem::path
 */
using path_ref = const fs::path&;

/**
 * @brief Convert a path to its most-normal form.
 *
 * This removes redundant path elements (dots and dot-dots), removes trailing directory
 * separators, and converts the path to its POSIX (generic) form.
 */
[[nodiscard]] fs::path normalize_path(path_ref p) noexcept;

/**
 * @brief Obtain the normalized absolute path to a possibly-existing file or directory.
 */
[[nodiscard]] fs::path resolve_path_weak(path_ref p) noexcept;

/**
 * @brief Check whether the given path names an existing directory, without throwing.
 */
[[nodiscard]] bool is_directory_nothrow(path_ref p) noexcept;

}  // namespace hatch
