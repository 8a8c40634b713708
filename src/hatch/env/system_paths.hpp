#pragma once

#include <hatch/util/fs/path.hpp>

#include <string>
#include <vector>

namespace hatch {

/**
 * @brief The canonical installation roots of the host system: "/", "/usr" and "/usr/local".
 */
const std::vector<std::string>& system_paths() noexcept;

/**
 * @brief The system roots together with their conventional bin/bin64/include/lib/lib64
 * subdirectories.
 */
const std::vector<std::string>& system_dirs() noexcept;

/**
 * @brief Determine whether the given path is one of the system_dirs(), after normalization.
 */
[[nodiscard]] bool is_system_path(path_ref p) noexcept;

/**
 * @brief Remove system directories from the given list, keeping the order of the remainder.
 */
[[nodiscard]] std::vector<fs::path> filter_system_paths(std::vector<fs::path> paths);

/**
 * @brief Filter system directories and remove repeats, keeping the first occurrence of each
 * remaining path.
 */
[[nodiscard]] std::vector<fs::path> filter_and_dedupe(std::vector<fs::path> paths);

}  // namespace hatch
