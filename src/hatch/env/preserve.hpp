#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hatch {

/**
 * @brief Snapshot a fixed set of environment variables on construction and restore them on
 * destruction.
 *
 * Variables that were absent when the scope began are removed again when it ends.
 */
class preserve_environment {
    std::vector<std::pair<std::string, std::optional<std::string>>> _saved;

public:
    explicit preserve_environment(std::initializer_list<std::string> names);
    ~preserve_environment();

    preserve_environment(const preserve_environment&) = delete;
    preserve_environment& operator=(const preserve_environment&) = delete;
};

}  // namespace hatch
