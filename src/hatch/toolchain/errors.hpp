#pragma once

#include <filesystem>
#include <string>

namespace hatch {

struct e_toolchain_path {
    std::filesystem::path value;
};

struct e_builtin_toolchain_str {
    std::string value;
};

struct e_toolchain_key {
    std::string value;
};

}  // namespace hatch
