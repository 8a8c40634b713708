#pragma once

#include <filesystem>
#include <string>

namespace hatch {

struct e_parse_yaml_file_path {
    std::filesystem::path value;
};

struct e_yaml_parse_error {
    std::string value;
};

}  // namespace hatch
