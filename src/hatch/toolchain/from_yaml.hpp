#pragma once

#include <hatch/toolchain/toolchain.hpp>

#include <yaml-cpp/node/node.h>

#include <string_view>

namespace hatch {

toolchain parse_toolchain_yaml(std::string_view content, std::string_view context = "Loading toolchain");
toolchain parse_toolchain_yaml_data(const YAML::Node&, std::string_view context = "Loading toolchain");
toolchain parse_toolchain_yaml_file(path_ref);

}  // namespace hatch
