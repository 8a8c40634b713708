#pragma once

#include <hatch/env/modifications.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace hatch {

class spec_node;
struct build_config;

/**
 * @brief The macOS version for an operating system name ("catalina" -> "10.15"). Names that are
 * already versions are returned as-is.
 */
std::optional<std::string> macos_version_of(std::string_view os);

/**
 * @brief Record the platform-specific parts of a node's build environment.
 *
 * Darwin targets get a MACOSX_DEPLOYMENT_TARGET for the target OS. Cray targets link dynamically,
 * use the Cray wrapper directory if there is one, and can find the system's pkg-config files.
 */
void setup_platform_environment(const spec_node&, const build_config&, environment_modifications&);

}  // namespace hatch
