#include "./platform.hpp"

#include "./config.hpp"

#include <hatch/spec/node.hpp>
#include <hatch/util/log.hpp>

#include <algorithm>
#include <cctype>

using namespace hatch;

namespace {

struct macos_release {
    std::string_view name;
    std::string_view version;
};

constexpr macos_release macos_releases[] = {
    {"lion", "10.7"},
    {"mountainlion", "10.8"},
    {"mavericks", "10.9"},
    {"yosemite", "10.10"},
    {"elcapitan", "10.11"},
    {"sierra", "10.12"},
    {"highsierra", "10.13"},
    {"mojave", "10.14"},
    {"catalina", "10.15"},
    {"bigsur", "11"},
    {"monterey", "12"},
    {"ventura", "13"},
    {"sonoma", "14"},
    {"sequoia", "15"},
};

}  // namespace

std::optional<std::string> hatch::macos_version_of(std::string_view os) {
    for (auto& rel : macos_releases) {
        if (rel.name == os) {
            return std::string(rel.version);
        }
    }
    const bool looks_like_version
        = !os.empty() && std::isdigit(static_cast<unsigned char>(os.front()))
        && std::all_of(os.begin(), os.end(), [](char c) {
              return std::isdigit(static_cast<unsigned char>(c)) || c == '.';
          });
    if (looks_like_version) {
        return std::string(os);
    }
    return std::nullopt;
}

void hatch::setup_platform_environment(const spec_node&           node,
                                       const build_config&        config,
                                       environment_modifications& env) {
    env.set_origin("platform " + node.arch.platform);
    if (node.arch.is_darwin()) {
        auto version = macos_version_of(node.arch.os);
        if (version) {
            env.set("MACOSX_DEPLOYMENT_TARGET", *version);
        } else {
            hatch_log(debug, "Unknown macOS release '{}', not setting a deployment target", node.arch.os);
        }
    } else if (node.arch.is_cray()) {
        env.set("CRAYPE_LINK_TYPE", "dynamic");
        auto cray_wrappers = config.build_env_path / "cray";
        if (is_directory_nothrow(cray_wrappers)) {
            env.prepend_path("PATH", cray_wrappers.string());
            env.prepend_path("HATCH_ENV_PATH", cray_wrappers.string());
        }
        env.append_path("PKG_CONFIG_PATH", "/usr/lib64/pkgconfig");
        env.append_path("PKG_CONFIG_PATH", "/usr/local/lib64/pkgconfig");
    }
}
