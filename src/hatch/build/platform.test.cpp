#include "./platform.hpp"

#include "./config.hpp"

#include <hatch/spec/node.hpp>
#include <hatch/util/temp.hpp>

#include <catch2/catch.hpp>

using namespace hatch;

TEST_CASE("macOS versions by release name") {
    CHECK(macos_version_of("catalina") == "10.15");
    CHECK(macos_version_of("monterey") == "12");
    CHECK(macos_version_of("13.4") == "13.4");
    CHECK_FALSE(macos_version_of("ubuntu20.04"));
    CHECK_FALSE(macos_version_of(""));
}

TEST_CASE("Platform-specific build variables") {
    auto         tmp = temporary_dir::create();
    build_config config;
    config.build_env_path = tmp.path() / "env";

    spec_node node{.name = "pkg", .arch = arch_spec::parse("darwin-bigsur-x86_64")};

    environment_modifications env;
    setup_platform_environment(node, config, env);
    env_snapshot snap;
    env.apply_to(snap);
    CHECK(snap["MACOSX_DEPLOYMENT_TARGET"] == "11");

    node.arch = arch_spec::parse("cray-cnl7-haswell");
    fs::create_directories(config.build_env_path / "cray");
    environment_modifications cray_env;
    setup_platform_environment(node, config, cray_env);
    env_snapshot cray_snap{{"PATH", "/usr/bin"}};
    cray_env.apply_to(cray_snap);
    CHECK(cray_snap["CRAYPE_LINK_TYPE"] == "dynamic");
    CHECK(cray_snap["PATH"] == (config.build_env_path / "cray").string() + ":/usr/bin");
    CHECK(cray_snap["PKG_CONFIG_PATH"] == "/usr/lib64/pkgconfig:/usr/local/lib64/pkgconfig");

    node.arch = arch_spec::parse("linux-ubuntu20.04-x86_64");
    environment_modifications linux_env;
    setup_platform_environment(node, config, linux_env);
    CHECK(linux_env.size() == 0);
}
