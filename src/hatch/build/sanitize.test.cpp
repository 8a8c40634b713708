#include <hatch/build/sanitize.hpp>

#include <hatch/build/config.hpp>
#include <hatch/env/preserve.hpp>

#include <catch2/catch.hpp>

namespace {

hatch::env_snapshot sanitized(const hatch::arch_spec&    host,
                              const hatch::build_config& cfg,
                              hatch::env_snapshot        env) {
    auto mods = hatch::sanitizing_modifications(host, cfg, env);
    mods.apply_to(env);
    return env;
}

}  // namespace

TEST_CASE("Host library and compiler variables are removed") {
    hatch::build_config cfg;
    auto                host = hatch::arch_spec::parse("linux-ubuntu20.04-x86_64");
    auto                env  = sanitized(host,
                         cfg,
                         {
                             {"LD_LIBRARY_PATH", "/opt/lib"},
                             {"CPATH", "/opt/include"},
                             {"DYLD_LIBRARY_PATH", "/opt/lib"},
                             {"CC", "icc"},
                             {"CXXFLAGS", "-O3"},
                             {"MPICC", "mpicc"},
                             {"CRAY_LD_LIBRARY_PATH", "/opt/cray/lib"},
                             {"HOME", "/home/me"},
                             {"PATH", "/opt/local/macports/bin:/usr/bin:/bin"},
                         });
    CHECK(env
          == hatch::env_snapshot{
              {"CRAY_LD_LIBRARY_PATH", "/opt/cray/lib"},
              {"HOME", "/home/me"},
              {"PATH", "/usr/bin:/bin"},
          });
}

TEST_CASE("Cray clusters drop Cray library and pkg-config variables") {
    hatch::build_config cfg;
    hatch::env_snapshot base{
        {"CRAY_LD_LIBRARY_PATH", "/opt/cray/lib"},
        {"PE_PKGCONFIG_LIBS", "x"},
        {"PKGCONFIG_DIR", "y"},
    };
    auto cluster = sanitized(hatch::arch_spec::parse("cray-sles15-haswell"), cfg, base);
    CHECK(cluster.empty());

    // Compute-node images need them
    auto compute = sanitized(hatch::arch_spec::parse("cray-cnl7-haswell"), cfg, base);
    CHECK(compute == base);
}

TEST_CASE("A host on a CLE compute node keeps its Cray variables") {
    hatch::build_config cfg;
    hatch::arch_spec    host{.platform = "cray",
                             .os       = hatch::cle_release_os("RELEASE=7.0.UP03").value(),
                             .target   = "haswell"};
    auto env = sanitized(host,
                         cfg,
                         {
                             {"CRAY_LD_LIBRARY_PATH", "/opt/cray/pe/lib64"},
                             {"PKGCONFIG_DIR", "/opt/cray/pe/pkgconfig"},
                             {"LD_LIBRARY_PATH", "/opt/lib"},
                         });
    CHECK(env
          == hatch::env_snapshot{
              {"CRAY_LD_LIBRARY_PATH", "/opt/cray/pe/lib64"},
              {"PKGCONFIG_DIR", "/opt/cray/pe/pkgconfig"},
          });

    // Without a CLE release the host is treated as a cluster login node
    host.os = "default";
    CHECK(sanitized(host, cfg, {{"CRAY_LD_LIBRARY_PATH", "/opt/cray/pe/lib64"}}).empty());
}

TEST_CASE("The build language forces the locale") {
    hatch::build_config cfg;
    cfg.build_language = "C";
    auto env = sanitized(hatch::arch_spec::parse("linux-rhel8-x86_64"), cfg, {{"LC_ALL", "de_DE"}});
    CHECK(env["LC_ALL"] == "C");
}

TEST_CASE("Cleaning applies to the live environment") {
    hatch::preserve_environment keep{"LD_LIBRARY_PATH", "CC", "HATCH_UNRELATED"};
    hatch::setenv("LD_LIBRARY_PATH", "/somewhere/lib");
    hatch::setenv("CC", "/usr/bin/cc");
    hatch::setenv("HATCH_UNRELATED", "stays");
    hatch::clean_environment(hatch::arch_spec::parse("linux-ubuntu20.04-x86_64"),
                             hatch::build_config{});
    CHECK_FALSE(hatch::getenv("LD_LIBRARY_PATH").has_value());
    CHECK_FALSE(hatch::getenv("CC").has_value());
    CHECK(hatch::getenv("HATCH_UNRELATED") == "stays");
}
