#include <hatch/toolchain/errors.hpp>
#include <hatch/toolchain/from_yaml.hpp>
#include <hatch/toolchain/toolchain.hpp>

#include <hatch/error/errors.hpp>
#include <hatch/error/try_catch.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Load a toolchain from YAML") {
    auto tc = hatch::parse_toolchain_yaml(R"(
name: gcc
version: 9.3.0
paths:
  cc: /usr/bin/gcc
  cxx: /usr/bin/g++
link_paths:
  cc: gcc/gcc
  cxx: gcc/g++
extra_rpaths: [/opt/gcc/lib64]
implicit_rpaths: [/opt/gcc/lib]
modules: [gcc/9.3.0]
environment:
  set:
    GCC_COLORS: ""
  prepend_path:
    PATH: /opt/gcc/bin
target_flags:
  mytarget: -mfancy
)");
    CHECK(tc.name() == "gcc");
    CHECK(tc.spec_string() == "gcc@9.3.0");
    CHECK(tc.executable(hatch::language::c) == hatch::fs::path("/usr/bin/gcc"));
    CHECK_FALSE(tc.executable(hatch::language::fc).has_value());
    CHECK(tc.link_path(hatch::language::cxx) == "gcc/g++");
    // Unlisted languages get a wrapper named after the language
    CHECK(tc.link_path(hatch::language::fc) == "gcc/fc");
    CHECK(tc.rpath_arg(hatch::language::c) == "-Wl,-rpath,");
    CHECK(tc.extra_rpaths() == std::vector<hatch::fs::path>{"/opt/gcc/lib64"});
    CHECK(tc.implicit_rpaths() == std::vector<hatch::fs::path>{"/opt/gcc/lib"});
    CHECK(tc.modules() == std::vector<std::string>{"gcc/9.3.0"});
    CHECK(tc.environment().size() == 2);

    auto arch = hatch::arch_spec::parse("linux-ubuntu20.04-mytarget");
    CHECK(tc.target_args(arch) == "-mfancy");
    arch.target = "haswell";
    CHECK(tc.target_args(arch) == "-march=haswell -mtune=haswell");
    arch.target = "no-such-target";
    CHECK(tc.target_args(arch) == "");
}

TEST_CASE("Reject unknown toolchain keys") {
    CHECK_THROWS_AS(hatch::parse_toolchain_yaml("name: gcc\nfrobnicate: true\n"),
                    std::runtime_error);
    CHECK_THROWS_AS(hatch::parse_toolchain_yaml("version: 1.2.3\n"), std::runtime_error);
}

TEST_CASE("Missing compiler executables fail verification") {
    hatch_leaf_try {
        auto tc = hatch::parse_toolchain_yaml(R"(
name: gcc
paths:
  cc: /this/compiler/does-not-exist
)");
        tc.verify_executables();
        FAIL_CHECK("Did not throw");
    }
    hatch_leaf_catch(const hatch::setup_error& err, hatch::e_missing_executable missing) {
        CHECK(missing.value == "/this/compiler/does-not-exist");
        CHECK_THAT(err.what(), Catch::Contains("does-not-exist"));
    }
    hatch_leaf_catch_all { FAIL_CHECK("Unknown error: " << diagnostic_info); };
}

TEST_CASE("Builtin toolchains reject unknown families") {
    hatch_leaf_try {
        hatch::toolchain::get_builtin("msvc");
        FAIL_CHECK("Did not throw");
    }
    hatch_leaf_catch(hatch::e_builtin_toolchain_str given) { CHECK(given.value == "msvc"); }
    hatch_leaf_catch_all { FAIL_CHECK("Unknown error: " << diagnostic_info); };
}

TEST_CASE("Builtin toolchains name their wrappers after the family") {
    auto tc = hatch::toolchain::get_builtin("gcc-10");
    CHECK(tc.name() == "gcc");
    CHECK(tc.spec_string() == "gcc@10");
    CHECK(tc.link_path(hatch::language::c) == "gcc/cc");
    REQUIRE(tc.executable(hatch::language::cxx).has_value());
    CHECK(tc.executable(hatch::language::cxx)->filename() == "g++-10");
}
