#include "./synthesize.hpp"

#include "./config.hpp"

#include <hatch/error/errors.hpp>
#include <hatch/error/try_catch.hpp>
#include <hatch/hatch.test.hpp>
#include <hatch/recipe/toolkit.hpp>
#include <hatch/util/env.hpp>
#include <hatch/util/string.hpp>
#include <hatch/util/temp.hpp>

#include <catch2/catch.hpp>

using namespace hatch;
using hatch::testing::add_node;
using hatch::testing::test_recipe;
using hatch::testing::touch;

namespace {

struct fixture {
    temporary_dir tmp = temporary_dir::create();
    spec_dag      dag;
    build_config  config;

    testing::recording_module_system modules;

    fixture() {
        config.build_env_path = tmp.path() / "env";
        config.working_dir    = tmp.path();
        fs::create_directories(config.build_env_path / "gcc");
    }

    fs::path prefix(std::string_view name) const { return tmp.path() / name; }

    spec_node& add(std::string name) {
        auto recipe = std::make_shared<test_recipe>(name);
        return add_node(dag, recipe, prefix(name));
    }

    env_snapshot synthesize(const spec_node& node, env_snapshot base = {{"PATH", "/usr/bin"}}) {
        environment_modifications env;
        set_build_environment_variables(node, config, env);
        env.apply_to(base);
        return base;
    }
};

}  // namespace

TEST_CASE_METHOD(fixture, "Build and link dependencies feed different directory lists") {
    auto& root = add("root");
    auto& tool = add("tool");
    auto& foo  = add("foo");
    root.add_dependency(tool, dep_type::build);
    root.add_dependency(foo, dep_type::link);
    touch(prefix("tool") / "include/tool.h");
    fs::create_directories(prefix("tool") / "bin");
    touch(prefix("foo") / "lib/libfoo.so");

    auto dirs = REQUIRES_LEAF_NOFAIL(compute_dependency_dirs(root));
    using P   = std::vector<fs::path>;
    CHECK(dirs.include_dirs == P{prefix("tool") / "include"});
    CHECK(dirs.link_dirs == P{prefix("foo") / "lib"});
    CHECK(dirs.rpath_dirs
          == P{prefix("root") / "lib", prefix("root") / "lib64", prefix("foo") / "lib"});

    auto env = REQUIRES_LEAF_NOFAIL(synthesize(root));
    CHECK(env["HATCH_INCLUDE_DIRS"] == (prefix("tool") / "include").string());
    CHECK(env["HATCH_LINK_DIRS"] == (prefix("foo") / "lib").string());
    CHECK(env["HATCH_RPATH_DIRS"]
          == (prefix("root") / "lib").string() + ":" + (prefix("root") / "lib64").string() + ":"
              + (prefix("foo") / "lib").string());
    CHECK(env["CMAKE_PREFIX_PATH"] == prefix("tool").string() + ":" + prefix("foo").string());

    // The wrapper directories come first, the compiler-specific one in front
    auto wrappers = config.build_env_path.string();
    CHECK(env["PATH"]
          == wrappers + "/gcc:" + wrappers + ":" + (prefix("tool") / "bin").string()
              + ":/usr/bin");
    CHECK(env["HATCH_ENV_PATH"] == wrappers + ":" + wrappers + "/gcc");
    CHECK(env["HATCH_SHORT_SPEC"] == root.short_spec());
    CHECK(env["HATCH_DEBUG_LOG_ID"] == root.log_id());
    CHECK(env["HATCH_DEBUG_LOG_DIR"] == tmp.path().string());
    CHECK_FALSE(env.contains("HATCH_DEBUG"));
}

TEST_CASE_METHOD(fixture, "RPATHs follow the recipe's transitivity") {
    auto  recipe = std::make_shared<test_recipe>("a");
    auto& a      = add_node(dag, recipe, prefix("a"));
    auto& b      = add("b");
    auto& c      = add("c");
    a.add_dependency(b, dep_type::link);
    b.add_dependency(c, dep_type::link);
    touch(prefix("b") / "lib/libb.so");
    touch(prefix("c") / "lib/libc.so");

    using P = std::vector<fs::path>;
    auto own = P{prefix("a") / "lib", prefix("a") / "lib64"};

    auto dirs = REQUIRES_LEAF_NOFAIL(compute_dependency_dirs(a));
    CHECK(dirs.link_dirs == P{prefix("b") / "lib", prefix("c") / "lib"});
    auto expect = own;
    expect.push_back(prefix("b") / "lib");
    expect.push_back(prefix("c") / "lib");
    CHECK(dirs.rpath_dirs == expect);

    recipe->transitive = false;
    dirs = REQUIRES_LEAF_NOFAIL(compute_dependency_dirs(a));
    // Linking still sees every library; only the RPATHs are restricted
    CHECK(dirs.link_dirs == P{prefix("b") / "lib", prefix("c") / "lib"});
    expect = own;
    expect.push_back(prefix("b") / "lib");
    CHECK(dirs.rpath_dirs == expect);
}

TEST_CASE_METHOD(fixture, "Shared and system dependencies are listed once") {
    auto& root   = add("root");
    auto& left   = add("left");
    auto& right  = add("right");
    auto& shared = add("shared");
    auto& sys    = add_node(dag, std::make_shared<test_recipe>("sys"), "/usr");
    root.add_dependency(left, dep_type::link);
    root.add_dependency(right, dep_type::link);
    left.add_dependency(shared, dep_type::link);
    right.add_dependency(shared, dep_type::link);
    root.add_dependency(sys, dep_type::link | dep_type::build);
    touch(prefix("shared") / "lib/libshared.so");
    touch(prefix("shared") / "include/shared/shared.h");

    auto dirs = REQUIRES_LEAF_NOFAIL(compute_dependency_dirs(root));
    using P   = std::vector<fs::path>;
    CHECK(dirs.link_dirs == P{prefix("shared") / "lib"});
    CHECK(dirs.include_dirs == P{prefix("shared") / "include"});

    auto env = REQUIRES_LEAF_NOFAIL(synthesize(root));
    CHECK_FALSE(contains(env["CMAKE_PREFIX_PATH"], "/usr"));
    CHECK(contains(env["CMAKE_PREFIX_PATH"], prefix("shared").string()));
}

TEST_CASE_METHOD(fixture, "Compiler variables") {
    auto& root = add("root");
    auto  kit  = REQUIRES_LEAF_NOFAIL(make_build_toolkit(root, config, modules));

    environment_modifications mods;
    REQUIRES_LEAF_NOFAIL(set_compiler_environment_variables(root, config, kit, mods));
    env_snapshot env;
    mods.apply_to(env);

    CHECK(env["HATCH_CC"] == "/bin/sh");
    CHECK(env["HATCH_CXX"] == "/bin/sh");
    CHECK(env["CC"] == (config.build_env_path / "gcc/gcc").string());
    CHECK(env["CXX"] == (config.build_env_path / "gcc/g++").string());
    // Languages the compiler does not support get no compiler variable, but do get an RPATH arg
    CHECK_FALSE(env.contains("HATCH_FC"));
    CHECK_FALSE(env.contains("FC"));
    CHECK(env["HATCH_FC_RPATH_ARG"] == "-Wl,-rpath,");
    CHECK(env["HATCH_LINKER_ARG"] == "-Wl,");
    CHECK(env["HATCH_COMPILER_SPEC"] == "gcc@9.3.0");
    CHECK(env["HATCH_TARGET_ARGS"] == "-march=x86-64 -mtune=generic");
    CHECK(contains(env["HATCH_SYSTEM_DIRS"], "/usr/lib"));

    CHECK(env["HATCH_DTAGS_TO_STRIP"] == "--enable-new-dtags");
    CHECK(env["HATCH_DTAGS_TO_ADD"] == "--disable-new-dtags");

    config.shared_linking = linking_policy::runpath;
    environment_modifications runpath_mods;
    REQUIRES_LEAF_NOFAIL(set_compiler_environment_variables(root, config, kit, runpath_mods));
    env_snapshot runpath_env;
    runpath_mods.apply_to(runpath_env);
    CHECK(runpath_env["HATCH_DTAGS_TO_STRIP"] == "--disable-new-dtags");
    CHECK(runpath_env["HATCH_DTAGS_TO_ADD"] == "--enable-new-dtags");
}

TEST_CASE_METHOD(fixture, "Compiler flags are routed by the recipe's flag handler") {
    auto& root = add("root");
    root.compiler_flags[flag_category::cflags] = {"-O3", "-g"};
    auto kit = REQUIRES_LEAF_NOFAIL(make_build_toolkit(root, config, modules));

    environment_modifications mods;
    REQUIRES_LEAF_NOFAIL(set_compiler_environment_variables(root, config, kit, mods));
    env_snapshot env;
    mods.apply_to(env);
    CHECK(env["HATCH_CFLAGS"] == "-O3 -g");
    CHECK_FALSE(env.contains("CFLAGS"));
    CHECK_FALSE(env.contains("HATCH_CXXFLAGS"));
}

TEST_CASE_METHOD(fixture, "A missing compiler executable is a setup error") {
    toolchain_prep prep;
    prep.name    = "gcc";
    prep.version = "9.3.0";
    prep.cc      = tmp.path() / "no-such-cc";
    auto& root   = add_node(dag,
                          std::make_shared<test_recipe>("root"),
                          prefix("root"),
                          std::make_shared<toolchain>(prep.realize()));
    auto  kit    = REQUIRES_LEAF_NOFAIL(make_build_toolkit(root, config, modules));

    environment_modifications mods;
    hatch_leaf_try {
        set_compiler_environment_variables(root, config, kit, mods);
        FAIL_CHECK("Expected a setup error");
    }
    hatch_leaf_catch(const setup_error&, e_missing_executable missing) {
        CHECK(missing.value == (tmp.path() / "no-such-cc").string());
    }
    hatch_leaf_catch_all { FAIL_CHECK("Unexpected error: " << diagnostic_info); };
    // Nothing was recorded before the failure
    CHECK(mods.size() == 0);
}

TEST_CASE_METHOD(fixture, "ccache must exist when requested") {
    auto& root    = add("root");
    config.ccache = true;
    auto path     = hatch::getenv("PATH");
    hatch::setenv("PATH", (tmp.path() / "empty").string());
    hatch_leaf_try {
        synthesize(root);
        FAIL_CHECK("Expected a setup error");
    }
    hatch_leaf_catch(const setup_error&, e_missing_executable missing) {
        CHECK(missing.value == "ccache");
    }
    hatch_leaf_catch_all { FAIL_CHECK("Unexpected error: " << diagnostic_info); };
    hatch::setenv("PATH", path.value_or(""));
}
