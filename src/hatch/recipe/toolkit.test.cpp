#include "./toolkit.hpp"

#include <hatch/build/config.hpp>
#include <hatch/error/errors.hpp>
#include <hatch/hatch.test.hpp>
#include <hatch/util/env.hpp>
#include <hatch/util/temp.hpp>

#include <catch2/catch.hpp>

using namespace hatch;
using hatch::testing::add_node;
using hatch::testing::test_recipe;

namespace {

class builder_recipe : public test_recipe {
public:
    using test_recipe::test_recipe;
    std::vector<std::string> capability_scopes() const override { return {"builder"}; }
    std::string              cmake_build_type() const override { return "Release"; }
};

}  // namespace

TEST_CASE("Standard CMake arguments") {
    auto     tmp = temporary_dir::create();
    spec_dag dag;
    auto&    app = add_node(dag, std::make_shared<builder_recipe>("app"), tmp.path() / "app");
    auto&    lib = add_node(dag, std::make_shared<test_recipe>("lib"), tmp.path() / "lib");
    auto&    sys = add_node(dag, std::make_shared<test_recipe>("sys"), "/usr");
    app.add_dependency(lib, dep_type::link);
    app.add_dependency(sys, dep_type::build);
    fs::create_directories(tmp.path() / "lib/lib");

    testing::recording_module_system modules;
    auto args = std_cmake_args(app, modules);
    auto rpaths = (tmp.path() / "app/lib").string() + ";" + (tmp.path() / "app/lib64").string()
        + ";" + (tmp.path() / "lib/lib").string();
    CHECK(args
          == std::vector<std::string>{
              "-G",
              "Unix Makefiles",
              "-DCMAKE_INSTALL_PREFIX:STRING=" + (tmp.path() / "app").string(),
              "-DCMAKE_BUILD_TYPE:STRING=Release",
              "-DCMAKE_VERBOSE_MAKEFILE:BOOL=ON",
              "-DCMAKE_INSTALL_RPATH_USE_LINK_PATH:BOOL=OFF",
              "-DCMAKE_INSTALL_RPATH:STRING=" + rpaths,
              "-DCMAKE_PREFIX_PATH:STRING=" + (tmp.path() / "lib").string(),
          });

    auto meson = std_meson_args(app);
    CHECK(meson.front() == "--prefix=" + (tmp.path() / "app").string());
}

TEST_CASE("Each capability scope is bound once") {
    auto     tmp = temporary_dir::create();
    spec_dag dag;
    auto&    app = add_node(dag, std::make_shared<builder_recipe>("app"), tmp.path() / "app");
    auto&    lib = add_node(dag, std::make_shared<builder_recipe>("lib"), tmp.path() / "lib");
    app.add_dependency(lib, dep_type::link);

    capability_table table;
    table.register_dag(app);
    toolkit_registry registry{table};
    build_config     config;
    config.build_env_path = tmp.path() / "env";
    testing::recording_module_system modules;

    auto& app_kit = registry.bind(app, config, modules);
    CHECK(app_kit.prefix == tmp.path() / "app");
    CHECK(app_kit.cc == tmp.path() / "env/gcc/gcc");
    CHECK(registry.is_bound("builder"));
    CHECK(registry.size() == 2);

    // The shared scope keeps its first binding
    auto& lib_kit = registry.bind(lib, config, modules);
    CHECK(lib_kit.prefix == tmp.path() / "lib");
    CHECK(registry.size() == 3);
    CHECK(registry.find("builder")->prefix == tmp.path() / "app");
    CHECK(&registry.bind(app, config, modules) == &app_kit);
}

TEST_CASE("Dependencies can inject executables") {
    build_toolkit kit;
    CHECK_THROWS_AS(kit.get_executable("qmake"), setup_error);
    kit.executables.emplace("qmake", executable("/opt/qt/bin/qmake"));
    CHECK(kit.get_executable("qmake").name() == "/opt/qt/bin/qmake");
}

TEST_CASE("Make-like tools run in parallel unless told otherwise") {
    auto saved = hatch::getenv("HATCH_NO_PARALLEL_MAKE");
    hatch::unsetenv("HATCH_NO_PARALLEL_MAKE");

    make_executable make{"make", 8};
    make_executable::options opts;
    opts.jobs_env = "MAKE_JOBS";
    CHECK(make.make_args({"install"}, opts) == std::vector<std::string>{"-j8", "install"});
    CHECK(opts.run.extra_env["MAKE_JOBS"] == "8");

    make_executable::options serial{.parallel = false};
    CHECK(make.make_args({"install"}, serial) == std::vector<std::string>{"install"});

    make_executable::options defaults;
    CHECK(make_executable("make", 1).make_args({}, defaults).empty());

    hatch::setenv("HATCH_NO_PARALLEL_MAKE", "1");
    make_executable::options disabled;
    CHECK(make.make_args({"all"}, disabled) == std::vector<std::string>{"all"});

    if (saved) {
        hatch::setenv("HATCH_NO_PARALLEL_MAKE", *saved);
    } else {
        hatch::unsetenv("HATCH_NO_PARALLEL_MAKE");
    }
}
