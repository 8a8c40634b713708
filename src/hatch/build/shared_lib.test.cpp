#include <hatch/build/shared_lib.hpp>

#include <hatch/error/errors.hpp>
#include <hatch/recipe/executable.hpp>
#include <hatch/util/algo.hpp>
#include <hatch/util/temp.hpp>

#include <catch2/catch.hpp>

#include <algorithm>

namespace {

bool has_arg(const std::vector<std::string>& args, std::string_view arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

}  // namespace

TEST_CASE("ELF platforms link with a soname") {
    auto plan = hatch::plan_static_to_shared("linux-ubuntu20.04-x86_64",
                                             "/build/libfoo.a",
                                             {.version = "1.2.3", .compat_version = "1"});
    CHECK(plan.args
          == std::vector<std::string>{
              "-shared",
              "-Wl,-soname,libfoo.so.1",
              "-Wl,--whole-archive",
              "/build/libfoo.a",
              "-Wl,--no-whole-archive",
              "-o",
              "/build/libfoo.so.1.2.3",
          });
    CHECK(plan.output == hatch::fs::path("/build/libfoo.so.1.2.3"));
    REQUIRE(plan.symlinks.size() == 2);
    CHECK(plan.symlinks[0].first == hatch::fs::path("/build/libfoo.so"));
    CHECK(plan.symlinks[0].second == hatch::fs::path("libfoo.so.1.2.3"));
    CHECK(plan.symlinks[1].first == hatch::fs::path("/build/libfoo.so.1"));
}

TEST_CASE("Cray platforms are ELF platforms") {
    auto plan = hatch::plan_static_to_shared("cray-cnl7-haswell", "/build/libfoo.a", {});
    CHECK(has_arg(plan.args, "-shared"));
    CHECK(has_arg(plan.args, "-Wl,-soname,libfoo.so"));
    CHECK(plan.symlinks.empty());
}

TEST_CASE("The object format decides the library suffix and flags") {
    CHECK(hatch::dso_suffix("darwin-monterey-aarch64") == "dylib");
    CHECK(hatch::dso_suffix("cray-cnl7-haswell") == "so");
    CHECK(hatch::dso_suffix("linux-rhel8-x86_64") == "so");

    // Without a known object format only the output is named
    auto plan = hatch::plan_static_to_shared("windows-10-x86_64", "C:/build/foo.a", {});
    CHECK(plan.args == std::vector<std::string>{"-o", "C:/build/foo.so"});
}

TEST_CASE("Mach-O platforms link with an install name") {
    auto plan = hatch::plan_static_to_shared("darwin-catalina-x86_64",
                                             "/build/libfoo.a",
                                             {.arguments      = {"-lz"},
                                              .version        = "2.0.0",
                                              .compat_version = "2"});
    CHECK(plan.args
          == std::vector<std::string>{
              "-dynamiclib",
              "-install_name",
              "/build/libfoo.dylib.2",
              "-Wl,-force_load,/build/libfoo.a",
              "-compatibility_version",
              "2",
              "-current_version",
              "2.0.0",
              "-lz",
              "-o",
              "/build/libfoo.dylib.2.0.0",
          });
    REQUIRE(plan.symlinks.size() == 2);
    CHECK(plan.symlinks[0].first == hatch::fs::path("/build/libfoo.dylib"));
    CHECK(plan.symlinks[1].first == hatch::fs::path("/build/libfoo.dylib.2"));
    CHECK(plan.symlinks[1].second == hatch::fs::path("libfoo.dylib.2.0.0"));
}

TEST_CASE("A compat version equal to the version adds one link") {
    auto plan = hatch::plan_static_to_shared("linux-rhel8-x86_64",
                                             "/build/libfoo.a",
                                             {.shared_lib = "/out/libbar.so", .version = "3"});
    CHECK(plan.output == hatch::fs::path("/out/libbar.so.3"));
    CHECK(has_arg(plan.args, "-Wl,-soname,libbar.so.3"));
    REQUIRE(plan.symlinks.size() == 1);
    CHECK(plan.symlinks[0].first == hatch::fs::path("/out/libbar.so"));
}

TEST_CASE("Convert a library with a stand-in compiler") {
    auto tdir = hatch::temporary_dir::create();
    auto lib  = tdir.path() / "libfoo.a";
    hatch::executable compiler{"true"};
    auto res = hatch::static_to_shared_library("linux-ubuntu20.04-x86_64",
                                               compiler,
                                               lib,
                                               {.version = "1.2.3", .compat_version = "1"});
    CHECK(res.okay());
    CHECK(hatch::fs::is_symlink(tdir.path() / "libfoo.so"));
    CHECK(hatch::fs::read_symlink(tdir.path() / "libfoo.so") == "libfoo.so.1.2.3");
    CHECK(hatch::fs::read_symlink(tdir.path() / "libfoo.so.1") == "libfoo.so.1.2.3");
}

TEST_CASE("Compiler failures propagate") {
    auto              tdir = hatch::temporary_dir::create();
    hatch::executable compiler{"false"};
    CHECK_THROWS_AS(hatch::static_to_shared_library("linux-ubuntu20.04-x86_64",
                                                    compiler,
                                                    tdir.path() / "libfoo.a"),
                    hatch::process_error);
}
