#include "./modifications.hpp"

#include <hatch/util/env.hpp>

#include <catch2/catch.hpp>

using hatch::env_snapshot;
using hatch::environment_modifications;

TEST_CASE("The last set of a variable wins") {
    environment_modifications env;
    env.set("FOO", "first");
    env.set("FOO", "second");
    env_snapshot snap;
    env.apply_to(snap);
    CHECK(snap["FOO"] == "second");

    env.unset("FOO");
    env.apply_to(snap);
    CHECK_FALSE(snap.contains("FOO"));
    CHECK(env.is_unset("FOO"));
    CHECK_FALSE(env.is_unset("BAR"));
}

TEST_CASE("Prepended paths appear in reverse application order") {
    environment_modifications env;
    env.prepend_path("PATH", "/a/bin");
    env.prepend_path("PATH", "/b/bin");
    env.append_path("PATH", "/z/bin");
    env_snapshot snap{{"PATH", "/usr/bin:/bin"}};
    env.apply_to(snap);
    CHECK(snap["PATH"] == "/b/bin:/a/bin:/usr/bin:/bin:/z/bin");
}

TEST_CASE("Empty path elements are kept") {
    environment_modifications env;
    env.prepend_path("PATH", "/x/bin");
    env.remove_path("PATH", "/a/bin");
    env.append_path("MANPATH", "/x/man");
    env_snapshot snap{{"PATH", "/a/bin::/b/bin"}, {"MANPATH", "/usr/share/man:"}};
    env.apply_to(snap);
    CHECK(snap["PATH"] == "/x/bin::/b/bin");
    CHECK(snap["MANPATH"] == "/usr/share/man::/x/man");

    // An unset or empty variable has no elements at all
    environment_modifications fresh;
    fresh.append_path("PKG_CONFIG_PATH", "/x/lib/pkgconfig");
    env_snapshot empty{{"PKG_CONFIG_PATH", ""}};
    fresh.apply_to(empty);
    CHECK(empty["PKG_CONFIG_PATH"] == "/x/lib/pkgconfig");
}

TEST_CASE("Applying a ledger twice is the same as applying it once") {
    environment_modifications env;
    env.set("CC", "/wrappers/cc");
    env.unset("LD_LIBRARY_PATH");
    env.prepend_path("PATH", "/a/bin");
    env.prepend_path("PATH", "/b/bin");
    env.append_path("MANPATH", "/a/man");
    env.remove_path("PATH", "/opt/macports/bin");
    env.append_flags("CFLAGS", "-O2 -g");
    env.set_path("CMAKE_PREFIX_PATH", {"/a", "/b"});

    const env_snapshot baseline{
        {"PATH", "/opt/macports/bin:/usr/bin"},
        {"LD_LIBRARY_PATH", "/somewhere/lib"},
    };
    auto once = baseline;
    env.apply_to(once);
    auto twice = once;
    env.apply_to(twice);
    CHECK(once == twice);
    CHECK(once["PATH"] == "/b/bin:/a/bin:/usr/bin");
    CHECK(once["CFLAGS"] == "-O2 -g");
    CHECK(once["CMAKE_PREFIX_PATH"] == "/a:/b");
    CHECK_FALSE(once.contains("LD_LIBRARY_PATH"));
}

TEST_CASE("Flag operations") {
    environment_modifications env;
    env.append_flags("LDFLAGS", "-L/a");
    env.append_flags("LDFLAGS", "-L/b -L/c");
    env.remove_flags("LDFLAGS", "-L/b");
    env_snapshot snap;
    env.apply_to(snap);
    CHECK(snap["LDFLAGS"] == "-L/a -L/c");
}

TEST_CASE("System paths are moved to the back, duplicates pruned") {
    environment_modifications env;
    env.deprioritize_system_paths("PATH");
    env.prune_duplicate_paths("PATH");
    env_snapshot snap{{"PATH", "/usr/bin:/opt/x/bin:/bin:/opt/x/bin:/opt/y/bin"}};
    env.apply_to(snap);
    CHECK(snap["PATH"] == "/opt/x/bin:/opt/y/bin:/usr/bin:/bin");
}

TEST_CASE("Extending a ledger keeps insertion order") {
    environment_modifications first;
    first.set("X", "1");
    environment_modifications second;
    second.set("X", "2");
    second.prepend_path("P", "/q");
    first.extend(second);
    CHECK(first.size() == 3);
    env_snapshot snap;
    first.apply_to(snap);
    CHECK(snap["X"] == "2");
    CHECK(snap["P"] == "/q");
}

TEST_CASE("Validation flags late set/unset requests") {
    environment_modifications env;
    env.set_origin("dependency a");
    env.prepend_path("CPATH", "/a/include");
    env.set_origin("dependency b");
    env.unset("CPATH");
    env.set("SAFE", "1");
    auto warnings = env.validation_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK_THAT(warnings[0], Catch::Contains("'CPATH'"));
    CHECK_THAT(warnings[0], Catch::Contains("dependency a"));
    CHECK_THAT(warnings[0], Catch::Contains("dependency b"));
    int count = 0;
    hatch::validate(env, [&](std::string_view) { ++count; });
    CHECK(count == 1);
}

TEST_CASE("Apply to the live environment") {
    hatch::setenv("HATCH_TEST_LEDGER_A", "old");
    hatch::setenv("HATCH_TEST_LEDGER_B", "gone");
    environment_modifications env;
    env.set("HATCH_TEST_LEDGER_A", "new");
    env.unset("HATCH_TEST_LEDGER_B");
    env.prepend_path("HATCH_TEST_LEDGER_P", "/p1");
    env.prepend_path("HATCH_TEST_LEDGER_P", "/p2");

    auto script = env.shell_modifications();
    CHECK_THAT(script, Catch::Contains("export HATCH_TEST_LEDGER_A='new';"));
    CHECK_THAT(script, Catch::Contains("unset HATCH_TEST_LEDGER_B;"));
    CHECK_THAT(script, Catch::Contains("export HATCH_TEST_LEDGER_P='/p2:/p1';"));

    env.apply();
    CHECK(hatch::getenv("HATCH_TEST_LEDGER_A") == "new");
    CHECK_FALSE(hatch::getenv("HATCH_TEST_LEDGER_B").has_value());
    CHECK(hatch::getenv("HATCH_TEST_LEDGER_P") == "/p2:/p1");
    env.apply();
    CHECK(hatch::getenv("HATCH_TEST_LEDGER_P") == "/p2:/p1");

    hatch::unsetenv("HATCH_TEST_LEDGER_A");
    hatch::unsetenv("HATCH_TEST_LEDGER_P");
}
