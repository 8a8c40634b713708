#include "./preserve.hpp"

#include <hatch/util/env.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Preserved variables survive modification") {
    hatch::setenv("HATCH_TEST_PRESERVE_CC", "/usr/bin/gcc");
    hatch::unsetenv("HATCH_TEST_PRESERVE_FC");
    {
        hatch::preserve_environment keep{"HATCH_TEST_PRESERVE_CC", "HATCH_TEST_PRESERVE_FC"};
        hatch::setenv("HATCH_TEST_PRESERVE_CC", "/opt/module/bin/cc");
        hatch::setenv("HATCH_TEST_PRESERVE_FC", "/opt/module/bin/fc");
    }
    CHECK(hatch::getenv("HATCH_TEST_PRESERVE_CC") == "/usr/bin/gcc");
    CHECK_FALSE(hatch::getenv("HATCH_TEST_PRESERVE_FC").has_value());
    hatch::unsetenv("HATCH_TEST_PRESERVE_CC");
}
