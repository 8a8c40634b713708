#pragma once

#include <hatch/recipe/errors.hpp>

#include <string>
#include <vector>

namespace hatch {

/**
 * @brief Source lines around the deepest recipe frame of a failure, for display.
 *
 * Test helper frames are skipped, since failures in them are reported through the test output.
 * The first line names the location; the failing line is marked with ">>". Returns nothing if
 * there is no suitable frame.
 */
std::vector<std::string> get_package_context(const std::vector<recipe_frame>& frames,
                                             int                              context = 3);

}  // namespace hatch
