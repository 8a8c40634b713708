#pragma once

#include <hatch/error/on_error.hpp>

#include <boost/leaf/on_error.hpp>

#include <filesystem>
#include <source_location>
#include <string>
#include <vector>

namespace hatch {

/**
 * @brief A recipe could not report any libraries (non-fatal)
 */
struct e_no_libraries {
    std::string value;
};

/**
 * @brief A recipe could not report any headers (non-fatal)
 */
struct e_no_headers {
    std::string value;
};

/**
 * @brief A location in recipe code that was active when an error was raised.
 */
struct recipe_frame {
    std::string file;
    int         line = 0;
    std::string function;
    /// Frames of test helpers. Errors in these are shown through the test output instead.
    bool test_helper = false;

    static recipe_frame here(std::source_location loc     = std::source_location::current(),
                             bool                 helper  = false) {
        return recipe_frame{loc.file_name(), static_cast<int>(loc.line()), loc.function_name(),
                            helper};
    }
};

/**
 * @brief The recipe frames that were unwound by an error, innermost first.
 */
struct e_recipe_trace {
    std::vector<recipe_frame> value;
};

}  // namespace hatch

/**
 * @brief Record the enclosing function as a recipe frame on any error that leaves the current
 * scope.
 */
#define HATCH_RECIPE_FRAME()                                                                       \
    auto NEO_CONCAT(_recipe_frame_, __LINE__)                                                      \
        = ::boost::leaf::on_error([_frame = ::hatch::recipe_frame::here()](                        \
                                      ::hatch::e_recipe_trace& trace) {                            \
              trace.value.push_back(_frame);                                                       \
          })

/**
 * @brief Like HATCH_RECIPE_FRAME, but marks the frame as a test helper.
 */
#define HATCH_TEST_HELPER_FRAME()                                                                  \
    auto NEO_CONCAT(_recipe_frame_, __LINE__)                                                      \
        = ::boost::leaf::on_error(                                                                 \
            [_frame = ::hatch::recipe_frame::here(std::source_location::current(), true)](         \
                ::hatch::e_recipe_trace& trace) { trace.value.push_back(_frame); })
