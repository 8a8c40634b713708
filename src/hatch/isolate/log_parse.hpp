#pragma once

#include <hatch/util/fs/path.hpp>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

enum class log_event_kind {
    error,
    warning,
};

/**
 * @brief A line of a build log that looks like an error or a warning, with the lines around it.
 */
struct log_event {
    log_event_kind kind;
    /// The matching line, without trailing whitespace
    std::string text;
    /// One-based line number of the matching line
    int line_no = 0;

    std::vector<std::string> pre_context;
    std::vector<std::string> post_context;

    /// The first line number covered by the event
    int start() const noexcept { return line_no - static_cast<int>(pre_context.size()); }
    /// One past the last line number covered by the event
    int end() const noexcept { return line_no + static_cast<int>(post_context.size()) + 1; }

    /// The text of a line number in [start(), end())
    const std::string& line(int n) const noexcept;
};

struct log_events {
    std::vector<log_event> errors;
    std::vector<log_event> warnings;
};

/// Number of lines of context recorded before and after each event
inline constexpr int log_event_context = 6;

/**
 * @brief Determine whether a log line is an error, a warning, or neither.
 *
 * Uses the error and warning patterns CTest uses to scan build output.
 */
std::optional<log_event_kind> classify_log_line(std::string_view line) noexcept;

/**
 * @brief Scan the lines of a build log for errors and warnings.
 */
log_events parse_log_events(std::string_view content, int context = log_event_context);

/**
 * @brief Scan a build log file. A missing log has no events.
 */
log_events parse_log_file(path_ref log);

/**
 * @brief Render events as numbered log excerpts. Event lines are marked with ">>", and gaps
 * between events that do not overlap are marked with "...".
 */
std::string make_log_context(const std::vector<log_event>& events);

/**
 * @brief Write the errors found in a log or, if there are none, the warnings.
 *
 * @param kind The kind of log for the heading ("build" or "test")
 * @param last If given and non-zero, only show this many of the last events
 */
void write_log_summary(std::ostream&              out,
                       std::string_view           kind,
                       path_ref                   log,
                       std::optional<std::size_t> last = std::nullopt);

}  // namespace hatch
