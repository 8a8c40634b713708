#include "./log_parse.hpp"

#include <hatch/util/fs/io.hpp>
#include <hatch/util/string.hpp>

#include <ctre.hpp>
#include <fmt/format.h>
#include <neo/ufmt.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <ostream>
#include <set>

using namespace hatch;

namespace {

template <ctll::fixed_string... Patterns>
bool search_any(std::string_view line) noexcept {
    return (static_cast<bool>(ctre::search<Patterns>(line)) || ...);
}

bool is_error_line(std::string_view line) noexcept {
    return search_any<"^[Bb]us [Ee]rror",
                      "^[Ss]egmentation [Vv]iolation",
                      "^[Ss]egmentation [Ff]ault",
                      ":.*[Pp]ermission [Dd]enied",
                      "[^ :]:[0-9]+: [^ \t]",
                      "[^:]: error[ \t]*[0-9]+[ \t]*:",
                      "^Error ([0-9]+):",
                      "^Fatal",
                      "^[Ee]rror: ",
                      "^Error ",
                      "[0-9] ERROR: ",
                      "^\"[^\"]+\", line [0-9]+: [^Ww]",
                      "^cc[^C]*CC: ERROR File = ([^,]+), Line = ([0-9]+)",
                      "^ld([^:])*:([ \t])*ERROR([^:])*:",
                      "^ild:([ \t])*\\(undefined symbol\\)",
                      "[^ :] : (error|fatal error|catastrophic error)",
                      "[^:]: (Error:|error|undefined reference|multiply defined)",
                      "[^:]\\([^\\)]+\\) ?: (error|fatal error|catastrophic error)",
                      "^fatal error C[0-9]+:",
                      ": syntax error ",
                      "^collect2: ld returned 1 exit status",
                      "ld terminated with signal",
                      "Unsatisfied symbol",
                      "^Unresolved:",
                      "Undefined symbol",
                      "^Undefined[ \t]+first referenced",
                      "^CMake Error",
                      ":[ \t]cannot find",
                      ":[ \t]can't find",
                      ": \\*\\*\\* No rule to make target [`'].*'.  Stop",
                      ": \\*\\*\\* No targets specified and no makefile found",
                      ": Invalid loader fixup for symbol",
                      ": Invalid fixups exist",
                      ": Can't find library for",
                      ": internal link edit command failed",
                      ": Unrecognized option [`'].*'",
                      "\", line [0-9]+\\.[0-9]+: [0-9]+-[0-9]+ \\([^WI]\\)",
                      "ld: 0706-006 Cannot find or open library file: -l ",
                      "ild: \\(argument error\\) can't find library argument ::",
                      "^could not be found and will not be loaded.",
                      "s:616 string too big",
                      "make: Fatal error: ",
                      "ld: 0711-993 Error occurred while writing to the output file:",
                      "ld: fatal: ",
                      "final link failed:",
                      "make: \\*\\*\\*.*Error",
                      "make\\[.*\\]: \\*\\*\\*.*Error",
                      "\\*\\*\\* Error code",
                      "nternal error:",
                      "Makefile:[0-9]+: \\*\\*\\* .*  Stop\\.",
                      ": No such file or directory",
                      ": Invalid argument",
                      "^The project cannot be built\\.",
                      "^\\[ERROR\\]",
                      "^Command .* failed with exit code">(line);
}

bool is_error_exception(std::string_view line) noexcept {
    return search_any<"instantiated from ",
                      "candidates are:",
                      ": warning",
                      ": WARNING",
                      ": \\(Warning\\)",
                      ": note",
                      "    ok",
                      "Note:",
                      "makefile:",
                      "Makefile:",
                      ":[ \t]+Where:",
                      "[^ :]:[0-9]+: Warning",
                      "------ Build started: .* ------">(line);
}

bool is_warning_line(std::string_view line) noexcept {
    return search_any<"[^ :]:[0-9]+: warning:",
                      "[^ :]:[0-9]+: note:",
                      "^cc[^C]*CC: WARNING File = ([^,]+), Line = ([0-9]+)",
                      "^ld([^:])*:([ \t])*WARNING([^:])*:",
                      "[^:]: warning [0-9]+:",
                      "^\"[^\"]+\", line [0-9]+: [Ww](arning|ARNING)",
                      "[^:]: warning[ \t]*[0-9]+[ \t]*:",
                      "^(Warning|Warnung) ([0-9]+):",
                      "^(Warning|Warnung)[ :]",
                      "WARNING: ",
                      "[^ :] : warning",
                      "[^:]: warning",
                      "\", line [0-9]+\\.[0-9]+: [0-9]+-[0-9]+ \\([WI]\\)",
                      "^cxx: Warning:",
                      "file: .* has no symbols",
                      "[^ :]:[0-9]+: (Warning|Warnung)",
                      "\\([0-9]*\\): remark #[0-9]*",
                      "\".*\", line [0-9]+: remark\\([0-9]*\\):",
                      "cc-[0-9]* CC: REMARK File = .*, Line = [0-9]*",
                      "^CMake Warning",
                      "^\\[WARNING\\]">(line);
}

bool is_warning_exception(std::string_view line) noexcept {
    return search_any<"/usr/.*/X11/Xlib\\.h:[0-9]+: war.*: ANSI C\\+\\+ forbids declaration",
                      "/usr/.*/X11/Xutil\\.h:[0-9]+: war.*: ANSI C\\+\\+ forbids declaration",
                      "/usr/.*/X11/XResource\\.h:[0-9]+: war.*: ANSI C\\+\\+ forbids declaration",
                      "WARNING 84 :",
                      "WARNING 47 :",
                      "makefile:",
                      "Makefile:",
                      "warning:  Clock skew detected.  Your build may be incomplete.",
                      "/usr/openwin/include/GL/[^:]+:",
                      "bind_at_load",
                      "XrmQGetResource",
                      "IceFlush",
                      "warning LNK4089: all references to [^ \t]+ deleted by /OPT:REF",
                      "ld32: WARNING 85: .* defined, but not used",
                      "warning D4025 : overriding '/W[1-4]' with '/W[1-4]'",
                      "warning LNK4221: .*",
                      "warning LNK4099: .*",
                      "warning LNK4098: .*",
                      "^.*\\.jar: warning: .*">(line);
}

std::string rstrip(std::string_view s) {
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(0, end == s.npos ? 0 : end + 1));
}

std::string plural(std::size_t n, std::string_view noun) {
    return neo::ufmt("{} {}{}", n, noun, n == 1 ? "" : "s");
}

}  // namespace

const std::string& log_event::line(int n) const noexcept {
    auto index = static_cast<std::size_t>(n - start());
    if (index < pre_context.size()) {
        return pre_context[index];
    }
    index -= pre_context.size();
    if (index == 0) {
        return text;
    }
    return post_context[index - 1];
}

std::optional<log_event_kind> hatch::classify_log_line(std::string_view line) noexcept {
    if (is_error_line(line) && !is_error_exception(line)) {
        return log_event_kind::error;
    }
    if (is_warning_line(line) && !is_warning_exception(line)) {
        return log_event_kind::warning;
    }
    return std::nullopt;
}

log_events hatch::parse_log_events(std::string_view content, int context) {
    auto lines = split(content, "\n");
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    log_events ret;
    const auto n_lines = static_cast<int>(lines.size());
    for (int i = 0; i < n_lines; ++i) {
        auto kind = classify_log_line(lines[i]);
        if (!kind) {
            continue;
        }
        log_event ev{.kind = *kind, .text = rstrip(lines[i]), .line_no = i + 1};
        for (int pre = std::max(0, i - context); pre < i; ++pre) {
            ev.pre_context.push_back(rstrip(lines[pre]));
        }
        for (int post = i + 1; post < std::min(n_lines, i + context + 1); ++post) {
            ev.post_context.push_back(rstrip(lines[post]));
        }
        auto& dest = *kind == log_event_kind::error ? ret.errors : ret.warnings;
        dest.push_back(std::move(ev));
    }
    return ret;
}

log_events hatch::parse_log_file(path_ref log) {
    if (!fs::is_regular_file(log)) {
        return {};
    }
    return parse_log_events(read_file(log));
}

std::string hatch::make_log_context(const std::vector<log_event>& events_) {
    auto events = events_;
    std::sort(events.begin(), events.end(), [](auto& l, auto& r) { return l.line_no < r.line_no; });

    auto event_lines = events | ranges::views::transform(&log_event::line_no)
        | ranges::to<std::set<int>>();
    const auto max_line  = event_lines.empty() ? 0 : *event_lines.rbegin();
    const auto num_width = std::to_string(max_line).size() + 4;

    std::string out;
    int         next_line = 1;
    for (auto& ev : events) {
        auto start = ev.start();
        if (next_line != 1 && start > next_line) {
            out += "\n     ...\n\n";
        }
        start = std::max(start, next_line);
        for (auto i = start; i < ev.end(); ++i) {
            auto numbered = fmt::format("{:<{}}{}", i, num_width, ev.line(i));
            if (event_lines.contains(i)) {
                out += "  >> " + numbered + "\n";
            } else {
                out += "     " + numbered + "\n";
            }
        }
        next_line = std::max(next_line, ev.end());
    }
    return out;
}

void hatch::write_log_summary(std::ostream&              out,
                              std::string_view           kind,
                              path_ref                   log,
                              std::optional<std::size_t> last) {
    auto events = parse_log_file(log);

    auto show = [&](std::vector<log_event>& evs, std::string_view noun) {
        if (last && *last != 0 && evs.size() > *last) {
            evs.erase(evs.begin(), evs.end() - static_cast<std::ptrdiff_t>(*last));
        }
        out << "\n" << plural(evs.size(), noun) << " found in " << kind << " log:\n";
        out << make_log_context(evs);
    };

    if (!events.errors.empty()) {
        show(events.errors, "error");
    } else if (!events.warnings.empty()) {
        show(events.warnings, "warning");
    }
}
