#include "./context.hpp"

#include <hatch/util/fs/io.hpp>
#include <hatch/util/log.hpp>
#include <hatch/util/string.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

using namespace hatch;

std::vector<std::string> hatch::get_package_context(const std::vector<recipe_frame>& frames,
                                                    int                              context) {
    auto frame = std::find_if(frames.begin(), frames.end(), [](auto& f) { return !f.test_helper; });
    if (frame == frames.end()) {
        return {};
    }

    std::vector<std::string> lines;
    lines.push_back(fmt::format("{}:{}, in {}:", frame->file, frame->line, frame->function));

    std::error_code ec;
    if (!fs::is_regular_file(frame->file, ec)) {
        hatch_log(debug, "Source of recipe frame is not available: {}", frame->file);
        return lines;
    }

    auto source = split(read_file(frame->file), "\n");
    if (!source.empty() && source.back().empty()) {
        source.pop_back();
    }
    auto first  = std::max(1, frame->line - context);
    auto last   = std::min(static_cast<int>(source.size()), frame->line + context);
    for (auto n = first; n <= last; ++n) {
        auto mark = n == frame->line ? ">> " : "   ";
        auto text = source[static_cast<std::size_t>(n - 1)];
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.pop_back();
        }
        lines.push_back(fmt::format("  {}{:>6}{}", mark, n, text));
    }
    return lines;
}
