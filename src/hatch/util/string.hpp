#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace hatch {

inline namespace string_utils {

inline std::string_view sview(std::string_view::const_iterator beg,
                              std::string_view::const_iterator end) {
    return std::string_view(&*beg, static_cast<std::size_t>(std::distance(beg, end)));
}

inline std::string_view trim(std::string_view s) {
    auto iter = s.begin();
    auto end  = s.end();
    while (iter != end && std::isspace(static_cast<unsigned char>(*iter))) {
        ++iter;
    }
    auto riter = s.rbegin();
    auto rend  = std::make_reverse_iterator(iter);
    while (riter != rend && std::isspace(static_cast<unsigned char>(*riter))) {
        ++riter;
    }
    auto new_end = riter.base();
    if (iter == new_end) {
        return {};
    }
    return sview(iter, new_end);
}

inline bool ends_with(std::string_view s, std::string_view key) { return s.ends_with(key); }

inline bool starts_with(std::string_view s, std::string_view key) { return s.starts_with(key); }

inline bool contains(std::string_view s, std::string_view key) { return s.find(key) != s.npos; }

inline std::vector<std::string> split(std::string_view str, std::string_view sep) {
    std::vector<std::string>    ret;
    std::string_view::size_type prev_pos = 0;
    auto                        pos      = prev_pos;
    while ((pos = str.find(sep, prev_pos)) != str.npos) {
        ret.emplace_back(str.substr(prev_pos, pos - prev_pos));
        prev_pos = pos + sep.length();
    }
    ret.emplace_back(str.substr(prev_pos));
    return ret;
}

/**
 * @brief Split a path-list variable value (e.g. PATH) into its elements. Empty elements are
 * dropped, and an empty string yields an empty list.
 */
inline std::vector<std::string> split_path_list(std::string_view str, char sep = ':') {
    std::vector<std::string> ret;
    for (auto& part : split(str, std::string_view(&sep, 1))) {
        if (!part.empty()) {
            ret.push_back(std::move(part));
        }
    }
    return ret;
}

template <typename Range>
std::string joinstr(std::string_view joiner, const Range& rng) {
    std::string ret;
    auto        iter = std::begin(rng);
    auto        stop = std::end(rng);
    while (iter != stop) {
        ret.append(std::string_view(*iter));
        ++iter;
        if (iter != stop) {
            ret.append(joiner);
        }
    }
    return ret;
}

inline std::string replace(std::string_view str, std::string_view key, std::string_view repl) {
    std::string                 ret;
    std::string_view::size_type pos      = 0;
    std::string_view::size_type prev_pos = 0;
    while (pos = str.find(key, pos), pos != key.npos) {
        ret.append(str.begin() + prev_pos, str.begin() + pos);
        ret.append(repl);
        prev_pos = pos += key.size();
    }
    ret.append(str.begin() + prev_pos, str.end());
    return ret;
}

}  // namespace string_utils

}  // namespace hatch
