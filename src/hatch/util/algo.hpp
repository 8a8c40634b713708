#pragma once

#include <algorithm>
#include <initializer_list>
#include <set>

namespace hatch {

template <typename Container, typename Predicate>
void erase_if(Container& c, Predicate&& p) {
    auto erase_point = std::remove_if(c.begin(), c.end(), p);
    c.erase(erase_point, c.end());
}

template <typename Container, typename Iter>
void extend(Container& c, Iter iter, Iter end) requires requires {
    c.insert(c.end(), iter, end);
}
{ c.insert(c.end(), iter, end); }

template <typename Container, typename Other>
void extend(Container& c, Other&& o) {
    extend(c, o.begin(), o.end());
}

template <typename Container, typename Item>
void extend(Container& c, std::initializer_list<Item> il) {
    c.insert(c.end(), il.begin(), il.end());
}

/**
 * @brief Remove repeated elements from the container, keeping the first occurrence of each.
 * The repeats need not be adjacent.
 */
template <typename Container>
void dedupe(Container& c) {
    std::set<typename Container::value_type> seen;
    erase_if(c, [&](const auto& item) { return !seen.insert(item).second; });
}

}  // namespace hatch
