#pragma once

#include <deque>
#include <string_view>

namespace lexpath::util {

/**
 * @brief Split string on every character for which isDelim returns true
 * @param str - string to split
 * @param isDelim - delimiter predicate
 * @param skipEmptyParts - drop parts produced by adjacent, leading or trailing delimiters
 * @return views into str
 */
template <typename Pred>
[[nodiscard]] std::deque<std::string_view> split(std::string_view str, Pred&& isDelim, bool skipEmptyParts = true) {
    std::deque<std::string_view> tokens;
    std::string_view::size_type l = 0, r = 0;

    for (auto c : str) {
        if (!isDelim(c)) {
            ++r;
            continue;
        }

        if (r - l > 0 || !skipEmptyParts)
            tokens.emplace_back(str.substr(l, r - l));

        l = ++r;
    }

    if (r - l > 0 || !skipEmptyParts)
        tokens.emplace_back(str.substr(l, r - l));

    return tokens;
}

}
