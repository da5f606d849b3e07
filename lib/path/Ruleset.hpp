#pragma once

#include <string_view>

namespace lexpath::path {

/**
 * @brief Lexical conventions a path is interpreted under
 */
enum class Ruleset: unsigned {
    Unix,
    Windows
};

/**
 * @brief Unix rules: single '/' separator, no drive letters
 */
struct UnixRules {
    static constexpr Ruleset ruleset = Ruleset::Unix;
    static constexpr char separator = '/';

    [[nodiscard]] static constexpr bool isSeparator(char c) noexcept {
        return c == '/';
    }
};

/**
 * @brief Windows rules: '\' and '/' both separate, '\' is emitted
 */
struct WindowsRules {
    static constexpr Ruleset ruleset = Ruleset::Windows;
    static constexpr char separator = '\\';

    [[nodiscard]] static constexpr bool isSeparator(char c) noexcept {
        return c == '\\' || c == '/';
    }
};

[[nodiscard]] constexpr char separator(Ruleset ruleset) noexcept {
    return ruleset == Ruleset::Windows ? WindowsRules::separator : UnixRules::separator;
}

[[nodiscard]] constexpr bool isSeparator(char c, Ruleset ruleset) noexcept {
    return ruleset == Ruleset::Windows ? WindowsRules::isSeparator(c) : UnixRules::isSeparator(c);
}

[[nodiscard]] std::string_view name(Ruleset ruleset) noexcept;

}
