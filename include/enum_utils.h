#pragma once

#include <cctype>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <string>
#include <string_view>

// Enum <-> config string conversion using magic_enum.
// Config strings are the snake_case form of the enumerator name.

namespace enum_utils {

// e.g., "PerTrajectory" -> "per_trajectory"
inline std::string toSnakeCase(std::string_view pascal) {
    std::string result;
    result.reserve(pascal.size() + 4);

    for (size_t i = 0; i < pascal.size(); ++i) {
        auto c = static_cast<unsigned char>(pascal[i]);
        if (std::isupper(c) && i > 0) {
            result += '_';
        }
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

template <typename E>
std::string toString(E value) {
    return toSnakeCase(magic_enum::enum_name(value));
}

// Accepts snake_case or the enumerator name in any case
template <typename E>
std::optional<E> fromString(std::string_view str) {
    std::string compact;
    for (char c : str) {
        if (c != '_') {
            compact += c;
        }
    }
    return magic_enum::enum_cast<E>(compact, magic_enum::case_insensitive);
}

// "a|b|c" list of accepted strings (for usage and warnings)
template <typename E>
std::string choices() {
    std::string result;
    for (auto value : magic_enum::enum_values<E>()) {
        if (!result.empty()) {
            result += '|';
        }
        result += toString(value);
    }
    return result;
}

} // namespace enum_utils
