#pragma once

#include <algorithm>
#include <charconv>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>

namespace RollTftp::Meta {
    template <typename T>
    concept OctetKind = std::is_same_v<T, char> or std::is_same_v<T, unsigned char>;

    template <typename T>
    concept UnsignedKind = std::unsigned_integral<T> and not std::is_same_v<T, bool>;

    enum class NumberStatus {
        ok,
        overflow,
        not_numeric
    };

    template <UnsignedKind T>
    struct NumberResult {
        T value;
        NumberStatus status;
    };

    /// NOTE: Accepts only plain decimal digits, so signs, spaces, and hex prefixes are all `not_numeric`.
    template <UnsignedKind T>
    [[nodiscard]] NumberResult<T> parseDecimal(std::string_view text) noexcept {
        if (text.empty()) {
            return {0, NumberStatus::not_numeric};
        }

        T temp {};
        const auto* text_end = text.data() + text.size();
        const auto [stop_ptr, errc] = std::from_chars(text.data(), text_end, temp, 10);

        if (errc == std::errc::result_out_of_range) {
            return {0, NumberStatus::overflow};
        }

        if (errc != std::errc {} or stop_ptr != text_end) {
            return {0, NumberStatus::not_numeric};
        }

        return {temp, NumberStatus::ok};
    }

    [[nodiscard]] constexpr char toLowerAscii(char c) noexcept {
        return (c >= 'A' and c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    [[nodiscard]] inline std::string toLowerAscii(std::string_view text) {
        std::string temp {text};
        std::transform(temp.begin(), temp.end(), temp.begin(), [](char c) { return toLowerAscii(c); });

        return temp;
    }

    [[nodiscard]] constexpr bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
        if (lhs.length() != rhs.length()) {
            return false;
        }

        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
            return toLowerAscii(a) == toLowerAscii(b);
        });
    }

    /// NOTE: Printable ASCII passes through. Every other octet, and the backslash itself, becomes `\xNN`. Applied to peer-supplied text before it is logged.
    [[nodiscard]] inline std::string escapeForLog(std::string_view text) {
        constexpr std::string_view hex_digits = "0123456789abcdef";

        std::string temp;
        temp.reserve(text.size());

        for (const char c : text) {
            const auto octet = static_cast<unsigned char>(c);

            if (octet >= 0x20U and octet < 0x7fU and c != '\\') {
                temp += c;
                continue;
            }

            temp += "\\x";
            temp += hex_digits[octet >> 4];
            temp += hex_digits[octet & 0x0fU];
        }

        return temp;
    }
}
