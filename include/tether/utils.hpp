#pragma once

#include <algorithm>
#include <charconv>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::utils {

    constexpr char char_tolower(char c) {
        if (c >= 'A' && c <= 'Z') {
            return c + ('a' - 'A');
        }
        return c;
    }

    constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
        return std::ranges::equal(
                lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
    }

    constexpr std::string_view trim_view(std::string_view value) {
        auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            return {};
        }
        auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, (last - first) + 1U);
    }

    namespace detail {
        template <typename T>
        concept arithmetic_type = std::integral<T> || std::floating_point<T>;
    }

    template <detail::arithmetic_type T>
    constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
        T value{};
        std::from_chars_result result;

        if constexpr (std::integral<T>) {
            result = std::from_chars(input.data(), input.data() + input.size(), value, base);
        }
        else {
            result = std::from_chars(input.data(), input.data() + input.size(), value);
        }

        if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
            return std::nullopt;
        }

        return {value};
    }

    // "KEY=VALUE" -> {KEY, VALUE}; the key must be non-empty, the value may be
    inline std::optional<std::pair<std::string, std::string>> split_assignment(std::string_view text) {
        auto eq = text.find('=');
        if (eq == std::string_view::npos || eq == 0U) {
            return std::nullopt;
        }
        return std::pair{std::string{text.substr(0, eq)}, std::string{text.substr(eq + 1U)}};
    }

    // first whitespace-delimited token and the trimmed remainder
    constexpr std::pair<std::string_view, std::string_view> split_first_token(std::string_view text) {
        auto trimmed = trim_view(text);
        auto end = trimmed.find_first_of(" \t");
        if (end == std::string_view::npos) {
            return {trimmed, {}};
        }
        return {trimmed.substr(0, end), trim_view(trimmed.substr(end))};
    }

    inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
        if (values.empty()) {
            return {};
        }
        return values | std::views::join_with(separator) | std::ranges::to<std::string>();
    }

    inline std::string truncate_for_display(std::string_view text, std::size_t limit = 200U) {
        if (text.size() <= limit) {
            return std::string{text};
        }
        std::string out{text.substr(0, limit)};
        out += "...";
        return out;
    }

}  // namespace tether::utils
