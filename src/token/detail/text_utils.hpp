#pragma once

/// @file text_utils.hpp
/// @brief Internal text helpers: case folding, percent/form encoding,
/// generalized time, integer parsing.

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace otpm::token::detail {

[[nodiscard]] inline std::string toLower(std::string_view in) {
    std::string out(in.size(), '\0');
    std::transform(in.begin(), in.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] inline std::string toUpper(std::string_view in) {
    std::string out(in.size(), '\0');
    std::transform(in.begin(), in.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

[[nodiscard]] inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

// =============================================================================
// Percent encoding (RFC 3986)
// =============================================================================

/// Characters never escaped: ALPHA / DIGIT / "-" / "." / "_" / "~".
[[nodiscard]] inline bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

/// Percent-encode @p in, leaving unreserved characters and any character in
/// @p safe untouched. Hex digits are uppercase.
[[nodiscard]] inline std::string percentEncode(std::string_view in, std::string_view safe = "/") {
    static constexpr char hexChars[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size() * 3);
    for (char ch : in) {
        auto c = static_cast<unsigned char>(ch);
        if (isUnreserved(c) || safe.find(ch) != std::string_view::npos) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hexChars[(c >> 4) & 0x0F]);
            out.push_back(hexChars[c & 0x0F]);
        }
    }
    return out;
}

/// application/x-www-form-urlencoded component: space becomes '+', nothing
/// else outside the unreserved set survives unescaped.
[[nodiscard]] inline std::string formEncodeComponent(std::string_view in) {
    std::string out;
    out.reserve(in.size() * 3);
    std::size_t start = 0;
    for (std::size_t i = 0; i <= in.size(); ++i) {
        if (i == in.size() || in[i] == ' ') {
            out += percentEncode(in.substr(start, i - start), "");
            if (i < in.size()) {
                out.push_back('+');
            }
            start = i + 1;
        }
    }
    return out;
}

/// Encode ordered key/value pairs as a form body, preserving order.
[[nodiscard]] inline std::string formEncode(
    const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += formEncodeComponent(key);
        out.push_back('=');
        out += formEncodeComponent(value);
    }
    return out;
}

// =============================================================================
// Integers
// =============================================================================

[[nodiscard]] inline std::optional<int64_t> parseInt(std::string_view text) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

// =============================================================================
// Generalized time (YYYYMMDDHHMMSSZ, UTC)
// =============================================================================

[[nodiscard]] inline std::string formatGeneralizedTime(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto secs = floor<seconds>(tp);
    auto day = floor<days>(secs);
    year_month_day ymd{day};
    hh_mm_ss hms{secs - day};

    char buf[16];
    auto put = [&buf](int offset, int width, long long value) {
        for (int i = width - 1; i >= 0; --i) {
            buf[offset + i] = static_cast<char>('0' + value % 10);
            value /= 10;
        }
    };
    put(0, 4, static_cast<int>(ymd.year()));
    put(4, 2, static_cast<unsigned>(ymd.month()));
    put(6, 2, static_cast<unsigned>(ymd.day()));
    put(8, 2, hms.hours().count());
    put(10, 2, hms.minutes().count());
    put(12, 2, hms.seconds().count());
    buf[14] = 'Z';
    return std::string(buf, 15);
}

[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point> parseGeneralizedTime(
    std::string_view text) {
    using namespace std::chrono;
    if (text.size() != 15 || text.back() != 'Z') {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < 14; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    auto field = [&text](std::size_t offset, std::size_t width) {
        return parseInt(text.substr(offset, width));
    };
    auto y = field(0, 4);
    auto mo = field(4, 2);
    auto d = field(6, 2);
    auto h = field(8, 2);
    auto mi = field(10, 2);
    auto s = field(12, 2);
    if (!y || !mo || !d || !h || !mi || !s || *h > 23 || *mi > 59 || *s > 60) {
        return std::nullopt;
    }
    year_month_day ymd{year{static_cast<int>(*y)}, month{static_cast<unsigned>(*mo)},
                       day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return time_point_cast<system_clock::duration>(
        sys_days{ymd} + hours{*h} + minutes{*mi} + seconds{*s});
}

}  // namespace otpm::token::detail
