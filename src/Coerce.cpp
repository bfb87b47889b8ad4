/**
 * @file Coerce.cpp
 * @brief Implementation of typed text parsing
 */

#include "envflag/Coerce.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>

namespace envflag {

namespace {
    constexpr std::uint64_t kInt64Limit = std::uint64_t{1} << 63;

    bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    /**
     * @brief Accumulate base-10 digits; false on empty input, junk or overflow
     */
    bool parse_digits(const std::string& text, size_t pos, std::uint64_t& out) {
        if (pos >= text.size()) return false;
        const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
        std::uint64_t value = 0;
        for (; pos < text.size(); ++pos) {
            if (!is_digit(text[pos])) return false;
            const std::uint64_t digit = static_cast<std::uint64_t>(text[pos] - '0');
            if (value > (max - digit) / 10) return false;
            value = value * 10 + digit;
        }
        out = value;
        return true;
    }

    const std::map<std::string, std::uint64_t>& duration_units() {
        static const std::map<std::string, std::uint64_t> units = {
            {"ns", 1ULL},
            {"us", 1000ULL},
            {"\xC2\xB5s", 1000ULL},  // U+00B5 micro sign
            {"\xCE\xBCs", 1000ULL},  // U+03BC greek small letter mu
            {"ms", 1000ULL * 1000},
            {"s", 1000ULL * 1000 * 1000},
            {"m", 60ULL * 1000 * 1000 * 1000},
            {"h", 3600ULL * 1000 * 1000 * 1000},
        };
        return units;
    }

    // Integer part of one duration component. Stops at the first non-digit.
    bool leading_int(const std::string& s, size_t& pos, std::uint64_t& out) {
        std::uint64_t x = 0;
        for (; pos < s.size() && is_digit(s[pos]); ++pos) {
            if (x > kInt64Limit / 10) return false;
            x = x * 10 + static_cast<std::uint64_t>(s[pos] - '0');
            if (x > kInt64Limit) return false;
        }
        out = x;
        return true;
    }

    // Fraction digits after '.'; digits beyond 64-bit precision are dropped.
    void leading_fraction(const std::string& s, size_t& pos,
                          std::uint64_t& out, double& scale) {
        std::uint64_t x = 0;
        scale = 1;
        bool overflow = false;
        for (; pos < s.size() && is_digit(s[pos]); ++pos) {
            if (overflow) continue;
            if (x > (kInt64Limit - 1) / 10) {
                overflow = true;
                continue;
            }
            const std::uint64_t y = x * 10 + static_cast<std::uint64_t>(s[pos] - '0');
            if (y > kInt64Limit) {
                overflow = true;
                continue;
            }
            x = y;
            scale *= 10;
        }
        out = x;
    }

    // Writes v / 10^prec as ".digits" in front of buf, dropping trailing
    // zeros; returns v / 10^prec.
    std::uint64_t format_fraction(std::string& buf, std::uint64_t v, int prec) {
        bool print = false;
        for (int i = 0; i < prec; ++i) {
            const auto digit = static_cast<char>(v % 10);
            print = print || digit != 0;
            if (print) buf.insert(buf.begin(), static_cast<char>('0' + digit));
            v /= 10;
        }
        if (print) buf.insert(buf.begin(), '.');
        return v;
    }

    void format_int(std::string& buf, std::uint64_t v) {
        buf.insert(0, std::to_string(v));
    }
}

std::optional<bool> parse_bool(const std::string& text) {
    if (text == "1" || text == "t" || text == "T" ||
        text == "TRUE" || text == "true" || text == "True") {
        return true;
    }
    if (text == "0" || text == "f" || text == "F" ||
        text == "FALSE" || text == "false" || text == "False") {
        return false;
    }
    return std::nullopt;
}

std::optional<std::int64_t> parse_int64(const std::string& text) {
    if (text.empty()) return std::nullopt;

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }

    std::uint64_t magnitude = 0;
    if (!parse_digits(text, pos, magnitude)) return std::nullopt;

    if (negative) {
        if (magnitude > kInt64Limit) return std::nullopt;
        if (magnitude == kInt64Limit) return std::numeric_limits<std::int64_t>::min();
        return -static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > kInt64Limit - 1) return std::nullopt;
    return static_cast<std::int64_t>(magnitude);
}

std::optional<std::uint64_t> parse_uint64(const std::string& text) {
    size_t pos = (!text.empty() && text[0] == '+') ? 1 : 0;
    std::uint64_t value = 0;
    if (!parse_digits(text, pos, value)) return std::nullopt;
    return value;
}

std::optional<double> parse_double(const std::string& text) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }
    // strtod also reads hexadecimal floats; only decimal text is a flag value.
    const size_t mantissa = (text[0] == '+' || text[0] == '-') ? 1 : 0;
    if (text.size() > mantissa + 1 && text[mantissa] == '0' &&
        (text[mantissa + 1] == 'x' || text[mantissa + 1] == 'X')) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return std::nullopt;
    if (errno == ERANGE && std::isinf(value)) return std::nullopt;
    return value;
}

std::optional<Duration> parse_duration(const std::string& text) {
    const std::string& s = text;
    size_t pos = 0;
    bool negative = false;

    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = s[0] == '-';
        pos = 1;
    }
    if (s.compare(pos, std::string::npos, "0") == 0) return Duration::zero();
    if (pos >= s.size()) return std::nullopt;

    std::uint64_t total = 0;
    while (pos < s.size()) {
        if (!(s[pos] == '.' || is_digit(s[pos]))) return std::nullopt;

        std::uint64_t v = 0;
        std::uint64_t f = 0;
        double scale = 1;

        const size_t int_start = pos;
        if (!leading_int(s, pos, v)) return std::nullopt;
        const bool pre = pos != int_start;

        bool post = false;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            const size_t frac_start = pos;
            leading_fraction(s, pos, f, scale);
            post = pos != frac_start;
        }
        if (!pre && !post) return std::nullopt;

        const size_t unit_start = pos;
        while (pos < s.size() && s[pos] != '.' && !is_digit(s[pos])) ++pos;
        if (pos == unit_start) return std::nullopt;

        const auto& units = duration_units();
        auto it = units.find(s.substr(unit_start, pos - unit_start));
        if (it == units.end()) return std::nullopt;
        const std::uint64_t unit = it->second;

        if (v > kInt64Limit / unit) return std::nullopt;
        v *= unit;
        if (f > 0) {
            v += static_cast<std::uint64_t>(static_cast<double>(f) *
                                            (static_cast<double>(unit) / scale));
            if (v > kInt64Limit) return std::nullopt;
        }
        total += v;
        if (total > kInt64Limit) return std::nullopt;
    }

    if (negative) {
        if (total == kInt64Limit) return Duration(std::numeric_limits<std::int64_t>::min());
        return Duration(-static_cast<std::int64_t>(total));
    }
    if (total > kInt64Limit - 1) return std::nullopt;
    return Duration(static_cast<std::int64_t>(total));
}

std::string format_duration(Duration d) {
    const std::int64_t count = d.count();
    const bool negative = count < 0;
    std::uint64_t u = negative ? (~static_cast<std::uint64_t>(count) + 1)
                               : static_cast<std::uint64_t>(count);

    std::string buf;
    if (u < 1000ULL * 1000 * 1000) {
        if (u == 0) return "0s";

        int prec = 0;
        if (u < 1000ULL) {
            buf = "ns";
        } else if (u < 1000ULL * 1000) {
            prec = 3;
            buf = "us";
        } else {
            prec = 6;
            buf = "ms";
        }
        u = format_fraction(buf, u, prec);
        format_int(buf, u);
    } else {
        buf = "s";
        u = format_fraction(buf, u, 9);
        format_int(buf, u % 60);
        u /= 60;
        if (u > 0) {
            buf.insert(buf.begin(), 'm');
            format_int(buf, u % 60);
            u /= 60;
            if (u > 0) {
                buf.insert(buf.begin(), 'h');
                format_int(buf, u);
            }
        }
    }

    if (negative) buf.insert(buf.begin(), '-');
    return buf;
}

} // namespace envflag
