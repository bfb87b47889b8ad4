/**
 * @file Names.cpp
 * @brief Implementation of environment name derivation
 */

#include "envflag/Names.hpp"

#include <algorithm>
#include <cctype>

namespace envflag {

namespace {
    bool is_upper(char c) {
        return std::isupper(static_cast<unsigned char>(c)) != 0;
    }

    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (first >= last) return "";
    return std::string(first, last);
}

std::string to_screaming_snake(const std::string& identifier) {
    std::string result;
    result.reserve(identifier.size() + identifier.size() / 2);

    for (size_t i = 0; i < identifier.size(); ++i) {
        const char c = identifier[i];
        if (i > 0 && is_upper(c) && !is_upper(identifier[i - 1])) {
            result += '_';
        }
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string normalize_prefix(const std::string& prefix) {
    std::string normalized = to_upper(prefix);
    while (!normalized.empty() && normalized.back() == kPrefixSeparator) {
        normalized.pop_back();
    }
    if (!normalized.empty()) normalized += kPrefixSeparator;
    return normalized;
}

std::string apply_prefix(const std::string& name, const std::string& prefix) {
    const std::string normalized = normalize_prefix(prefix);
    if (normalized.empty()) return name;
    if (name.rfind(normalized, 0) == 0) return name;
    return normalized + name;
}

std::vector<std::string> split_with(const std::string& s, const std::string& sep) {
    std::vector<std::string> parts;
    if (sep.empty()) {
        parts.push_back(trim(s));
        return parts;
    }

    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(trim(s.substr(start)));
            break;
        }
        parts.push_back(trim(s.substr(start, pos - start)));
        start = pos + sep.size();
    }
    return parts;
}

std::vector<std::string> split_with_comma(const std::string& s) {
    return split_with(s, ",");
}

} // namespace envflag
