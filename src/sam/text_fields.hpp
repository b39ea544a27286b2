#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string_view>
#include <vector>

namespace samstream {

inline std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find('\t', start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

// Whole-field decimal integer: [-+]?[0-9]+. No whitespace, no second sign.
inline bool parse_int64(std::string_view s, int64_t& out) {
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (first != last && *first == '+') first++;
    if (first == last) return false;
    if (*first == '-') {
        if (first + 1 == last || s[0] == '+') return false;
    } else if (!std::isdigit(static_cast<unsigned char>(*first))) {
        return false;
    }
    auto res = std::from_chars(first, last, out);
    return res.ec == std::errc() && res.ptr == last;
}

// [-+]?[0-9]*\.?[0-9]+([eE][-+]?[0-9]+)?
inline bool valid_float_text(std::string_view s) {
    size_t i = 0;
    auto digits = [&]() {
        size_t n = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            i++;
            n++;
        }
        return n;
    };
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
    size_t int_digits = digits();
    if (i < s.size() && s[i] == '.') {
        i++;
        if (digits() == 0) return false;
    } else if (int_digits == 0) {
        return false;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        i++;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) i++;
        if (digits() == 0) return false;
    }
    return i == s.size();
}

} // namespace samstream
