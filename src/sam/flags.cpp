#include "sam/flags.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

#include <htslib/sam.h>

namespace samstream {

bool parse_flag_format(const std::string& str, FlagFormat& out,
                       std::string& error_msg) {
    if (str == "decimal") {
        out = kFlagDecimal;
    } else if (str == "hex") {
        out = kFlagHex;
    } else if (str == "string") {
        out = kFlagString;
    } else {
        error_msg = "unknown FLAG format '" + str +
                    "' (expected decimal, hex or string)";
        return false;
    }
    return true;
}

// Bits bam_flag2str has names for (PAIRED .. SUPPLEMENTARY).
static constexpr uint16_t kNamedFlagBits = 0xFFF;

static std::string format_hex(uint16_t flags) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%x", static_cast<unsigned>(flags));
    return buf;
}

std::string format_flags(uint16_t flags, FlagFormat fmt) {
    switch (fmt) {
        case kFlagHex:
            return format_hex(flags);
        case kFlagString: {
            if (flags == 0) return "0";
            // Unnamed high bits would be dropped; keep the value exact.
            if (flags & ~kNamedFlagBits) return format_hex(flags);
            char* names = bam_flag2str(flags);
            if (!names) return format_hex(flags);
            std::string s(names);
            std::free(names);
            return s;
        }
        case kFlagDecimal:
            break;
    }
    return std::to_string(flags);
}

static bool parse_radix(std::string_view digits, int radix, uint16_t& out) {
    if (digits.empty()) return false;
    uint32_t v = 0;
    for (char c : digits) {
        int d;
        if (c >= '0' && c <= '9') {
            d = c - '0';
        } else if (radix == 16 && std::isxdigit(static_cast<unsigned char>(c))) {
            d = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        } else {
            return false;
        }
        if (d >= radix) return false;
        v = v * radix + static_cast<uint32_t>(d);
        if (v > 0xFFFF) return false;
    }
    out = static_cast<uint16_t>(v);
    return true;
}

bool parse_flags(std::string_view text, uint16_t& out) {
    if (text.empty()) return false;

    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        return parse_radix(text.substr(2), 16, out);
    }
    if (std::isdigit(static_cast<unsigned char>(text[0]))) {
        return parse_radix(text, 10, out);
    }

    // Comma-separated flag names; htslib rejects unknown names with -1.
    std::string names(text);
    int flag = bam_str2flag(names.c_str());
    if (flag < 0 || flag > 0xFFFF) return false;
    out = static_cast<uint16_t>(flag);
    return true;
}

} // namespace samstream
