#include "sam/aux_field.hpp"
#include "core/validity.hpp"
#include "sam/text_fields.hpp"

#include <cctype>
#include <cstdint>
#include <utility>

namespace samstream {

static bool is_printable(char c) {
    return c >= '!' && c <= '~';
}

static bool valid_tag(const std::string& tag) {
    return tag.size() == 2 &&
           std::isalpha(static_cast<unsigned char>(tag[0])) &&
           std::isalnum(static_cast<unsigned char>(tag[1]));
}

// SAM 'i' values may use the full signed or unsigned 32-bit range.
static bool valid_aux_int(int64_t v) {
    return valid_int32(v) || (v >= 0 && v <= int64_t(UINT32_MAX));
}

static bool validate_array(const std::string& value, std::string& error_msg) {
    if (value.empty()) {
        error_msg = "empty B array";
        return false;
    }
    char sub = value[0];
    int64_t lo, hi;
    switch (sub) {
        case 'c': lo = INT8_MIN;  hi = INT8_MAX;   break;
        case 'C': lo = 0;         hi = UINT8_MAX;  break;
        case 's': lo = INT16_MIN; hi = INT16_MAX;  break;
        case 'S': lo = 0;         hi = UINT16_MAX; break;
        case 'i': lo = INT32_MIN; hi = INT32_MAX;  break;
        case 'I': lo = 0;         hi = UINT32_MAX; break;
        case 'f': lo = 0;         hi = 0;          break;
        default:
            error_msg = "unknown B array subtype '" + std::string(1, sub) + "'";
            return false;
    }

    size_t pos = 1;
    while (pos < value.size()) {
        if (value[pos] != ',') {
            error_msg = "malformed B array '" + value + "'";
            return false;
        }
        size_t next = value.find(',', pos + 1);
        if (next == std::string::npos) next = value.size();
        std::string elem = value.substr(pos + 1, next - pos - 1);
        if (sub == 'f') {
            if (!valid_float_text(elem)) {
                error_msg = "bad float '" + elem + "' in B array";
                return false;
            }
        } else {
            int64_t v;
            if (!parse_int64(elem, v) || v < lo || v > hi) {
                error_msg = "B array element '" + elem + "' out of range for subtype " +
                            std::string(1, sub);
                return false;
            }
        }
        pos = next;
    }
    return true;
}

bool validate_aux_field(const AuxField& field, std::string& error_msg) {
    if (!valid_tag(field.tag)) {
        error_msg = "invalid optional field tag '" + field.tag + "'";
        return false;
    }
    const std::string& v = field.value;
    switch (field.type) {
        case 'A':
            if (v.size() != 1 || !is_printable(v[0])) {
                error_msg = "tag " + field.tag + ": A value must be one printable character";
                return false;
            }
            return true;
        case 'i': {
            int64_t n;
            if (!parse_int64(v, n) || !valid_aux_int(n)) {
                error_msg = "tag " + field.tag + ": integer '" + v + "' out of range";
                return false;
            }
            return true;
        }
        case 'f':
            if (!valid_float_text(v)) {
                error_msg = "tag " + field.tag + ": bad float '" + v + "'";
                return false;
            }
            return true;
        case 'Z':
            for (char c : v) {
                if (c != ' ' && !is_printable(c)) {
                    error_msg = "tag " + field.tag + ": non-printable character in Z value";
                    return false;
                }
            }
            return true;
        case 'H':
            if (v.size() % 2 != 0) {
                error_msg = "tag " + field.tag + ": odd-length H value";
                return false;
            }
            for (char c : v) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) {
                    error_msg = "tag " + field.tag + ": non-hex character in H value";
                    return false;
                }
            }
            return true;
        case 'B':
            if (!validate_array(v, error_msg)) {
                error_msg = "tag " + field.tag + ": " + error_msg;
                return false;
            }
            return true;
        default:
            error_msg = "tag " + field.tag + ": unknown type '" +
                        std::string(1, field.type) + "'";
            return false;
    }
}

bool parse_aux_field(std::string_view text, AuxField& out,
                     std::string& error_msg) {
    if (text.size() < 5 || text[2] != ':' || text[4] != ':') {
        error_msg = "malformed optional field '" + std::string(text) + "'";
        return false;
    }
    AuxField f;
    f.tag = std::string(text.substr(0, 2));
    f.type = text[3];
    f.value = std::string(text.substr(5));
    if (!validate_aux_field(f, error_msg)) return false;
    out = std::move(f);
    return true;
}

std::string format_aux_field(const AuxField& field) {
    std::string s = field.tag;
    s += ':';
    s += field.type;
    s += ':';
    s += field.value;
    return s;
}

const AuxField* find_aux_field(const std::vector<AuxField>& fields,
                               std::string_view tag) {
    for (const auto& f : fields) {
        if (f.tag == tag) return &f;
    }
    return nullptr;
}

} // namespace samstream
