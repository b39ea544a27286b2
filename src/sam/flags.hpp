#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace samstream {

// FLAG column rendering used by Writer. Values form a closed, ordered range.
enum FlagFormat : int {
    kFlagDecimal = 0,  // "99"
    kFlagHex = 1,      // "0x63"
    kFlagString = 2,   // "PAIRED,PROPER_PAIR,MREVERSE,READ1"
};

inline bool valid_flag_format(int fmt) {
    return fmt >= kFlagDecimal && fmt <= kFlagString;
}

// Parse a FLAG rendering name ("decimal", "hex", "string").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_flag_format(const std::string& str, FlagFormat& out,
                       std::string& error_msg);

// Render FLAG bits. fmt must satisfy valid_flag_format. String mode falls
// back to hex when a bit above 0x800 is set, since those bits have no name.
std::string format_flags(uint16_t flags, FlagFormat fmt);

// Parse any of the three renderings. Returns false if the text is not a
// FLAG or does not fit in 16 bits.
bool parse_flags(std::string_view text, uint16_t& out);

} // namespace samstream
