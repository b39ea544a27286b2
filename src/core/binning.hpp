#pragma once

#include <cstdint>

#include "core/config.hpp"

namespace samstream {

// Window shift of binning level L (0 = whole space, 5 = 16 kbp windows).
inline constexpr int bin_level_shift(int level) {
    return kIndexWordBits - level * kNextBinShift;
}

// First bin number of level L: (8^L - 1) / 7, i.e. 0, 1, 9, 73, 585, 4681.
inline constexpr uint16_t bin_level_offset(int level) {
    return static_cast<uint16_t>(((1 << (level * kNextBinShift)) - 1) / 7);
}

// Bin of the smallest window containing [beg, end) (0-based, half-open).
// beg and end must satisfy valid_index_pos; reg2bin(-1, 0) is 4680, the bin
// given to records without a coordinate.
uint16_t reg2bin(int64_t beg, int64_t end);

// Level (0..5) that a bin number belongs to.
int bin_level(uint16_t bin);

} // namespace samstream
