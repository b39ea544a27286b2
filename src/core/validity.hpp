#pragma once

#include <cstdint>

#include "core/config.hpp"

namespace samstream {

// Range checks that keep SAM text fields losslessly convertible to the
// fixed-width BAM encoding. Values outside these ranges are format violations.

inline constexpr int64_t kMaxInt32 = (int64_t(1) << 31) - 1;
inline constexpr int64_t kMinInt32 = -kMaxInt32 - 1;

inline constexpr bool valid_int32(int64_t i) {
    return kMinInt32 <= i && i <= kMaxInt32;
}

// Reference length: 1 .. 2^31-1.
inline constexpr bool valid_len(int64_t i) {
    return 1 <= i && i <= (int64_t(1) << kWordBits) - 1;
}

// 0-based position; -1 is "unknown".
inline constexpr bool valid_pos(int64_t i) {
    return -1 <= i && i <= ((int64_t(1) << kWordBits) - 1) - 1;
}

inline constexpr bool valid_tmplt_len(int64_t i) {
    return -(int64_t(1) << kWordBits) <= i && i <= (int64_t(1) << kWordBits) - 1;
}

// 0-based position that can be binned by reg2bin.
inline constexpr bool valid_index_pos(int64_t i) {
    return -1 <= i && i <= ((int64_t(1) << kIndexWordBits) - 1) - 1;
}

} // namespace samstream
