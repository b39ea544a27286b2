#pragma once

#include <cstddef>
#include <cstdint>

namespace samstream {

// Signed field width of the binary sibling format (BAM).
inline constexpr int kWordBits = 31;

// Coordinate width covered by the six-level binning scheme.
inline constexpr int kIndexWordBits = 29;

// Each binning level splits its parent window into 2^kNextBinShift children.
inline constexpr int kNextBinShift = 3;
inline constexpr int kBinLevels = 6;

// Header lines start with this byte.
inline constexpr char kHeaderMarker = '@';

// Text sentinel for an absent reference, CIGAR, sequence or quality.
inline constexpr char kMissingField = '*';

// RNEXT value meaning "same reference as RNAME".
inline constexpr char kSameReference = '=';

// Number of mandatory tab-separated record columns.
inline constexpr size_t kMandatoryColumns = 11;

// QNAME is limited to 254 characters by the NUL-terminated BAM l_read_name.
inline constexpr size_t kMaxQueryNameLength = 254;

// MAPQ value meaning "mapping quality unavailable".
inline constexpr int kMapqUnavailable = 255;

// CIGAR operation lengths are packed into 28 bits.
inline constexpr uint32_t kMaxCigarOpLength = (uint32_t(1) << 28) - 1;

// Phred qualities are written as printable ASCII offset by 33.
inline constexpr int kQualityOffset = 33;

} // namespace samstream
