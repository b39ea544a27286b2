#include "core/binning.hpp"

#include <array>

namespace samstream {

namespace {

struct BinLevel {
    int shift;
    uint16_t offset;
};

constexpr std::array<BinLevel, kBinLevels> make_bin_levels() {
    std::array<BinLevel, kBinLevels> levels{};
    for (int l = 0; l < kBinLevels; l++) {
        levels[l] = BinLevel{bin_level_shift(l), bin_level_offset(l)};
    }
    return levels;
}

constexpr std::array<BinLevel, kBinLevels> kLevels = make_bin_levels();

static_assert(kLevels[0].shift == kIndexWordBits,
              "level 0 must span the whole index space");
static_assert(kLevels[kBinLevels - 1].shift == 14 &&
              kLevels[kBinLevels - 1].offset == 4681,
              "finest level must use 16 kbp windows starting at bin 4681");

} // namespace

uint16_t reg2bin(int64_t beg, int64_t end) {
    end--;
    for (int l = kBinLevels - 1; l > 0; l--) {
        const BinLevel& lv = kLevels[l];
        if ((beg >> lv.shift) == (end >> lv.shift)) {
            return static_cast<uint16_t>(lv.offset + (beg >> lv.shift));
        }
    }
    return kLevels[0].offset;
}

int bin_level(uint16_t bin) {
    for (int l = kBinLevels - 1; l > 0; l--) {
        if (bin >= kLevels[l].offset) return l;
    }
    return 0;
}

} // namespace samstream
