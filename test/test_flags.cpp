#include "test_util.hpp"
#include "sam/flags.hpp"

#include <string>

#include <htslib/sam.h>

using namespace samstream;

static void test_format_decimal_hex() {
    std::fprintf(stderr, "-- test_format_decimal_hex\n");
    CHECK_STR_EQ(format_flags(99, kFlagDecimal), "99");
    CHECK_STR_EQ(format_flags(0, kFlagDecimal), "0");
    CHECK_STR_EQ(format_flags(99, kFlagHex), "0x63");
    CHECK_STR_EQ(format_flags(0xFFFF, kFlagHex), "0xffff");
}

static void test_format_string() {
    std::fprintf(stderr, "-- test_format_string\n");
    std::string s = format_flags(BAM_FPAIRED | BAM_FREVERSE, kFlagString);
    CHECK(s.find("PAIRED") != std::string::npos);
    CHECK(s.find("REVERSE") != std::string::npos);
    CHECK(s.find(',') != std::string::npos);
    CHECK_STR_EQ(format_flags(0, kFlagString), "0");
}

static void test_parse_all_renderings() {
    std::fprintf(stderr, "-- test_parse_all_renderings\n");
    const uint16_t samples[] = {0, 1, 4, 16, 83, 99, 147, 163, 2048, 3583,
                                0x1000, 0x1001, 0x8000, 0xFFFF};
    for (uint16_t f : samples) {
        for (int fmt = kFlagDecimal; fmt <= kFlagString; fmt++) {
            uint16_t back = 0xFFFF;
            std::string text = format_flags(f, static_cast<FlagFormat>(fmt));
            CHECK(parse_flags(text, back));
            CHECK_EQ(back, f);
        }
    }
}

static void test_format_string_unnamed_bits() {
    std::fprintf(stderr, "-- test_format_string_unnamed_bits\n");
    CHECK_STR_EQ(format_flags(0x1000, kFlagString), "0x1000");
    CHECK_STR_EQ(format_flags(0x1001, kFlagString), "0x1001");
    CHECK_STR_EQ(format_flags(0x800, kFlagString), "SUPPLEMENTARY");
    uint16_t back = 0;
    CHECK(parse_flags(format_flags(0x1001, kFlagString), back));
    CHECK_EQ(back, 0x1001);
}

static void test_parse_rejects() {
    std::fprintf(stderr, "-- test_parse_rejects\n");
    uint16_t f = 7;
    CHECK(!parse_flags("", f));
    CHECK(!parse_flags("65536", f));
    CHECK(!parse_flags("0x10000", f));
    CHECK(!parse_flags("12a", f));
    CHECK(!parse_flags("0x", f));
    CHECK(!parse_flags("NOT_A_FLAG", f));
    CHECK(!parse_flags("-1", f));
    CHECK_EQ(f, 7);
    // Leading zeros stay decimal.
    CHECK(parse_flags("010", f));
    CHECK_EQ(f, 10);
}

static void test_flag_format_names() {
    std::fprintf(stderr, "-- test_flag_format_names\n");
    FlagFormat fmt = kFlagDecimal;
    std::string err;
    CHECK(parse_flag_format("hex", fmt, err));
    CHECK_EQ(fmt, kFlagHex);
    CHECK(parse_flag_format("string", fmt, err));
    CHECK_EQ(fmt, kFlagString);
    CHECK(!parse_flag_format("octal", fmt, err));
    CHECK_EQ(fmt, kFlagString);
    CHECK(!err.empty());

    CHECK(valid_flag_format(kFlagDecimal));
    CHECK(valid_flag_format(kFlagString));
    CHECK(!valid_flag_format(-1));
    CHECK(!valid_flag_format(kFlagString + 1));
}

int main() {
    test_format_decimal_hex();
    test_format_string();
    test_parse_all_renderings();
    test_format_string_unnamed_bits();
    test_parse_rejects();
    test_flag_format_names();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
