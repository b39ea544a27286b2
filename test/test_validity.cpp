#include "test_util.hpp"
#include "core/validity.hpp"

using namespace samstream;

static void test_int32() {
    std::fprintf(stderr, "-- test_int32\n");
    CHECK(valid_int32(0));
    CHECK(valid_int32(2147483647LL));
    CHECK(valid_int32(-2147483648LL));
    CHECK(!valid_int32(2147483648LL));
    CHECK(!valid_int32(-2147483649LL));
}

static void test_len() {
    std::fprintf(stderr, "-- test_len\n");
    CHECK(!valid_len(0));
    CHECK(valid_len(1));
    CHECK(valid_len(2147483647LL));
    CHECK(!valid_len(2147483648LL));
    CHECK(!valid_len(-5));
}

static void test_pos() {
    std::fprintf(stderr, "-- test_pos\n");
    CHECK(valid_pos(-1));
    CHECK(valid_pos(0));
    CHECK(valid_pos(2147483646LL));
    CHECK(!valid_pos(2147483647LL));
    CHECK(!valid_pos(-2));
}

static void test_tmplt_len() {
    std::fprintf(stderr, "-- test_tmplt_len\n");
    CHECK(valid_tmplt_len(0));
    CHECK(valid_tmplt_len(-2147483648LL));
    CHECK(valid_tmplt_len(2147483647LL));
    CHECK(!valid_tmplt_len(2147483648LL));
    CHECK(!valid_tmplt_len(-2147483649LL));
}

static void test_index_pos() {
    std::fprintf(stderr, "-- test_index_pos\n");
    CHECK(valid_index_pos(-1));
    CHECK(valid_index_pos(0));
    CHECK(valid_index_pos((1LL << 29) - 2));
    CHECK(!valid_index_pos((1LL << 29) - 1));
    CHECK(!valid_index_pos(-2));
    // A valid BAM position is not necessarily indexable.
    CHECK(valid_pos(1LL << 29));
    CHECK(!valid_index_pos(1LL << 29));
}

static_assert(valid_pos(-1) && !valid_len(0), "predicates usable at compile time");

int main() {
    test_int32();
    test_len();
    test_pos();
    test_tmplt_len();
    test_index_pos();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
