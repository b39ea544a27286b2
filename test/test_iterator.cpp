#include "test_util.hpp"
#include "sam/iterator.hpp"
#include "sam/reader.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace samstream;

// Yields the named records, then a final status, counting read() calls.
class ScriptedSource : public RecordSource {
public:
    ScriptedSource(std::vector<std::string> names, Status final_status)
        : names_(std::move(names)), final_status_(final_status) {}

    Status read(Record& rec, std::string& error_msg) override {
        calls++;
        if (next_ < names_.size()) {
            rec = Record();
            rec.name = names_[next_++];
            return Status::kOk;
        }
        if (final_status_ != Status::kEof) error_msg = "scripted failure";
        return final_status_;
    }

    int calls = 0;

private:
    std::vector<std::string> names_;
    size_t next_ = 0;
    Status final_status_;
};

static void test_clean_end() {
    std::fprintf(stderr, "-- test_clean_end\n");
    ScriptedSource src({"a", "b"}, Status::kEof);
    Iterator it(src);

    CHECK(it.next());
    CHECK_STR_EQ(it.record().name, "a");
    CHECK(it.next());
    CHECK_STR_EQ(it.record().name, "b");
    CHECK(!it.next());
    CHECK_STATUS(it.status(), Status::kOk);
    CHECK(it.error_message().empty());
    CHECK(it.state() == Iterator::State::kExhausted);
    CHECK_EQ(src.calls, 3);

    // Exhausted is terminal: the source is not consulted again.
    CHECK(!it.next());
    CHECK(!it.next());
    CHECK_EQ(src.calls, 3);
    CHECK_STATUS(it.status(), Status::kOk);
    // The last good record stays available.
    CHECK_STR_EQ(it.record().name, "b");
}

static void test_sticky_error() {
    std::fprintf(stderr, "-- test_sticky_error\n");
    ScriptedSource src({"a"}, Status::kFormatError);
    Iterator it(src);

    CHECK(it.next());
    CHECK_STATUS(it.status(), Status::kOk);
    CHECK(!it.next());
    CHECK_STATUS(it.status(), Status::kFormatError);
    CHECK_STR_EQ(it.error_message(), "scripted failure");
    CHECK(it.state() == Iterator::State::kFailed);
    CHECK(!it.next());
    CHECK_EQ(src.calls, 2);
    CHECK_STATUS(it.status(), Status::kFormatError);
}

static void test_empty_source() {
    std::fprintf(stderr, "-- test_empty_source\n");
    ScriptedSource src({}, Status::kEof);
    Iterator it(src);
    CHECK(it.state() == Iterator::State::kRunning);
    CHECK(!it.next());
    CHECK_STATUS(it.status(), Status::kOk);
    CHECK_EQ(src.calls, 1);
}

static void test_over_reader() {
    std::fprintf(stderr, "-- test_over_reader\n");
    std::istringstream in(
        "@SQ\tSN:chr1\tLN:100\n"
        "r1\t0\tchr1\t1\t60\t*\t*\t0\t0\t*\t*\n"
        "r2\t0\tchr1\t2\t60\t*\t*\t0\t0\t*\t*\n"
        "r3\t0\tchr9\t3\t60\t*\t*\t0\t0\t*\t*\n"
        "r4\t0\tchr1\t4\t60\t*\t*\t0\t0\t*\t*\n");
    Reader reader;
    std::string err;
    CHECK_STATUS(reader.open(in, err), Status::kOk);

    Iterator it(reader);
    std::vector<std::string> names;
    while (it.next()) names.push_back(it.record().name);
    CHECK_EQ(names.size(), 2u);
    CHECK_STATUS(it.status(), Status::kFormatError);
    CHECK(it.error_message().find("chr9") != std::string::npos);
    // r4 is never read.
    CHECK(!it.next());
}

int main() {
    test_clean_end();
    test_sticky_error();
    test_empty_source();
    test_over_reader();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
