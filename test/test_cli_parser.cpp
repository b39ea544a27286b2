#include "test_util.hpp"
#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>
#include <vector>

using namespace samstream;

static CliParser parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return CliParser(static_cast<int>(argv.size()), argv.data());
}

static void test_options() {
    std::fprintf(stderr, "-- test_options\n");
    CliParser cli = parse({"samstream", "-i", "in.sam", "-flags", "hex",
                           "--level=3", "-count", "-v"});
    CHECK_STR_EQ(cli.program(), "samstream");
    CHECK_STR_EQ(cli.get_string("-i"), "in.sam");
    CHECK_STR_EQ(cli.get_string("-flags"), "hex");
    CHECK_EQ(cli.get_int("--level"), 3);
    CHECK(cli.has("-count"));
    CHECK(cli.has("-v"));
    CHECK(!cli.has("-o"));
    CHECK_STR_EQ(cli.get_string("-o", "-"), "-");
    CHECK(cli.positional().empty());
}

static void test_positional_and_repeats() {
    std::fprintf(stderr, "-- test_positional_and_repeats\n");
    CliParser cli = parse({"samstream", "a.sam", "-x", "1", "-x", "2", "-"});
    CHECK_EQ(cli.positional().size(), 2u);
    CHECK_STR_EQ(cli.positional()[0], "a.sam");
    CHECK_STR_EQ(cli.positional()[1], "-");
    CHECK_EQ(cli.get_strings("-x").size(), 2u);
    CHECK_STR_EQ(cli.get_string("-x"), "2");
    CHECK_EQ(cli.get_int("-x"), 2);
    CHECK_EQ(cli.get_int("-missing", 7), 7);
}

static void test_dash_value() {
    std::fprintf(stderr, "-- test_dash_value\n");
    CliParser cli = parse({"samstream", "-i", "-", "-o", "-"});
    CHECK_STR_EQ(cli.get_string("-i"), "-");
    CHECK_STR_EQ(cli.get_string("-o"), "-");
    CHECK(cli.positional().empty());
}

static void test_bad_int() {
    std::fprintf(stderr, "-- test_bad_int\n");
    CliParser cli = parse({"samstream", "-n", "many"});
    CHECK_EQ(cli.get_int("-n", 5), 5);
}

static std::string drain(std::FILE* f) {
    std::rewind(f);
    std::string s;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), f)) s += buf;
    return s;
}

static void test_logger_levels() {
    std::fprintf(stderr, "-- test_logger_levels\n");
    std::FILE* sink = std::tmpfile();
    CHECK(sink != nullptr);
    if (!sink) return;

    Logger logger(Logger::kInfo, sink);
    CHECK(!logger.verbose());
    logger.debug("hidden %d", 1);
    logger.info("records %d", 42);
    logger.warn("careful");
    logger.error("broken %s", "stream");
    std::string out = drain(sink);
    CHECK(out.find("hidden") == std::string::npos);
    CHECK(out.find("[INFO] records 42\n") != std::string::npos);
    CHECK(out.find("[WARN] careful\n") != std::string::npos);
    CHECK(out.find("[ERROR] broken stream\n") != std::string::npos);

    logger.set_level(Logger::kDebug);
    CHECK(logger.verbose());
    logger.debug("shown");
    CHECK(drain(sink).find("[DEBUG] shown\n") != std::string::npos);
    std::fclose(sink);
}

int main() {
    test_options();
    test_positional_and_repeats();
    test_dash_value();
    test_bad_int();
    test_logger_levels();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
