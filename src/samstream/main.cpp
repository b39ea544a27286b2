#include "core/version.hpp"
#include "sam/flags.hpp"
#include "sam/iterator.hpp"
#include "sam/reader.hpp"
#include "sam/writer.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace samstream;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] [input.sam]\n"
        "\n"
        "Input:\n"
        "  -i <path>               Input SAM file (default: stdin, or \"-\")\n"
        "\n"
        "Output:\n"
        "  -o <path>               Output SAM file (default: stdout)\n"
        "  -flags <mode>           FLAG rendering: decimal, hex, string (default: decimal)\n"
        "  -count                  Print record and reference counts only\n"
        "\n"
        "Options:\n"
        "  -v, --verbose           Verbose logging\n"
        "  --version               Print version\n"
        "  -h, --help              Show this help\n",
        prog);
}

static int run(std::istream& in, std::ostream& out, FlagFormat fmt,
               bool count_only, const Logger& logger) {
    std::string error_msg;
    Reader reader;
    Status s = reader.open(in, error_msg, &logger);
    if (s != Status::kOk) {
        logger.error("cannot read header (%s): %s", status_name(s), error_msg.c_str());
        return 1;
    }
    logger.debug("header %s, %zu references",
                 reader.has_header() ? "present" : "absent",
                 reader.header().num_references());

    Writer writer;
    if (!count_only) {
        s = writer.open(out, reader.header(), fmt, error_msg);
        if (s != Status::kOk) {
            logger.error("cannot write header (%s): %s", status_name(s), error_msg.c_str());
            return 1;
        }
    }

    uint64_t n_records = 0;
    uint64_t n_unplaced = 0;
    Iterator it(reader);
    while (it.next()) {
        const Record& rec = it.record();
        n_records++;
        if (!rec.ref.is_mapped()) n_unplaced++;
        if (count_only) continue;
        s = writer.write(rec, error_msg);
        if (s != Status::kOk) {
            logger.error("record %llu (%s): %s",
                         static_cast<unsigned long long>(n_records),
                         status_name(s), error_msg.c_str());
            return 1;
        }
    }
    if (it.status() != Status::kOk) {
        logger.error("%s: %s", status_name(it.status()), it.error_message().c_str());
        return 1;
    }

    if (count_only) {
        out << "records\t" << n_records << "\n"
            << "unplaced\t" << n_unplaced << "\n"
            << "references\t" << reader.header().num_references() << "\n";
        if (!out) {
            logger.error("failed to write counts");
            return 1;
        }
    } else if (!reader.has_header() && reader.header().num_references() > 0) {
        // The header was written before any reference was discovered.
        logger.warn("input has no header; %zu references discovered but not written",
                    reader.header().num_references());
    }

    out.flush();
    logger.info("%llu records processed", static_cast<unsigned long long>(n_records));
    return 0;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "samstream")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    Logger logger = make_logger(cli);

    std::string input_path = cli.get_string("-i");
    if (input_path.empty() && !cli.positional().empty()) {
        input_path = cli.positional().front();
    }
    if (cli.positional().size() > 1 ||
        (cli.has("-i") && !cli.positional().empty())) {
        std::fprintf(stderr, "Error: at most one input may be given\n");
        print_usage(argv[0]);
        return 1;
    }

    FlagFormat fmt = kFlagDecimal;
    if (cli.has("-flags")) {
        std::string error_msg;
        if (!parse_flag_format(cli.get_string("-flags"), fmt, error_msg)) {
            std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
            return 1;
        }
    }
    bool count_only = cli.has("-count");

    std::ifstream in_file;
    std::istream* in = &std::cin;
    if (!input_path.empty() && input_path != "-") {
        in_file.open(input_path, std::ios::binary);
        if (!in_file.is_open()) {
            std::fprintf(stderr, "Error: cannot open input file %s\n", input_path.c_str());
            return 1;
        }
        in = &in_file;
    }

    std::string output_path = cli.get_string("-o");
    std::ofstream out_file;
    std::ostream* out = &std::cout;
    if (!output_path.empty() && output_path != "-") {
        out_file.open(output_path, std::ios::binary);
        if (!out_file.is_open()) {
            std::fprintf(stderr, "Error: cannot open output file %s\n", output_path.c_str());
            return 1;
        }
        out = &out_file;
    }

    logger.debug("input=%s output=%s flags=%s",
                 input_path.empty() ? "-" : input_path.c_str(),
                 output_path.empty() ? "-" : output_path.c_str(),
                 cli.get_string("-flags", "decimal").c_str());

    return run(*in, *out, fmt, count_only, logger);
}
