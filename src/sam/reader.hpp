#pragma once

#include <istream>
#include <memory>
#include <string>

#include "sam/header.hpp"
#include "sam/record.hpp"
#include "sam/record_source.hpp"
#include "sam/reference_table.hpp"
#include "sam/status.hpp"

namespace samstream {

class Logger;

// Streaming SAM text reader.
//
// open() peeks at the first byte. If it is '@' the whole header block is read
// and parsed, and records are decoded against it. Otherwise the header starts
// empty and references are added to it as records name them, so that every
// record naming "chr1" shares one Reference instance.
class Reader : public RecordSource {
public:
    // Returns kOk, kTruncated if the input ends inside a header line,
    // kFormatError / kDuplicateReference if the header does not parse,
    // or kIoError. No header is installed on failure.
    Status open(std::istream& in, std::string& error_msg,
                const Logger* logger = nullptr);

    Status read(Record& rec, std::string& error_msg) override;

    // In header-absent mode this grows until the input is consumed.
    const Header& header() const { return header_; }

    bool has_header() const { return is_open_ && !table_; }

    // Number of lines consumed so far, header included.
    uint64_t line_number() const { return line_number_; }

private:
    std::istream* in_ = nullptr;
    const Logger* logger_ = nullptr;
    bool is_open_ = false;
    Header header_;
    std::unique_ptr<ReferenceTable> table_;  // only without a header
    uint64_t line_number_ = 0;
    std::string line_;
};

} // namespace samstream
