#pragma once

#include <ostream>
#include <string>

#include "sam/flags.hpp"
#include "sam/header.hpp"
#include "sam/record.hpp"
#include "sam/status.hpp"

namespace samstream {

// Writes a header block once, then one line per record.
class Writer {
public:
    // flag_format must be a FlagFormat value; anything else returns
    // kConfigError before a byte is written. Otherwise the header text is
    // written and flushed, returning kIoError if the stream fails.
    Status open(std::ostream& out, const Header& header, int flag_format,
                std::string& error_msg);

    // Encode rec, append '\n' and write it with a single call. A stream
    // failure may leave a partial line behind; callers should stop writing.
    Status write(const Record& rec, std::string& error_msg);

    FlagFormat flag_format() const { return flag_format_; }

private:
    std::ostream* out_ = nullptr;
    FlagFormat flag_format_ = kFlagDecimal;
    std::string line_;
};

} // namespace samstream
