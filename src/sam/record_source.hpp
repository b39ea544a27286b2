#pragma once

#include <string>

#include "sam/record.hpp"
#include "sam/status.hpp"

namespace samstream {

// Anything that yields SAM records one at a time.
class RecordSource {
public:
    virtual ~RecordSource() = default;

    // Fill rec with the next record. Returns kOk, kEof at the end of input,
    // or an error status with error_msg set.
    virtual Status read(Record& rec, std::string& error_msg) = 0;
};

} // namespace samstream
