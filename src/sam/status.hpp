#pragma once

namespace samstream {

// Outcome of every fallible stream, header and record operation.
// Anything other than kOk and kEof comes with a message in error_msg.
enum class Status {
    kOk,
    kEof,                 // clean end of input; not an error for Iterator
    kTruncated,           // input ended inside the header block
    kFormatError,         // text did not parse as a header or record
    kDuplicateReference,  // reference name already in the dictionary
    kConfigError,         // invalid option, e.g. FLAG format out of range
    kIoError,             // underlying stream failed
};

inline const char* status_name(Status s) {
    switch (s) {
        case Status::kOk:                 return "ok";
        case Status::kEof:                return "end of stream";
        case Status::kTruncated:          return "truncated";
        case Status::kFormatError:        return "format error";
        case Status::kDuplicateReference: return "duplicate reference";
        case Status::kConfigError:        return "configuration error";
        case Status::kIoError:            return "I/O error";
    }
    return "unknown";
}

} // namespace samstream
