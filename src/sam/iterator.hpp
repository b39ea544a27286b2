#pragma once

#include <string>

#include "sam/record.hpp"
#include "sam/record_source.hpp"
#include "sam/status.hpp"

namespace samstream {

// Loop adaptor over any RecordSource:
//
//   Iterator it(reader);
//   while (it.next()) {
//       fn(it.record());
//   }
//   if (it.status() != Status::kOk) { /* it.error_message() */ }
//
// Iteration stops for good at end of input or at the first error; later
// next() calls return false without touching the source.
class Iterator {
public:
    enum class State { kRunning, kExhausted, kFailed };

    explicit Iterator(RecordSource& source) : source_(source) {}

    bool next();

    // Most recent record read by a next() call that returned true.
    const Record& record() const { return rec_; }
    Record& record() { return rec_; }

    // kOk while running and after a clean end of input; otherwise the first
    // error encountered.
    Status status() const { return status_; }
    const std::string& error_message() const { return error_msg_; }

    State state() const { return state_; }

private:
    RecordSource& source_;
    Record rec_;
    State state_ = State::kRunning;
    Status status_ = Status::kOk;
    std::string error_msg_;
};

} // namespace samstream
