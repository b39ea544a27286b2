#include "sam/iterator.hpp"

namespace samstream {

bool Iterator::next() {
    if (state_ != State::kRunning) return false;

    Record rec;
    std::string error_msg;
    Status s = source_.read(rec, error_msg);
    switch (s) {
        case Status::kOk:
            rec_ = std::move(rec);
            return true;
        case Status::kEof:
            state_ = State::kExhausted;
            return false;
        default:
            state_ = State::kFailed;
            status_ = s;
            error_msg_ = std::move(error_msg);
            return false;
    }
}

} // namespace samstream
