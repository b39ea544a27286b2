#include "sam/writer.hpp"

namespace samstream {

Status Writer::open(std::ostream& out, const Header& header, int flag_format,
                    std::string& error_msg) {
    out_ = nullptr;
    if (!valid_flag_format(flag_format)) {
        error_msg = "FLAG format option " + std::to_string(flag_format) +
                    " out of range";
        return Status::kConfigError;
    }

    std::string text = header.to_text();
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        error_msg = "failed to write header";
        return Status::kIoError;
    }

    out_ = &out;
    flag_format_ = static_cast<FlagFormat>(flag_format);
    return Status::kOk;
}

Status Writer::write(const Record& rec, std::string& error_msg) {
    if (!out_) {
        error_msg = "writer is not open";
        return Status::kConfigError;
    }

    Status s = rec.encode_text(flag_format_, line_, error_msg);
    if (s != Status::kOk) return s;
    line_ += '\n';

    out_->write(line_.data(), static_cast<std::streamsize>(line_.size()));
    if (!*out_) {
        error_msg = "failed to write record '" + rec.name + "'";
        return Status::kIoError;
    }
    return Status::kOk;
}

} // namespace samstream
