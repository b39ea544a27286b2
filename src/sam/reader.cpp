#include "sam/reader.hpp"
#include "core/config.hpp"
#include "util/logger.hpp"

namespace samstream {

Status Reader::open(std::istream& in, std::string& error_msg,
                    const Logger* logger) {
    in_ = &in;
    logger_ = logger;
    is_open_ = false;
    header_ = Header();
    table_.reset();
    line_number_ = 0;

    int c = in.peek();
    if (in.bad()) {
        error_msg = "read error at start of input";
        return Status::kIoError;
    }
    if (c == std::istream::traits_type::eof() || c != kHeaderMarker) {
        in.clear(in.rdstate() & ~std::ios::failbit);
        table_ = std::make_unique<ReferenceTable>();
        is_open_ = true;
        if (logger_) logger_->debug("no header present; discovering references from records");
        return Status::kOk;
    }

    std::string block;
    std::string line;
    while (true) {
        std::getline(in, line);
        if (in.bad()) {
            error_msg = "read error in header at line " + std::to_string(line_number_ + 1);
            return Status::kIoError;
        }
        if (in.eof()) {
            error_msg = "unexpected end of input in header at line " +
                        std::to_string(line_number_ + 1);
            return Status::kTruncated;
        }
        line_number_++;
        block += line;
        block += '\n';

        c = in.peek();
        if (in.bad()) {
            error_msg = "read error after header line " + std::to_string(line_number_);
            return Status::kIoError;
        }
        if (c == std::istream::traits_type::eof()) {
            in.clear(in.rdstate() & ~std::ios::failbit);
            break;
        }
        if (c != kHeaderMarker) break;
    }

    Header h;
    Status s = h.parse_text(block, error_msg);
    if (s != Status::kOk) return s;

    header_ = std::move(h);
    is_open_ = true;
    if (logger_) {
        logger_->debug("read header: %zu lines, %zu references",
                       static_cast<size_t>(line_number_), header_.num_references());
    }
    return Status::kOk;
}

Status Reader::read(Record& rec, std::string& error_msg) {
    if (!is_open_) {
        error_msg = "reader is not open";
        return Status::kConfigError;
    }

    std::getline(*in_, line_);
    if (in_->bad()) {
        error_msg = "read error at line " + std::to_string(line_number_ + 1);
        return Status::kIoError;
    }
    // getline sets failbit only when it extracted nothing before end of input.
    if (in_->fail()) return Status::kEof;
    line_number_++;

    if (!line_.empty() && line_.back() == '\r') line_.pop_back();
    if (line_.empty()) {
        error_msg = "empty record line at line " + std::to_string(line_number_);
        return Status::kFormatError;
    }

    Record r;
    Status s = Record::decode_text(table_ ? nullptr : &header_, line_, r, error_msg);
    if (s != Status::kOk) {
        error_msg = "line " + std::to_string(line_number_) + ": " + error_msg;
        return s;
    }

    if (table_) {
        s = table_->reconcile(r.ref, header_, error_msg, logger_);
        if (s != Status::kOk) return s;
        s = table_->reconcile(r.mate_ref, header_, error_msg, logger_);
        if (s != Status::kOk) return s;
    }

    rec = std::move(r);
    return Status::kOk;
}

} // namespace samstream
