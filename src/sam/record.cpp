#include "sam/record.hpp"
#include "core/binning.hpp"
#include "core/config.hpp"
#include "core/validity.hpp"
#include "sam/text_fields.hpp"

#include <unordered_set>

#include <htslib/sam.h>

namespace samstream {

const std::string& RefBinding::name() const {
    static const std::string kUnmappedName(1, kMissingField);
    return ref_ ? ref_->name() : kUnmappedName;
}

static bool is_missing(std::string_view s) {
    return s.size() == 1 && s[0] == kMissingField;
}

// QNAME: [!-?A-~]{1,254}
static bool valid_query_name(std::string_view s) {
    if (s.empty() || s.size() > kMaxQueryNameLength) return false;
    for (char c : s) {
        if (c < '!' || c > '~' || c == '@') return false;
    }
    return true;
}

static bool valid_seq(std::string_view s) {
    for (char c : s) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  c == '=' || c == '.';
        if (!ok) return false;
    }
    return true;
}

static Status bind_name(const Header* header, std::string_view name,
                        const char* column, RefBinding& out,
                        std::string& error_msg) {
    if (is_missing(name)) {
        out = RefBinding::unmapped();
        return Status::kOk;
    }
    if (name.empty()) {
        error_msg = std::string("empty ") + column;
        return Status::kFormatError;
    }
    if (!header) {
        out = RefBinding::mapped(std::make_shared<Reference>(std::string(name)));
        return Status::kOk;
    }
    auto ref = header->find_reference(name);
    if (!ref) {
        error_msg = std::string(column) + " '" + std::string(name) +
                    "' not found in header";
        return Status::kFormatError;
    }
    out = RefBinding::mapped(std::move(ref));
    return Status::kOk;
}

// 1-based text position to 0-based; "0" is unknown.
static bool parse_position(std::string_view s, int32_t& out) {
    int64_t v;
    if (!parse_int64(s, v) || !valid_pos(v - 1)) return false;
    out = static_cast<int32_t>(v - 1);
    return true;
}

Status Record::decode_text(const Header* header, std::string_view line,
                           Record& rec, std::string& error_msg) {
    auto fields = split_tabs(line);
    if (fields.size() < kMandatoryColumns) {
        error_msg = "record has " + std::to_string(fields.size()) +
                    " columns, expected at least " +
                    std::to_string(kMandatoryColumns);
        return Status::kFormatError;
    }

    rec = Record();

    if (!is_missing(fields[0])) {
        if (!valid_query_name(fields[0])) {
            error_msg = "invalid QNAME '" + std::string(fields[0]) + "'";
            return Status::kFormatError;
        }
        rec.name = std::string(fields[0]);
    }

    if (!parse_flags(fields[1], rec.flags)) {
        error_msg = "invalid FLAG '" + std::string(fields[1]) + "'";
        return Status::kFormatError;
    }

    Status s = bind_name(header, fields[2], "RNAME", rec.ref, error_msg);
    if (s != Status::kOk) return s;

    if (!parse_position(fields[3], rec.pos)) {
        error_msg = "invalid POS '" + std::string(fields[3]) + "'";
        return Status::kFormatError;
    }

    int64_t v;
    if (!parse_int64(fields[4], v) || v < 0 || v > kMapqUnavailable) {
        error_msg = "invalid MAPQ '" + std::string(fields[4]) + "'";
        return Status::kFormatError;
    }
    rec.mapq = static_cast<uint8_t>(v);

    if (!parse_cigar(fields[5], rec.cigar, error_msg)) {
        return Status::kFormatError;
    }

    if (fields[6].size() == 1 && fields[6][0] == kSameReference) {
        rec.mate_ref = rec.ref;
    } else {
        s = bind_name(header, fields[6], "RNEXT", rec.mate_ref, error_msg);
        if (s != Status::kOk) return s;
    }

    if (!parse_position(fields[7], rec.mate_pos)) {
        error_msg = "invalid PNEXT '" + std::string(fields[7]) + "'";
        return Status::kFormatError;
    }

    if (!parse_int64(fields[8], v) || !valid_tmplt_len(v)) {
        error_msg = "invalid TLEN '" + std::string(fields[8]) + "'";
        return Status::kFormatError;
    }
    rec.temp_len = static_cast<int32_t>(v);

    if (!is_missing(fields[9])) {
        if (fields[9].empty() || !valid_seq(fields[9])) {
            error_msg = "invalid SEQ";
            return Status::kFormatError;
        }
        rec.seq = std::string(fields[9]);
    }

    if (!is_missing(fields[10])) {
        if (fields[10].size() != rec.seq.size()) {
            error_msg = "QUAL length " + std::to_string(fields[10].size()) +
                        " does not match SEQ length " + std::to_string(rec.seq.size());
            return Status::kFormatError;
        }
        rec.qual.reserve(fields[10].size());
        for (char c : fields[10]) {
            if (c < '!' || c > '~') {
                error_msg = "invalid QUAL character";
                return Status::kFormatError;
            }
            rec.qual.push_back(static_cast<uint8_t>(c - kQualityOffset));
        }
    }

    if (!rec.cigar.empty() && !rec.seq.empty() &&
        cigar_query_length(rec.cigar) != static_cast<int64_t>(rec.seq.size())) {
        error_msg = "CIGAR query length " +
                    std::to_string(cigar_query_length(rec.cigar)) +
                    " does not match SEQ length " + std::to_string(rec.seq.size());
        return Status::kFormatError;
    }

    std::unordered_set<std::string> seen_tags;
    for (size_t i = kMandatoryColumns; i < fields.size(); i++) {
        AuxField f;
        if (!parse_aux_field(fields[i], f, error_msg)) {
            return Status::kFormatError;
        }
        if (!seen_tags.insert(f.tag).second) {
            error_msg = "duplicate optional field tag " + f.tag;
            return Status::kFormatError;
        }
        rec.aux.push_back(std::move(f));
    }

    return Status::kOk;
}

Status Record::encode_text(FlagFormat fmt, std::string& out,
                           std::string& error_msg) const {
    if (!valid_flag_format(fmt)) {
        error_msg = "FLAG format out of range";
        return Status::kConfigError;
    }
    if (!name.empty() && !valid_query_name(name)) {
        error_msg = "invalid QNAME '" + name + "'";
        return Status::kFormatError;
    }
    if (!valid_pos(pos)) {
        error_msg = "POS " + std::to_string(pos) + " out of range";
        return Status::kFormatError;
    }
    if (!valid_pos(mate_pos)) {
        error_msg = "PNEXT " + std::to_string(mate_pos) + " out of range";
        return Status::kFormatError;
    }
    if (!valid_seq(seq)) {
        error_msg = "invalid SEQ in record '" + name + "'";
        return Status::kFormatError;
    }
    if (!qual.empty() && qual.size() != seq.size()) {
        error_msg = "QUAL length does not match SEQ length in record '" + name + "'";
        return Status::kFormatError;
    }
    for (uint8_t q : qual) {
        if (q > '~' - kQualityOffset) {
            error_msg = "quality score " + std::to_string(q) + " out of range";
            return Status::kFormatError;
        }
    }
    for (const auto& f : aux) {
        if (!validate_aux_field(f, error_msg)) return Status::kFormatError;
    }

    out.clear();
    out += name.empty() ? std::string(1, kMissingField) : name;
    out += '\t';
    out += format_flags(flags, fmt);
    out += '\t';
    out += ref.name();
    out += '\t';
    out += std::to_string(static_cast<int64_t>(pos) + 1);
    out += '\t';
    out += std::to_string(mapq);
    out += '\t';
    out += format_cigar(cigar);
    out += '\t';
    if (mate_ref.is_mapped() && ref.is_mapped() &&
        mate_ref.name() == ref.name()) {
        out += kSameReference;
    } else {
        out += mate_ref.name();
    }
    out += '\t';
    out += std::to_string(static_cast<int64_t>(mate_pos) + 1);
    out += '\t';
    out += std::to_string(temp_len);
    out += '\t';
    out += seq.empty() ? std::string(1, kMissingField) : seq;
    out += '\t';
    if (qual.empty()) {
        out += kMissingField;
    } else {
        for (uint8_t q : qual) out += static_cast<char>(q + kQualityOffset);
    }
    for (const auto& f : aux) {
        out += '\t';
        out += format_aux_field(f);
    }
    return Status::kOk;
}

bool Record::is_unmapped() const {
    return (flags & BAM_FUNMAP) != 0;
}

bool Record::is_reverse() const {
    return (flags & BAM_FREVERSE) != 0;
}

int64_t Record::end() const {
    int64_t rlen = is_unmapped() ? 0 : cigar_ref_length(cigar);
    if (rlen == 0) rlen = 1;
    return static_cast<int64_t>(pos) + rlen;
}

int Record::bin() const {
    int64_t e = end();
    if (!valid_index_pos(pos) || !valid_index_pos(e - 1)) return -1;
    return reg2bin(pos, e);
}

} // namespace samstream
