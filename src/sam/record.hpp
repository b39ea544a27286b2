#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/config.hpp"
#include "sam/aux_field.hpp"
#include "sam/cigar.hpp"
#include "sam/flags.hpp"
#include "sam/header.hpp"
#include "sam/status.hpp"

namespace samstream {

// Reference binding of RNAME or RNEXT: either Unmapped ("*") or Mapped to a
// shared Reference instance.
class RefBinding {
public:
    RefBinding() = default;

    static RefBinding unmapped() { return RefBinding(); }
    static RefBinding mapped(std::shared_ptr<const Reference> ref) {
        RefBinding b;
        b.ref_ = std::move(ref);
        return b;
    }

    bool is_mapped() const { return ref_ != nullptr; }
    const std::shared_ptr<const Reference>& reference() const { return ref_; }

    // "*" when unmapped.
    const std::string& name() const;

    // Same Reference instance (or both unmapped).
    bool same_as(const RefBinding& other) const { return ref_ == other.ref_; }

private:
    std::shared_ptr<const Reference> ref_;
};

// One SAM alignment line. Positions are 0-based; -1 is "unknown".
struct Record {
    std::string name;            // QNAME; empty for "*"
    uint16_t flags = 0;
    RefBinding ref;
    int32_t pos = -1;
    uint8_t mapq = kMapqUnavailable;
    Cigar cigar;
    RefBinding mate_ref;
    int32_t mate_pos = -1;
    int32_t temp_len = 0;
    std::string seq;             // empty for "*"
    std::vector<uint8_t> qual;   // phred scores; empty for "*"
    std::vector<AuxField> aux;

    // Decode one line (no line terminator). With a header, RNAME/RNEXT must
    // name references in its dictionary. With header == nullptr, each name
    // binds a fresh unregistered Reference for the caller to reconcile.
    // On failure rec is unspecified.
    static Status decode_text(const Header* header, std::string_view line,
                              Record& rec, std::string& error_msg);

    // Encode to one line without terminator. fmt must satisfy
    // valid_flag_format.
    Status encode_text(FlagFormat fmt, std::string& out,
                       std::string& error_msg) const;

    // 0-based exclusive end on the reference; pos + 1 when the CIGAR
    // consumes no reference bases.
    int64_t end() const;

    // reg2bin(pos, end()), or -1 when the span is outside valid_index_pos.
    int bin() const;

    bool is_unmapped() const;
    bool is_reverse() const;
};

} // namespace samstream
