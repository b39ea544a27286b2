#include "sam/cigar.hpp"
#include "core/config.hpp"

#include <cstring>

#include <htslib/sam.h>

namespace samstream {

static const char* const kCigarOps = BAM_CIGAR_STR;

bool parse_cigar(std::string_view text, Cigar& out, std::string& error_msg) {
    out.clear();
    if (text.size() == 1 && text[0] == kMissingField) return true;
    if (text.empty()) {
        error_msg = "empty CIGAR";
        return false;
    }

    size_t i = 0;
    while (i < text.size()) {
        uint64_t len = 0;
        size_t digits = 0;
        while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
            len = len * 10 + static_cast<uint64_t>(text[i] - '0');
            if (len > kMaxCigarOpLength) {
                error_msg = "CIGAR operation length out of range in '" +
                            std::string(text) + "'";
                return false;
            }
            i++;
            digits++;
        }
        if (digits == 0 || i >= text.size()) {
            error_msg = "malformed CIGAR '" + std::string(text) + "'";
            return false;
        }
        if (len == 0) {
            error_msg = "zero-length CIGAR operation in '" + std::string(text) + "'";
            return false;
        }
        const char* op = std::strchr(kCigarOps, text[i]);
        // BAM_CIGAR_STR also lists 'B', which SAM text does not allow.
        if (text[i] == '\0' || !op || op - kCigarOps > BAM_CDIFF) {
            error_msg = "unknown CIGAR operation '" + std::string(1, text[i]) + "'";
            return false;
        }
        out.push_back(bam_cigar_gen(static_cast<uint32_t>(len),
                                    static_cast<uint32_t>(op - kCigarOps)));
        i++;
    }
    return true;
}

std::string format_cigar(const Cigar& cigar) {
    if (cigar.empty()) return std::string(1, kMissingField);
    std::string s;
    for (uint32_t c : cigar) {
        s += std::to_string(bam_cigar_oplen(c));
        s += bam_cigar_opchr(c);
    }
    return s;
}

int64_t cigar_ref_length(const Cigar& cigar) {
    int64_t n = 0;
    for (uint32_t c : cigar) {
        if (bam_cigar_type(bam_cigar_op(c)) & 2) n += bam_cigar_oplen(c);
    }
    return n;
}

int64_t cigar_query_length(const Cigar& cigar) {
    int64_t n = 0;
    for (uint32_t c : cigar) {
        if (bam_cigar_type(bam_cigar_op(c)) & 1) n += bam_cigar_oplen(c);
    }
    return n;
}

} // namespace samstream
