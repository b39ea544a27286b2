#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace samstream {

// CIGAR in htslib's packed form: length << BAM_CIGAR_SHIFT | op.
using Cigar = std::vector<uint32_t>;

// Parse the CIGAR column ("*" is the empty CIGAR).
// Returns true on success. On failure, sets error_msg.
bool parse_cigar(std::string_view text, Cigar& out, std::string& error_msg);

// Render a CIGAR ("*" when empty).
std::string format_cigar(const Cigar& cigar);

// Reference bases consumed (M, D, N, =, X).
int64_t cigar_ref_length(const Cigar& cigar);

// Query bases consumed (M, I, S, =, X).
int64_t cigar_query_length(const Cigar& cigar);

} // namespace samstream
