#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace samstream {

// One optional field, "TG:T:VALUE" in SAM text. value keeps the text form.
struct AuxField {
    std::string tag;    // two characters, [A-Za-z][A-Za-z0-9]
    char type = 'Z';    // one of A i f Z H B
    std::string value;
};

// Parse one optional field. Returns true on success. On failure, sets error_msg.
bool parse_aux_field(std::string_view text, AuxField& out,
                     std::string& error_msg);

// Check tag syntax and that value is well formed for type.
bool validate_aux_field(const AuxField& field, std::string& error_msg);

std::string format_aux_field(const AuxField& field);

// Find a field by tag. Returns nullptr if absent.
const AuxField* find_aux_field(const std::vector<AuxField>& fields,
                               std::string_view tag);

} // namespace samstream
