#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sam/status.hpp"

namespace samstream {

class Header;

using HeaderTags = std::vector<std::pair<std::string, std::string>>;

// A named reference sequence (@SQ). The id is assigned by the Header that
// registers it and is -1 until then.
class Reference {
public:
    // length 0 means unknown.
    explicit Reference(std::string name, int64_t length = 0,
                       HeaderTags tags = {})
        : name_(std::move(name)), length_(length), tags_(std::move(tags)) {}

    const std::string& name() const { return name_; }
    int64_t length() const { return length_; }
    bool length_known() const { return length_ > 0; }
    int32_t id() const { return id_; }

    // @SQ tags other than SN and LN (AS, M5, SP, UR, ...), in input order.
    const HeaderTags& tags() const { return tags_; }

private:
    friend class Header;

    std::string name_;
    int64_t length_;
    HeaderTags tags_;
    int32_t id_ = -1;
};

// @RG or @PG line: ID plus remaining tags in input order.
struct HeaderRecord {
    std::string id;
    HeaderTags tags;
};

// Document-level metadata: @HD fields, the ordered reference dictionary,
// read groups, programs and comments.
class Header {
public:
    // Parse a complete header block (one or more '@' lines).
    // On failure *this is left unchanged. When every @SQ carries LN the
    // reference dictionary is taken from htslib's parse of the block.
    Status parse_text(std::string_view text, std::string& error_msg);

    // htslib renders the text unless a reference has no known length;
    // htslib cannot hold an @SQ without LN.
    std::string to_text() const;

    // Register ref under the next sequential id. Rejects a name already in
    // the dictionary and a reference already registered by another Header.
    Status add_reference(const std::shared_ptr<Reference>& ref,
                         std::string& error_msg);

    const std::vector<std::shared_ptr<const Reference>>& references() const {
        return refs_;
    }
    size_t num_references() const { return refs_.size(); }

    // Returns nullptr if id is out of range.
    std::shared_ptr<const Reference> reference(int32_t id) const;

    // Returns nullptr if no reference has this name.
    std::shared_ptr<const Reference> find_reference(std::string_view name) const;

    const std::string& version() const { return version_; }
    const std::string& sort_order() const { return sort_order_; }
    const std::string& group_order() const { return group_order_; }

    // @HD tags other than VN, SO and GO.
    const HeaderTags& hd_tags() const { return hd_tags_; }

    const std::vector<HeaderRecord>& read_groups() const { return read_groups_; }
    const std::vector<HeaderRecord>& programs() const { return programs_; }
    const std::vector<std::string>& comments() const { return comments_; }

    Status add_read_group(HeaderRecord rg, std::string& error_msg);
    Status add_program(HeaderRecord pg, std::string& error_msg);

private:
    Status parse_line(std::string_view line, bool& seen_hd,
                      std::string& error_msg);
    Status load_references(const std::string& text, std::string& error_msg);
    bool has_unknown_length() const;
    bool build_text(std::string& out) const;
    std::string format_text() const;

    std::string version_;
    std::string sort_order_;
    std::string group_order_;
    HeaderTags hd_tags_;

    std::vector<std::shared_ptr<const Reference>> refs_;
    std::unordered_map<std::string, int32_t> ref_index_;

    std::vector<HeaderRecord> read_groups_;
    std::vector<HeaderRecord> programs_;
    std::vector<std::string> comments_;
};

} // namespace samstream
