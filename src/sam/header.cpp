#include "sam/header.hpp"
#include "core/config.hpp"
#include "core/validity.hpp"
#include "sam/text_fields.hpp"

#include <cctype>

#include <htslib/kstring.h>
#include <htslib/sam.h>

namespace samstream {

static bool split_tag(std::string_view field, std::string& tag,
                      std::string& value) {
    if (field.size() < 3 || field[2] != ':') return false;
    if (!std::isalpha(static_cast<unsigned char>(field[0])) ||
        !std::isalnum(static_cast<unsigned char>(field[1]))) {
        return false;
    }
    tag = std::string(field.substr(0, 2));
    value = std::string(field.substr(3));
    return true;
}

static void append_tags(std::string& out, const HeaderTags& tags) {
    for (const auto& kv : tags) {
        out += '\t';
        out += kv.first;
        out += ':';
        out += kv.second;
    }
}

Status Header::parse_line(std::string_view line, bool& seen_hd,
                          std::string& error_msg) {
    if (line.size() < 3 || line[0] != kHeaderMarker) {
        error_msg = "malformed header line '" + std::string(line) + "'";
        return Status::kFormatError;
    }
    std::string_view type = line.substr(1, 2);
    if (line.size() > 3 && line[3] != '\t') {
        error_msg = "malformed header line '" + std::string(line) + "'";
        return Status::kFormatError;
    }

    if (type == "CO") {
        comments_.emplace_back(line.size() > 4 ? line.substr(4) : std::string_view());
        return Status::kOk;
    }

    HeaderTags tags;
    if (line.size() > 4) {
        for (auto field : split_tabs(line.substr(4))) {
            std::string tag, value;
            if (!split_tag(field, tag, value)) {
                error_msg = "malformed header field '" + std::string(field) +
                            "' in @" + std::string(type) + " line";
                return Status::kFormatError;
            }
            tags.emplace_back(std::move(tag), std::move(value));
        }
    }

    if (type == "HD") {
        if (seen_hd) {
            error_msg = "multiple @HD lines";
            return Status::kFormatError;
        }
        seen_hd = true;
        for (auto& kv : tags) {
            if (kv.first == "VN") version_ = kv.second;
            else if (kv.first == "SO") sort_order_ = kv.second;
            else if (kv.first == "GO") group_order_ = kv.second;
            else hd_tags_.push_back(std::move(kv));
        }
        if (version_.empty()) {
            error_msg = "@HD line without VN";
            return Status::kFormatError;
        }
        return Status::kOk;
    }

    if (type == "SQ") {
        std::string name;
        int64_t length = 0;
        bool has_name = false;
        HeaderTags rest;
        for (auto& kv : tags) {
            if (kv.first == "SN") {
                name = kv.second;
                has_name = true;
            } else if (kv.first == "LN") {
                int64_t v;
                if (!parse_int64(kv.second, v) || !valid_len(v)) {
                    error_msg = "invalid @SQ length '" + kv.second + "'";
                    return Status::kFormatError;
                }
                length = v;
            } else {
                rest.push_back(std::move(kv));
            }
        }
        if (!has_name || name.empty()) {
            error_msg = "@SQ line without SN";
            return Status::kFormatError;
        }
        auto ref = std::make_shared<Reference>(std::move(name), length, std::move(rest));
        return add_reference(ref, error_msg);
    }

    if (type == "RG" || type == "PG") {
        HeaderRecord rec;
        for (auto& kv : tags) {
            if (kv.first == "ID") rec.id = kv.second;
            else rec.tags.push_back(std::move(kv));
        }
        if (rec.id.empty()) {
            error_msg = "@" + std::string(type) + " line without ID";
            return Status::kFormatError;
        }
        return type == "RG" ? add_read_group(std::move(rec), error_msg)
                            : add_program(std::move(rec), error_msg);
    }

    error_msg = "unknown header line type @" + std::string(type);
    return Status::kFormatError;
}

Status Header::parse_text(std::string_view text, std::string& error_msg) {
    Header h;
    bool seen_hd = false;
    std::string normalized;

    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = nl == std::string_view::npos ? text.size() : nl;
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        Status s = h.parse_line(line, seen_hd, error_msg);
        if (s != Status::kOk) return s;
        normalized.append(line.data(), line.size());
        normalized += '\n';

        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }

    if (!normalized.empty() && !h.has_unknown_length()) {
        Status s = h.load_references(normalized, error_msg);
        if (s != Status::kOk) return s;
    }

    *this = std::move(h);
    return Status::kOk;
}

// Replace the dictionary built line by line with the one htslib parses from
// the same block.
Status Header::load_references(const std::string& text, std::string& error_msg) {
    sam_hdr_t* hdr = sam_hdr_parse(text.size(), text.c_str());
    if (!hdr) {
        error_msg = "htslib failed to parse the header";
        return Status::kFormatError;
    }

    int nsq = sam_hdr_nref(hdr);
    if (nsq < 0 || static_cast<size_t>(nsq) != refs_.size()) {
        error_msg = "htslib found " + std::to_string(nsq) + " @SQ lines, expected " +
                    std::to_string(refs_.size());
        sam_hdr_destroy(hdr);
        return Status::kFormatError;
    }

    refs_.clear();
    ref_index_.clear();

    Status s = Status::kOk;
    kstring_t ks = KS_INITIALIZE;
    for (int i = 0; i < nsq && s == Status::kOk; i++) {
        HeaderTags rest;
        ks.l = 0;
        if (sam_hdr_find_line_pos(hdr, "SQ", i, &ks) == 0 && ks.l > 4) {
            std::string_view line(ks.s, ks.l);
            for (auto field : split_tabs(line.substr(4))) {
                std::string tag, value;
                if (!split_tag(field, tag, value)) continue;
                if (tag == "SN" || tag == "LN") continue;
                rest.emplace_back(std::move(tag), std::move(value));
            }
        }
        auto ref = std::make_shared<Reference>(sam_hdr_tid2name(hdr, i),
                                               sam_hdr_tid2len(hdr, i),
                                               std::move(rest));
        s = add_reference(ref, error_msg);
    }
    ks_free(&ks);
    sam_hdr_destroy(hdr);
    return s;
}

bool Header::has_unknown_length() const {
    for (const auto& ref : refs_) {
        if (!ref->length_known()) return true;
    }
    return false;
}

std::string Header::to_text() const {
    std::string out;
    if (!has_unknown_length() && build_text(out)) return out;
    return format_text();
}

bool Header::build_text(std::string& out) const {
    sam_hdr_t* hdr = sam_hdr_init();
    if (!hdr) return false;

    bool ok = true;
    if (!version_.empty()) {
        ok = sam_hdr_add_line(hdr, "HD", "VN", version_.c_str(), NULL) == 0;
        if (ok && !sort_order_.empty()) {
            ok = sam_hdr_update_line(hdr, "HD", NULL, NULL,
                                     "SO", sort_order_.c_str(), NULL) == 0;
        }
        if (ok && !group_order_.empty()) {
            ok = sam_hdr_update_line(hdr, "HD", NULL, NULL,
                                     "GO", group_order_.c_str(), NULL) == 0;
        }
        for (size_t i = 0; ok && i < hd_tags_.size(); i++) {
            ok = sam_hdr_update_line(hdr, "HD", NULL, NULL,
                                     hd_tags_[i].first.c_str(),
                                     hd_tags_[i].second.c_str(), NULL) == 0;
        }
    }

    for (size_t r = 0; ok && r < refs_.size(); r++) {
        const Reference& ref = *refs_[r];
        std::string len_str = std::to_string(ref.length());
        ok = sam_hdr_add_line(hdr, "SQ", "SN", ref.name().c_str(),
                              "LN", len_str.c_str(), NULL) == 0;
        for (size_t i = 0; ok && i < ref.tags().size(); i++) {
            ok = sam_hdr_update_line(hdr, "SQ", "SN", ref.name().c_str(),
                                     ref.tags()[i].first.c_str(),
                                     ref.tags()[i].second.c_str(), NULL) == 0;
        }
    }

    for (size_t r = 0; ok && r < read_groups_.size(); r++) {
        const HeaderRecord& rg = read_groups_[r];
        ok = sam_hdr_add_line(hdr, "RG", "ID", rg.id.c_str(), NULL) == 0;
        for (size_t i = 0; ok && i < rg.tags.size(); i++) {
            ok = sam_hdr_update_line(hdr, "RG", "ID", rg.id.c_str(),
                                     rg.tags[i].first.c_str(),
                                     rg.tags[i].second.c_str(), NULL) == 0;
        }
    }

    // htslib does not update @PG lines in place; they and @CO go in as text.
    for (size_t r = 0; ok && r < programs_.size(); r++) {
        std::string line = "@PG\tID:" + programs_[r].id;
        append_tags(line, programs_[r].tags);
        line += '\n';
        ok = sam_hdr_add_lines(hdr, line.c_str(), line.size()) == 0;
    }
    for (size_t r = 0; ok && r < comments_.size(); r++) {
        std::string line = "@CO\t" + comments_[r] + "\n";
        ok = sam_hdr_add_lines(hdr, line.c_str(), line.size()) == 0;
    }

    if (ok) {
        const char* text = sam_hdr_str(hdr);
        if (text) {
            out.assign(text, sam_hdr_length(hdr));
        } else {
            ok = sam_hdr_length(hdr) == 0;
            out.clear();
        }
    }
    sam_hdr_destroy(hdr);
    return ok;
}

// Plain-text rendering, used for dictionaries holding references of unknown
// length.
std::string Header::format_text() const {
    std::string out;
    if (!version_.empty()) {
        out += "@HD\tVN:";
        out += version_;
        if (!sort_order_.empty()) {
            out += "\tSO:";
            out += sort_order_;
        }
        if (!group_order_.empty()) {
            out += "\tGO:";
            out += group_order_;
        }
        append_tags(out, hd_tags_);
        out += '\n';
    }
    for (const auto& ref : refs_) {
        out += "@SQ\tSN:";
        out += ref->name();
        if (ref->length_known()) {
            out += "\tLN:";
            out += std::to_string(ref->length());
        }
        append_tags(out, ref->tags());
        out += '\n';
    }
    for (const auto& rg : read_groups_) {
        out += "@RG\tID:";
        out += rg.id;
        append_tags(out, rg.tags);
        out += '\n';
    }
    for (const auto& pg : programs_) {
        out += "@PG\tID:";
        out += pg.id;
        append_tags(out, pg.tags);
        out += '\n';
    }
    for (const auto& co : comments_) {
        out += "@CO\t";
        out += co;
        out += '\n';
    }
    return out;
}

Status Header::add_reference(const std::shared_ptr<Reference>& ref,
                             std::string& error_msg) {
    if (!ref) {
        error_msg = "null reference";
        return Status::kFormatError;
    }
    if (ref_index_.count(ref->name()) > 0) {
        error_msg = "duplicate reference name '" + ref->name() + "'";
        return Status::kDuplicateReference;
    }
    if (ref->id_ >= 0) {
        error_msg = "reference '" + ref->name() + "' already belongs to a header";
        return Status::kDuplicateReference;
    }
    if (!valid_int32(static_cast<int64_t>(refs_.size()))) {
        error_msg = "too many references";
        return Status::kFormatError;
    }
    ref->id_ = static_cast<int32_t>(refs_.size());
    ref_index_.emplace(ref->name(), ref->id_);
    refs_.push_back(ref);
    return Status::kOk;
}

std::shared_ptr<const Reference> Header::reference(int32_t id) const {
    if (id < 0 || static_cast<size_t>(id) >= refs_.size()) return nullptr;
    return refs_[id];
}

std::shared_ptr<const Reference> Header::find_reference(std::string_view name) const {
    auto it = ref_index_.find(std::string(name));
    if (it == ref_index_.end()) return nullptr;
    return refs_[it->second];
}

Status Header::add_read_group(HeaderRecord rg, std::string& error_msg) {
    for (const auto& r : read_groups_) {
        if (r.id == rg.id) {
            error_msg = "duplicate read group ID '" + rg.id + "'";
            return Status::kFormatError;
        }
    }
    read_groups_.push_back(std::move(rg));
    return Status::kOk;
}

Status Header::add_program(HeaderRecord pg, std::string& error_msg) {
    for (const auto& p : programs_) {
        if (p.id == pg.id) {
            error_msg = "duplicate program ID '" + pg.id + "'";
            return Status::kFormatError;
        }
    }
    programs_.push_back(std::move(pg));
    return Status::kOk;
}

} // namespace samstream
