#include "sam/reference_table.hpp"
#include "util/logger.hpp"

namespace samstream {

Status ReferenceTable::reconcile(RefBinding& binding, Header& header,
                                 std::string& error_msg, const Logger* logger) {
    if (!binding.is_mapped()) return Status::kOk;

    const std::string& name = binding.name();
    auto it = refs_.find(name);
    if (it != refs_.end()) {
        binding = RefBinding::mapped(it->second);
        return Status::kOk;
    }

    // First-seen wins: the decoded length (if any) is kept as is.
    const Reference& decoded = *binding.reference();
    auto ref = std::make_shared<Reference>(decoded.name(), decoded.length(),
                                           decoded.tags());
    Status s = header.add_reference(ref, error_msg);
    if (s != Status::kOk) return s;

    if (logger) {
        logger->debug("discovered reference %s (id %d)",
                      ref->name().c_str(), ref->id());
    }
    refs_.emplace(ref->name(), ref);
    binding = RefBinding::mapped(ref);
    return Status::kOk;
}

} // namespace samstream
