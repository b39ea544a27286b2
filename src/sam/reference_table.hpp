#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "sam/header.hpp"
#include "sam/record.hpp"
#include "sam/status.hpp"

namespace samstream {

class Logger;

// Name -> canonical Reference map used when a stream carries no header.
// Grows monotonically; every name it holds is also registered in the Header
// passed to reconcile().
class ReferenceTable {
public:
    // Rebind binding to the canonical Reference for its name, registering a
    // new Reference in header on first sight. Unmapped bindings are left
    // alone.
    Status reconcile(RefBinding& binding, Header& header,
                     std::string& error_msg, const Logger* logger = nullptr);

private:
    std::unordered_map<std::string, std::shared_ptr<const Reference>> refs_;
};

} // namespace samstream
