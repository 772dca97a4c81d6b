#include "codecstore/node_catalog.hpp"
#include "codecstore/reporting.hpp"
#include <unordered_set>

namespace codecstore {

Status NodeCatalog::add_role(RoleInfo role) {
    if (role.role.empty()) {
        reporting::error("catalog", "role with empty name");
        return Status::BadValue;
    }
    if (index_.count(role.role)) {
        reporting::error("catalog", "duplicate role '" + role.role + "'");
        return Status::AlreadyExists;
    }

    std::unordered_set<std::string> seen;
    for (const auto& node : role.nodes) {
        if (!policy_.matches(node.name)) {
            reporting::error("catalog", "node '" + node.name + "' in role '" + role.role +
                             "' does not start with prefix '" + policy_.prefix() + "'");
            return Status::BadValue;
        }
        if (node.owner.empty()) {
            reporting::error("catalog", "node '" + node.name + "' has no owner");
            return Status::BadValue;
        }
        if (!seen.insert(node.name).second) {
            reporting::error("catalog", "node '" + node.name + "' listed twice in role '" + role.role + "'");
            return Status::AlreadyExists;
        }
    }

    reporting::debug("catalog", "role " + role.role + " (" + role.type + ") nodes=" +
                     std::to_string(role.nodes.size()));
    node_count_ += role.nodes.size();
    index_.emplace(role.role, roles_.size());
    roles_.push_back(std::move(role));
    return Status::Ok;
}

const RoleInfo* NodeCatalog::find_role(const std::string& role) const {
    auto it = index_.find(role);
    if (it == index_.end()) return nullptr;
    return &roles_[it->second];
}

} // namespace codecstore
