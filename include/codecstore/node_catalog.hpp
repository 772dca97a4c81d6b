#pragma once
#include "prefix_policy.hpp"
#include "types.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>

namespace codecstore {

// Roles in registration order, each with its nodes in preference order.
// Nodes are validated against the prefix when their role is registered; the
// query path never filters or reorders.
class NodeCatalog {
public:
    explicit NodeCatalog(PrefixPolicy policy = PrefixPolicy{}) : policy_(std::move(policy)) {}

    Status add_role(RoleInfo role);

    const RoleList& roles() const { return roles_; }
    const RoleInfo* find_role(const std::string& role) const;
    const PrefixPolicy& prefix_policy() const { return policy_; }
    size_t node_count() const { return node_count_; }

private:
    PrefixPolicy policy_;
    RoleList roles_;
    std::unordered_map<std::string, size_t> index_;
    size_t node_count_{0};
};

} // namespace codecstore
