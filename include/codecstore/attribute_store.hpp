#pragma once
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace codecstore {

// Service-scoped attributes in configuration order. Filled at startup, then
// sealed; reads before seal() report NoInit.
class AttributeStore {
public:
    Status add(const Attribute& attr);
    Status update(const Attribute& attr);
    void seal() { sealed_ = true; }

    Status list(AttributeList& out) const;
    std::optional<std::string> value_of(const std::string& key) const;
    bool contains(const std::string& key) const { return index_.count(key) != 0; }
    size_t size() const { return attrs_.size(); }

private:
    AttributeList attrs_;
    std::unordered_map<std::string, size_t> index_;
    bool sealed_{false};
};

} // namespace codecstore
