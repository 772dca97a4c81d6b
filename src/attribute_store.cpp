#include "codecstore/attribute_store.hpp"
#include "codecstore/reporting.hpp"

namespace codecstore {

Status AttributeStore::add(const Attribute& attr) {
    if (sealed_) return Status::BadValue;
    if (attr.key.empty()) {
        reporting::error("attributes", "service attribute with empty key");
        return Status::BadValue;
    }
    if (contains(attr.key)) {
        reporting::error("attributes", "duplicate service attribute '" + attr.key + "'");
        return Status::AlreadyExists;
    }
    index_.emplace(attr.key, attrs_.size());
    attrs_.push_back(attr);
    return Status::Ok;
}

Status AttributeStore::update(const Attribute& attr) {
    if (sealed_) return Status::BadValue;
    auto it = index_.find(attr.key);
    if (it == index_.end()) {
        reporting::error("attributes", "cannot update missing service attribute '" + attr.key + "'");
        return Status::NameNotFound;
    }
    attrs_[it->second].value = attr.value;
    return Status::Ok;
}

Status AttributeStore::list(AttributeList& out) const {
    if (!sealed_) return Status::NoInit;
    out = attrs_;
    return Status::Ok;
}

std::optional<std::string> AttributeStore::value_of(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return attrs_[it->second].value;
}

} // namespace codecstore
