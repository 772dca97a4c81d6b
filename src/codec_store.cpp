#include "codecstore/codec_store.hpp"
#include "codecstore/reporting.hpp"
#include <utility>

namespace codecstore {

CodecStore::CodecStore(BuildKey, std::string instance, AttributeStore attributes, NodeCatalog catalog,
                       ProviderDirectory providers)
    : instance_(std::move(instance)),
      attributes_(std::move(attributes)),
      catalog_(std::move(catalog)),
      providers_(std::move(providers)) {}

CodecStore::Builder::Builder(std::string instance) : instance_(std::move(instance)) {}

Status CodecStore::Builder::track(Status s) {
    if (s != Status::Ok && status_ == Status::Ok) status_ = s;
    return s;
}

void CodecStore::Builder::fail(Status s) {
    track(s);
}

Status CodecStore::Builder::set_prefix(std::string prefix) {
    if (!catalog_.roles().empty()) {
        reporting::error("codecstore", "prefix changed after roles were registered");
        return track(Status::BadValue);
    }
    catalog_ = NodeCatalog(PrefixPolicy(std::move(prefix)));
    return Status::Ok;
}

Status CodecStore::Builder::add_service_attribute(const Attribute& attr) {
    return track(attributes_.add(attr));
}

Status CodecStore::Builder::update_service_attribute(const Attribute& attr) {
    return track(attributes_.update(attr));
}

Status CodecStore::Builder::add_role(RoleInfo role) {
    return track(catalog_.add_role(std::move(role)));
}

Status CodecStore::Builder::add_provider(std::shared_ptr<omx::Provider> provider) {
    return track(providers_.add(std::move(provider)));
}

Status CodecStore::Builder::add_provider(const std::string& name, std::shared_ptr<omx::Provider> provider) {
    return track(providers_.add(name, std::move(provider)));
}

std::unique_ptr<CodecStore> CodecStore::Builder::build(Status* status) {
    auto finish = [&](Status s) -> std::unique_ptr<CodecStore> {
        if (status) *status = s;
        reporting::error("codecstore", "instance '" + instance_ + "' failed to load: " + to_string(s));
        return nullptr;
    };

    if (built_) return finish(Status::NoInit);
    if (status_ != Status::Ok) return finish(status_);

    for (const auto& role : catalog_.roles()) {
        for (const auto& node : role.nodes) {
            if (!providers_.contains(node.owner)) {
                reporting::error("codecstore", "node '" + node.name + "' in role '" + role.role +
                                 "' is owned by unknown provider '" + node.owner + "'");
                status_ = Status::NameNotFound;
                return finish(status_);
            }
        }
    }

    built_ = true;
    attributes_.seal();
    reporting::info("codecstore", "instance '" + instance_ + "' loaded: " +
                    std::to_string(attributes_.size()) + " attributes, " +
                    std::to_string(catalog_.roles().size()) + " roles, " +
                    std::to_string(catalog_.node_count()) + " nodes, prefix '" +
                    catalog_.prefix_policy().prefix() + "'");
    if (status) *status = Status::Ok;
    return std::make_unique<CodecStore>(BuildKey{}, instance_, std::move(attributes_), std::move(catalog_),
                                        std::move(providers_));
}

} // namespace codecstore
