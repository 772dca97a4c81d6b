#pragma once
#include "attribute_store.hpp"
#include "node_catalog.hpp"
#include "provider_directory.hpp"
#include "types.hpp"
#include <memory>
#include <string>

namespace codecstore {

inline constexpr const char kPlatformInstance[] = "platform";
inline constexpr const char kVendorInstance[] = "vendor";

// Read-only view over one deployment's configuration. Instances only come out
// of Builder::build(), fully validated; every query is a lock-free read.
class CodecStore {
    // Only Builder can name this, so only Builder can construct a store.
    struct BuildKey {
        explicit BuildKey() = default;
    };

public:
    class Builder;

    CodecStore(BuildKey, std::string instance, AttributeStore attributes, NodeCatalog catalog,
               ProviderDirectory providers);

    const std::string& instance_name() const { return instance_; }

    Status list_service_attributes(AttributeList& out) const { return attributes_.list(out); }
    const RoleList& list_roles() const { return catalog_.roles(); }
    const std::string& get_node_prefix() const { return catalog_.prefix_policy().prefix(); }

    // Null when no provider of that name is registered.
    std::shared_ptr<omx::Provider> get_omx(const std::string& name) const { return providers_.find(name); }

    const RoleInfo* find_role(const std::string& role) const { return catalog_.find_role(role); }
    const std::vector<std::string>& provider_names() const { return providers_.names(); }

private:
    std::string instance_;
    AttributeStore attributes_;
    NodeCatalog catalog_;
    ProviderDirectory providers_;
};

// Startup-time assembly. The first failing call is remembered and makes
// build() fail with that status.
class CodecStore::Builder {
public:
    explicit Builder(std::string instance = kPlatformInstance);

    // Must precede add_role().
    Status set_prefix(std::string prefix);

    Status add_service_attribute(const Attribute& attr);
    Status update_service_attribute(const Attribute& attr);
    bool has_service_attribute(const std::string& key) const { return attributes_.contains(key); }

    Status add_role(RoleInfo role);
    Status add_provider(std::shared_ptr<omx::Provider> provider);
    Status add_provider(const std::string& name, std::shared_ptr<omx::Provider> provider);

    // Record a failure that happened outside the builder (e.g. a config file).
    void fail(Status s);
    Status status() const { return status_; }

    // Checks that every node owner resolves, then hands out the store. Null on
    // any configuration error; *status receives the reason when given.
    std::unique_ptr<CodecStore> build(Status* status = nullptr);

private:
    Status track(Status s);

    std::string instance_;
    AttributeStore attributes_;
    NodeCatalog catalog_;
    ProviderDirectory providers_;
    Status status_{Status::Ok};
    bool built_{false};
};

} // namespace codecstore
