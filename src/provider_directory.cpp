#include "codecstore/provider_directory.hpp"
#include "codecstore/reporting.hpp"
#include <utility>

namespace codecstore {

Status ProviderDirectory::add(std::shared_ptr<omx::Provider> provider) {
    if (!provider) return Status::BadValue;
    auto name = provider->name();
    return add(name, std::move(provider));
}

Status ProviderDirectory::add(const std::string& name, std::shared_ptr<omx::Provider> provider) {
    if (!provider || name.empty()) {
        reporting::error("providers", "refusing empty provider registration");
        return Status::BadValue;
    }
    if (contains(name)) {
        reporting::error("providers", "provider '" + name + "' registered twice");
        return Status::AlreadyExists;
    }
    providers_.emplace(name, std::move(provider));
    names_.push_back(name);
    reporting::debug("providers", "registered " + name);
    return Status::Ok;
}

} // namespace codecstore
