#pragma once
#include "omx/provider.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace codecstore {

// Provider handles by name. find() is a plain lookup: an unknown name yields
// a null handle and nothing is created on demand.
class ProviderDirectory {
public:
    Status add(std::shared_ptr<omx::Provider> provider);
    Status add(const std::string& name, std::shared_ptr<omx::Provider> provider);

    std::shared_ptr<omx::Provider> find(const std::string& name) const {
        auto it = providers_.find(name);
        if (it == providers_.end()) return nullptr;
        return it->second;
    }
    bool contains(const std::string& name) const { return providers_.count(name) != 0; }
    const std::vector<std::string>& names() const { return names_; }

private:
    std::unordered_map<std::string, std::shared_ptr<omx::Provider>> providers_;
    std::vector<std::string> names_;
};

} // namespace codecstore
