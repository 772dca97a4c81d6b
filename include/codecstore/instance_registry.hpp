#pragma once
#include "codec_store.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace codecstore {

// Published stores by deployment name ("platform", "vendor").
class InstanceRegistry {
public:
    Status publish(const std::string& instance, std::shared_ptr<const CodecStore> store) {
        if (!store) return Status::BadValue;
        std::lock_guard<std::mutex> lk(mu_);
        if (!stores_.emplace(instance, std::move(store)).second) return Status::AlreadyExists;
        return Status::Ok;
    }
    std::shared_ptr<const CodecStore> lookup(const std::string& instance) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = stores_.find(instance);
        if (it == stores_.end()) return nullptr;
        return it->second;
    }
private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<const CodecStore>> stores_;
};

} // namespace codecstore
