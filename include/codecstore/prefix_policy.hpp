#pragma once
#include <string>
#include <vector>
#include <utility>

namespace codecstore {

// The namespace every node name of one deployment lives in, e.g. "OMX.".
class PrefixPolicy {
public:
    PrefixPolicy() = default;
    explicit PrefixPolicy(std::string prefix) : prefix_(std::move(prefix)) {}

    const std::string& prefix() const { return prefix_; }
    bool matches(const std::string& name) const {
        return name.compare(0, prefix_.size(), prefix_) == 0;
    }

    // Longest prefix shared by all names; empty for an empty list.
    static std::string common_prefix(const std::vector<std::string>& names);

private:
    std::string prefix_;
};

} // namespace codecstore
