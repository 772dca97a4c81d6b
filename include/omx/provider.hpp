#pragma once
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace omx {

// Handle to a component able to instantiate the nodes it owns. The store only
// hands these out; node construction and buffer handling stay with the provider.
class Provider {
public:
    virtual ~Provider() = default;
    virtual std::string name() const = 0;
    virtual std::vector<std::string> list_nodes() const = 0;
    virtual bool owns_node(const std::string& node) const {
        auto nodes = list_nodes();
        return std::find(nodes.begin(), nodes.end(), node) != nodes.end();
    }
};

/// In-process provider over a fixed node list (implemented in provider.cpp)
std::shared_ptr<Provider> make_listed_provider(std::string name, std::vector<std::string> nodes);

} // namespace omx
