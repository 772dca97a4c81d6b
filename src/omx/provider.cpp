#include "omx/provider.hpp"
#include <utility>

namespace omx {

namespace {

class ListedProvider : public Provider {
public:
    ListedProvider(std::string name, std::vector<std::string> nodes)
        : name_(std::move(name)), nodes_(std::move(nodes)) {}
    std::string name() const override { return name_; }
    std::vector<std::string> list_nodes() const override { return nodes_; }
private:
    std::string name_;
    std::vector<std::string> nodes_;
};

} // namespace

std::shared_ptr<Provider> make_listed_provider(std::string name, std::vector<std::string> nodes) {
    return std::make_shared<ListedProvider>(std::move(name), std::move(nodes));
}

} // namespace omx
