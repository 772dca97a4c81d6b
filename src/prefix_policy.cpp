#include "codecstore/prefix_policy.hpp"
#include <algorithm>

namespace codecstore {

std::string PrefixPolicy::common_prefix(const std::vector<std::string>& names) {
    if (names.empty()) return {};
    const std::string& first = names.front();
    auto last = first.cend();
    for (size_t i = 1; i < names.size(); ++i) {
        const std::string& n = names[i];
        size_t limit = std::min<size_t>(last - first.cbegin(), n.size());
        last = std::mismatch(first.cbegin(), first.cbegin() + limit, n.cbegin()).first;
    }
    return std::string(first.cbegin(), last);
}

} // namespace codecstore
