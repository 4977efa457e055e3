#include "ItemStore.hpp"
#include <algorithm>
#include <limits>

namespace catalog {

std::optional<int64_t> nextId(const ItemCollection& items) {
    if (items.empty()) {
        return 1;
    }
    auto highest = std::max_element(items.begin(), items.end(),
        [](const Item& a, const Item& b) { return a.getId() < b.getId(); });
    if (highest->getId() == std::numeric_limits<int64_t>::max()) {
        return std::nullopt;
    }
    return highest->getId() + 1;
}

} // namespace catalog
