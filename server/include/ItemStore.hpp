#pragma once

#include "Item.hpp"
#include <cstdint>
#include <optional>

namespace catalog {

// Durable full-collection storage. Every request loads the whole collection
// and, when it changes anything, saves the whole collection back.
class ItemStore {
public:
    virtual ~ItemStore() = default;

    // never fails: missing or unreadable state loads as an empty collection
    virtual ItemCollection load() const = 0;

    // replaces the stored collection; false on any I/O failure
    virtual bool save(const ItemCollection& items) = 0;
};

// 1 for an empty collection, otherwise one past the largest id;
// nullopt once the largest id is INT64_MAX
std::optional<int64_t> nextId(const ItemCollection& items);

} // namespace catalog
