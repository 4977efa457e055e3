#pragma once

#include "Item.hpp"
#include "ItemStore.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace catalog {

// Item operations over the record store. Each one loads the full collection,
// changes it and saves the full collection back. storeMutex_ serializes those
// cycles so concurrent callers in this process cannot lose each other's
// writes; separate processes sharing one file still can.
class ItemManager {
public:
    explicit ItemManager(std::shared_ptr<ItemStore> store, Clock clock = systemClock());
    ~ItemManager();

    enum class OperationResult {
        SUCCESS,
        NOT_FOUND,
        STORAGE_ERROR
    };

    OperationResult createItem(const ItemDraft& draft, Item& created);

    ItemCollection listItems();

    std::optional<Item> getItem(int64_t id);

    // fields absent from the patch are left untouched; id and created_at never change
    OperationResult updateItem(int64_t id, const ItemPatch& patch, Item& updated);

    OperationResult deleteItem(int64_t id);

    // unconditional, succeeds on an already empty store
    OperationResult deleteAllItems();

    size_t count();

private:
    std::shared_ptr<ItemStore> store_;
    Clock clock_;
    std::mutex storeMutex_;

    std::string now() const;
};

const char* operationResultToString(ItemManager::OperationResult result);

} // namespace catalog
