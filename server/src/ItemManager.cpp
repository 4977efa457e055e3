#include "ItemManager.hpp"
#include <algorithm>
#include <iostream>

namespace catalog {

namespace {

ItemCollection::iterator findById(ItemCollection& items, int64_t id) {
    return std::find_if(items.begin(), items.end(),
                        [id](const Item& item) { return item.getId() == id; });
}

} // namespace

ItemManager::ItemManager(std::shared_ptr<ItemStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
}

ItemManager::~ItemManager() = default;

std::string ItemManager::now() const {
    return formatTimestamp(clock_());
}

ItemManager::OperationResult ItemManager::createItem(const ItemDraft& draft, Item& created) {
    std::lock_guard<std::mutex> lock(storeMutex_);

    ItemCollection items = store_->load();
    auto id = nextId(items);
    if (!id) {
        std::cerr << "No item id left to assign" << std::endl;
        return OperationResult::STORAGE_ERROR;
    }
    std::string timestamp = now();

    Item item(*id, draft.name, draft.description, draft.price, timestamp, timestamp);
    items.push_back(item);

    if (!store_->save(items)) {
        std::cerr << "Failed to persist new item " << item.getId() << std::endl;
        return OperationResult::STORAGE_ERROR;
    }

    std::cout << "Created item " << item.getId() << " (" << item.getName() << ")" << std::endl;
    created = item;
    return OperationResult::SUCCESS;
}

ItemCollection ItemManager::listItems() {
    std::lock_guard<std::mutex> lock(storeMutex_);
    return store_->load();
}

std::optional<Item> ItemManager::getItem(int64_t id) {
    std::lock_guard<std::mutex> lock(storeMutex_);

    ItemCollection items = store_->load();
    auto it = findById(items, id);
    if (it == items.end()) {
        return std::nullopt;
    }
    return *it;
}

ItemManager::OperationResult ItemManager::updateItem(int64_t id, const ItemPatch& patch, Item& updated) {
    std::lock_guard<std::mutex> lock(storeMutex_);

    ItemCollection items = store_->load();
    auto it = findById(items, id);
    if (it == items.end()) {
        return OperationResult::NOT_FOUND;
    }

    Item& item = *it;
    if (patch.name) {
        item.setName(*patch.name);
    }
    if (patch.description) {
        item.setDescription(*patch.description);
    }
    if (patch.price) {
        item.setPrice(*patch.price);
    }

    // a clock stepping backwards must not put updated_at before created_at
    item.setUpdatedAt(std::max(now(), item.getCreatedAt()));

    if (!store_->save(items)) {
        std::cerr << "Failed to persist update of item " << id << std::endl;
        return OperationResult::STORAGE_ERROR;
    }

    std::cout << "Updated item " << id << std::endl;
    updated = item;
    return OperationResult::SUCCESS;
}

ItemManager::OperationResult ItemManager::deleteItem(int64_t id) {
    std::lock_guard<std::mutex> lock(storeMutex_);

    ItemCollection items = store_->load();
    auto it = findById(items, id);
    if (it == items.end()) {
        return OperationResult::NOT_FOUND;
    }

    items.erase(it);

    if (!store_->save(items)) {
        std::cerr << "Failed to persist removal of item " << id << std::endl;
        return OperationResult::STORAGE_ERROR;
    }

    std::cout << "Deleted item " << id << std::endl;
    return OperationResult::SUCCESS;
}

ItemManager::OperationResult ItemManager::deleteAllItems() {
    std::lock_guard<std::mutex> lock(storeMutex_);

    if (!store_->save(ItemCollection{})) {
        std::cerr << "Failed to persist empty collection" << std::endl;
        return OperationResult::STORAGE_ERROR;
    }

    std::cout << "Deleted all items" << std::endl;
    return OperationResult::SUCCESS;
}

size_t ItemManager::count() {
    std::lock_guard<std::mutex> lock(storeMutex_);
    return store_->load().size();
}

const char* operationResultToString(ItemManager::OperationResult result) {
    switch (result) {
        case ItemManager::OperationResult::SUCCESS: return "success";
        case ItemManager::OperationResult::NOT_FOUND: return "not found";
        case ItemManager::OperationResult::STORAGE_ERROR: return "storage error";
    }
    return "unknown";
}

} // namespace catalog
