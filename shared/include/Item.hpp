#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace catalog {

class Item {
public:
    Item();
    Item(int64_t id, const std::string& name, std::optional<std::string> description,
         double price, const std::string& createdAt, const std::string& updatedAt);

    int64_t getId() const { return id_; }
    const std::string& getName() const { return name_; }
    const std::optional<std::string>& getDescription() const { return description_; }
    double getPrice() const { return price_; }
    const std::string& getCreatedAt() const { return createdAt_; }
    const std::string& getUpdatedAt() const { return updatedAt_; }

    void setName(const std::string& name) { name_ = name; }
    void setDescription(std::optional<std::string> description) { description_ = std::move(description); }
    void setPrice(double price) { price_ = price; }
    void setUpdatedAt(const std::string& updatedAt) { updatedAt_ = updatedAt; }

    bool operator==(const Item& other) const;
    bool operator!=(const Item& other) const { return !(*this == other); }

private:
    int64_t id_;
    std::string name_;
    std::optional<std::string> description_;
    double price_;
    std::string createdAt_;
    std::string updatedAt_;
};

// the full ordered set of items, the unit of every load and save
using ItemCollection = std::vector<Item>;

// fields accepted when creating an item
struct ItemDraft {
    std::string name;
    std::optional<std::string> description;
    double price = 0.0;
};

// fields supplied to an update. an empty optional means the key was omitted
// from the request and the stored value must stay as it is.
struct ItemPatch {
    std::optional<std::string> name;
    // outer optional: key present or not; inner optional: string or null
    std::optional<std::optional<std::string>> description;
    std::optional<double> price;

    bool isEmpty() const { return !name && !description && !price; }
};

// json mapping used for both the data file and http bodies
void to_json(nlohmann::json& j, const Item& item);
void from_json(const nlohmann::json& j, Item& item);

// one console line: "[id] name @ price (updated ...)", price to two decimals
std::string formatSummary(const Item& item);

} // namespace catalog
