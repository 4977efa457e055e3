#include "Item.hpp"
#include <iomanip>
#include <sstream>

namespace catalog {

Item::Item()
    : id_(0), name_(""), description_(std::nullopt), price_(0.0) {
}

Item::Item(int64_t id, const std::string& name, std::optional<std::string> description,
           double price, const std::string& createdAt, const std::string& updatedAt)
    : id_(id), name_(name), description_(std::move(description)), price_(price),
      createdAt_(createdAt), updatedAt_(updatedAt) {
}

bool Item::operator==(const Item& other) const {
    return id_ == other.id_ && name_ == other.name_ &&
           description_ == other.description_ && price_ == other.price_ &&
           createdAt_ == other.createdAt_ && updatedAt_ == other.updatedAt_;
}

void to_json(nlohmann::json& j, const Item& item) {
    // key order matches the persisted layout: id, name, description, price, timestamps
    j = nlohmann::json::object();
    j["id"] = item.getId();
    j["name"] = item.getName();
    if (item.getDescription()) {
        j["description"] = *item.getDescription();
    } else {
        j["description"] = nullptr;
    }
    j["price"] = item.getPrice();
    j["created_at"] = item.getCreatedAt();
    j["updated_at"] = item.getUpdatedAt();
}

void from_json(const nlohmann::json& j, Item& item) {
    // throws nlohmann::json::exception on a missing key or a wrong type
    std::optional<std::string> description;
    if (j.contains("description") && !j.at("description").is_null()) {
        description = j.at("description").get<std::string>();
    }

    item = Item(j.at("id").get<int64_t>(),
                j.at("name").get<std::string>(),
                std::move(description),
                j.at("price").get<double>(),
                j.at("created_at").get<std::string>(),
                j.at("updated_at").get<std::string>());
}

std::string formatSummary(const Item& item) {
    std::ostringstream line;
    line << "[" << item.getId() << "] " << item.getName()
         << " @ " << std::fixed << std::setprecision(2) << item.getPrice()
         << " (updated " << item.getUpdatedAt() << ")";
    return line.str();
}

} // namespace catalog
