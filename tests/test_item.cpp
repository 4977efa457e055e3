#include <gtest/gtest.h>
#include "Item.hpp"
#include "Timestamp.hpp"
#include <iostream>

using catalog::Item;

// --- Item JSON mapping ---

TEST(ItemTest, SerializesAllFields) {
    Item item(7, "Widget", std::string("Blue"), 9.99, "2024-01-01T10:00:00.000000", "2024-01-02T10:00:00.000000");
    nlohmann::json j = item;

    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["name"], "Widget");
    EXPECT_EQ(j["description"], "Blue");
    EXPECT_DOUBLE_EQ(j["price"].get<double>(), 9.99);
    EXPECT_EQ(j["created_at"], "2024-01-01T10:00:00.000000");
    EXPECT_EQ(j["updated_at"], "2024-01-02T10:00:00.000000");
    EXPECT_EQ(j.size(), 6u);
}

TEST(ItemTest, MissingDescriptionSerializesAsNull) {
    Item item(1, "Widget", std::nullopt, 1.0, "t", "t");
    nlohmann::json j = item;

    ASSERT_TRUE(j.contains("description"));
    EXPECT_TRUE(j["description"].is_null());
}

TEST(ItemTest, DeserializesFromPersistedObject) {
    auto j = nlohmann::json::parse(R"({
        "id": 3, "name": "Gadget", "description": null, "price": 12,
        "created_at": "2024-05-01T08:00:00.000001", "updated_at": "2024-05-01T09:00:00.000001"
    })");
    Item item = j.get<Item>();

    EXPECT_EQ(item.getId(), 3);
    EXPECT_EQ(item.getName(), "Gadget");
    EXPECT_FALSE(item.getDescription().has_value());
    EXPECT_DOUBLE_EQ(item.getPrice(), 12.0);
    EXPECT_EQ(item.getCreatedAt(), "2024-05-01T08:00:00.000001");
    EXPECT_EQ(item.getUpdatedAt(), "2024-05-01T09:00:00.000001");
}

TEST(ItemTest, DeserializeRejectsMissingKeysAndWrongTypes) {
    auto missingPrice = nlohmann::json::parse(R"({"id": 1, "name": "x", "created_at": "a", "updated_at": "b"})");
    EXPECT_THROW(missingPrice.get<Item>(), nlohmann::json::exception);

    auto numericName = nlohmann::json::parse(R"({"id": 1, "name": 5, "price": 1.0, "created_at": "a", "updated_at": "b"})");
    EXPECT_THROW(numericName.get<Item>(), nlohmann::json::exception);
}

TEST(ItemTest, EqualityComparesEveryField) {
    Item a(1, "Widget", std::nullopt, 2.5, "t1", "t1");
    Item b = a;
    EXPECT_TRUE(a == b);

    b.setDescription(std::string(""));
    EXPECT_TRUE(a != b);  // empty string is not the same as null

    b = a;
    b.setUpdatedAt("t2");
    EXPECT_FALSE(a == b);
}

// --- Timestamps ---

TEST(TimestampTest, FormatsWithMicroseconds) {
    auto tp = std::chrono::system_clock::from_time_t(1700000000) + std::chrono::microseconds(42);
    std::string formatted = catalog::formatTimestamp(tp);

    ASSERT_EQ(formatted.size(), 26u);
    EXPECT_EQ(formatted[4], '-');
    EXPECT_EQ(formatted[10], 'T');
    EXPECT_EQ(formatted[19], '.');
    EXPECT_EQ(formatted.substr(20), "000042");
}

TEST(TimestampTest, LaterInstantsSortLater) {
    auto tp = std::chrono::system_clock::from_time_t(1700000000);
    EXPECT_LT(catalog::formatTimestamp(tp), catalog::formatTimestamp(tp + std::chrono::seconds(1)));
    EXPECT_LT(catalog::formatTimestamp(tp), catalog::formatTimestamp(tp + std::chrono::microseconds(1)));
}

TEST(ItemTest, SummaryRoundsPriceWithoutTouchingCout) {
    Item item(3, "Widget", std::nullopt, 9.5, "t0", "2024-01-02T10:00:00.000000");
    auto flags = std::cout.flags();
    auto precision = std::cout.precision();

    EXPECT_EQ(catalog::formatSummary(item), "[3] Widget @ 9.50 (updated 2024-01-02T10:00:00.000000)");
    EXPECT_EQ(std::cout.flags(), flags);
    EXPECT_EQ(std::cout.precision(), precision);
}
