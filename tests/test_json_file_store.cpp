#include <gtest/gtest.h>
#include "JsonFileItemStore.hpp"
#include "TestSupport.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using catalog::Item;
using catalog::ItemCollection;
using catalog::JsonFileItemStore;

namespace {

void writeText(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

std::string readText(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

ItemCollection sampleItems() {
    return {
        Item(1, "Widget", std::nullopt, 9.99, "2024-01-01T00:00:00.000000", "2024-01-01T00:00:00.000000"),
        Item(5, "Gadget", std::string("Shiny"), 3.5, "2024-01-02T00:00:00.000000", "2024-01-03T00:00:00.000000"),
        Item(2, "Doohickey", std::string(""), 100.0, "2024-01-04T00:00:00.000000", "2024-01-04T00:00:00.000000"),
    };
}

} // namespace

// --- load ---

TEST(JsonFileItemStoreTest, MissingFileLoadsEmpty) {
    catalog_test::TempDir dir;
    JsonFileItemStore store(dir.file("data.json"));

    EXPECT_TRUE(store.load().empty());
    EXPECT_FALSE(std::filesystem::exists(dir.file("data.json")));
}

TEST(JsonFileItemStoreTest, UnreadableContentLoadsEmpty) {
    catalog_test::TempDir dir;
    std::string path = dir.file("data.json");
    JsonFileItemStore store(path);

    writeText(path, "");
    EXPECT_TRUE(store.load().empty());

    writeText(path, "[{\"id\": 1, \"name\": \"trunc");
    EXPECT_TRUE(store.load().empty());

    writeText(path, "{\"id\": 1}");
    EXPECT_TRUE(store.load().empty());

    // one bad element discards the whole collection rather than loading part of it
    writeText(path, R"([
        {"id": 1, "name": "ok", "description": null, "price": 1.0, "created_at": "a", "updated_at": "a"},
        {"id": "two", "name": "bad", "description": null, "price": 1.0, "created_at": "a", "updated_at": "a"}
    ])");
    EXPECT_TRUE(store.load().empty());
}

// --- save ---

TEST(JsonFileItemStoreTest, SaveThenLoadPreservesItemsAndOrder) {
    catalog_test::TempDir dir;
    JsonFileItemStore store(dir.file("data.json"));

    ItemCollection items = sampleItems();
    ASSERT_TRUE(store.save(items));

    ItemCollection loaded = store.load();
    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_EQ(loaded, items);
    EXPECT_EQ(loaded[1].getId(), 5);
    EXPECT_EQ(loaded[2].getDescription(), std::optional<std::string>(""));
}

TEST(JsonFileItemStoreTest, FileHoldsAJsonArrayOfItemObjects) {
    catalog_test::TempDir dir;
    std::string path = dir.file("data.json");
    JsonFileItemStore store(path);
    ASSERT_TRUE(store.save(sampleItems()));

    auto doc = nlohmann::json::parse(readText(path));
    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 3u);
    for (const auto& key : {"id", "name", "description", "price", "created_at", "updated_at"}) {
        EXPECT_TRUE(doc[0].contains(key)) << key;
    }
    EXPECT_TRUE(doc[0]["description"].is_null());
}

TEST(JsonFileItemStoreTest, SaveReplacesPreviousContentAndLeavesNoTemporaryFile) {
    catalog_test::TempDir dir;
    std::string path = dir.file("data.json");
    JsonFileItemStore store(path);

    ASSERT_TRUE(store.save(sampleItems()));
    ASSERT_TRUE(store.save(ItemCollection{}));

    EXPECT_TRUE(store.load().empty());
    EXPECT_EQ(nlohmann::json::parse(readText(path)), nlohmann::json::array());
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST(JsonFileItemStoreTest, SaveRecoversFromCorruptFile) {
    catalog_test::TempDir dir;
    std::string path = dir.file("data.json");
    writeText(path, "not json at all");
    JsonFileItemStore store(path);

    ASSERT_TRUE(store.load().empty());
    ASSERT_TRUE(store.save(sampleItems()));
    EXPECT_EQ(store.load().size(), 3u);
}

TEST(JsonFileItemStoreTest, SaveFailsWhenDirectoryIsMissing) {
    catalog_test::TempDir dir;
    std::string path = dir.file("no/such/dir/data.json");
    JsonFileItemStore store(path);

    EXPECT_FALSE(store.save(sampleItems()));
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

// --- id allocation ---

TEST(NextIdTest, StartsAtOneAndFollowsTheHighestId) {
    EXPECT_EQ(catalog::nextId(ItemCollection{}), std::optional<int64_t>(1));
    EXPECT_EQ(catalog::nextId(sampleItems()), std::optional<int64_t>(6));

    ItemCollection single{Item(41, "x", std::nullopt, 1.0, "t", "t")};
    EXPECT_EQ(catalog::nextId(single), std::optional<int64_t>(42));
}

TEST(NextIdTest, ReportsExhaustionAtLargestId) {
    const int64_t largest = std::numeric_limits<int64_t>::max();
    ItemCollection items{Item(largest - 1, "x", std::nullopt, 1.0, "t", "t")};
    EXPECT_EQ(catalog::nextId(items), std::optional<int64_t>(largest));

    items.push_back(Item(largest, "y", std::nullopt, 1.0, "t", "t"));
    EXPECT_FALSE(catalog::nextId(items).has_value());
}
