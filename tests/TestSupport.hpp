#pragma once

#include "ItemStore.hpp"
#include "Timestamp.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

namespace catalog_test {

// In-memory record store that counts traffic and can be told to fail saves.
class MemoryItemStore : public catalog::ItemStore {
public:
    catalog::ItemCollection load() const override {
        ++loadCount;
        return items;
    }

    bool save(const catalog::ItemCollection& collection) override {
        ++saveCount;
        if (failSaves) {
            return false;
        }
        items = collection;
        return true;
    }

    catalog::ItemCollection items;
    mutable int loadCount = 0;
    int saveCount = 0;
    bool failSaves = false;
};

// Starts at a fixed instant and moves forward by `step` on every reading.
inline catalog::Clock steppingClock(std::chrono::seconds step = std::chrono::seconds(1)) {
    auto current = std::make_shared<std::chrono::system_clock::time_point>(
        std::chrono::system_clock::from_time_t(1700000000));
    return [current, step] {
        auto t = *current;
        *current += step;
        return t;
    };
}

// Scratch directory removed with everything in it at scope exit.
class TempDir {
public:
    TempDir() {
        char pattern[] = "/tmp/catalog_test_XXXXXX";
        char* created = mkdtemp(pattern);
        path_ = created ? created : "";
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

} // namespace catalog_test
