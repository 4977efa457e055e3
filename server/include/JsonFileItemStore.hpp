#pragma once

#include "ItemStore.hpp"
#include <string>

namespace catalog {

// Keeps the collection as a JSON array in a single file. Saves go through
// "<path>.tmp" and a rename so the file is always either the old or the new
// collection.
class JsonFileItemStore : public ItemStore {
public:
    explicit JsonFileItemStore(const std::string& path);

    ItemCollection load() const override;
    bool save(const ItemCollection& items) override;

    const std::string& getPath() const { return path_; }

private:
    std::string path_;

    bool writeFile(const std::string& path, const std::string& data) const;
};

} // namespace catalog
