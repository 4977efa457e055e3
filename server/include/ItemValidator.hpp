#pragma once

#include "Item.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace catalog {

struct ValidationError {
    std::vector<std::string> location;   // e.g. {"body", "price"}
    std::string message;
    std::string type;

    ValidationError(std::vector<std::string> loc, const std::string& msg, const std::string& t)
        : location(std::move(loc)), message(msg), type(t) {}
};

using ValidationErrors = std::vector<ValidationError>;

void to_json(nlohmann::json& j, const ValidationError& error);

// Checks request input before anything touches the store. Every violation is
// collected so the client sees all of them in one response.
class ItemValidator {
public:
    static constexpr size_t kMinNameLength = 1;
    static constexpr size_t kMaxNameLength = 100;
    static constexpr size_t kMaxDescriptionLength = 500;

    // body of POST /items
    static std::optional<ItemDraft> parseDraft(const std::string& body, ValidationErrors& errors);

    // body of PUT /items/{id}; only keys present in the body end up in the patch
    static std::optional<ItemPatch> parsePatch(const std::string& body, ValidationErrors& errors);

    // {id} path segment
    static std::optional<int64_t> parseId(const std::string& segment, ValidationErrors& errors);

    // length in code points, the way users count characters
    static size_t characterCount(const std::string& utf8);

private:
    static std::optional<nlohmann::json> parseObject(const std::string& body, ValidationErrors& errors);
    static std::optional<std::string> checkName(const nlohmann::json& value, ValidationErrors& errors);
    static std::optional<std::optional<std::string>> checkDescription(const nlohmann::json& value, ValidationErrors& errors);
    static std::optional<double> checkPrice(const nlohmann::json& value, ValidationErrors& errors);
};

} // namespace catalog
