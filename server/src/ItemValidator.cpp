#include "ItemValidator.hpp"
#include <cctype>
#include <charconv>

namespace catalog {

namespace {

ValidationError bodyError(const std::string& field, const std::string& message, const std::string& type) {
    return ValidationError({"body", field}, message, type);
}

} // namespace

void to_json(nlohmann::json& j, const ValidationError& error) {
    j = nlohmann::json{{"loc", error.location}, {"msg", error.message}, {"type", error.type}};
}

size_t ItemValidator::characterCount(const std::string& utf8) {
    size_t count = 0;
    for (unsigned char c : utf8) {
        // continuation bytes (10xxxxxx) belong to the preceding code point
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::optional<nlohmann::json> ItemValidator::parseObject(const std::string& body, ValidationErrors& errors) {
    if (body.empty()) {
        errors.emplace_back(std::vector<std::string>{"body"}, "Field required", "missing");
        return std::nullopt;
    }

    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        errors.emplace_back(std::vector<std::string>{"body"}, "JSON decode error", "json_invalid");
        return std::nullopt;
    }

    if (!doc.is_object()) {
        errors.emplace_back(std::vector<std::string>{"body"},
                            "Input should be a valid dictionary or object to extract fields from",
                            "model_attributes_type");
        return std::nullopt;
    }

    return doc;
}

std::optional<std::string> ItemValidator::checkName(const nlohmann::json& value, ValidationErrors& errors) {
    if (!value.is_string()) {
        errors.push_back(bodyError("name", "Input should be a valid string", "string_type"));
        return std::nullopt;
    }

    std::string name = value.get<std::string>();
    size_t length = characterCount(name);
    if (length < kMinNameLength) {
        errors.push_back(bodyError("name", "String should have at least 1 character", "string_too_short"));
        return std::nullopt;
    }
    if (length > kMaxNameLength) {
        errors.push_back(bodyError("name", "String should have at most 100 characters", "string_too_long"));
        return std::nullopt;
    }
    return name;
}

std::optional<std::optional<std::string>> ItemValidator::checkDescription(const nlohmann::json& value,
                                                                          ValidationErrors& errors) {
    if (value.is_null()) {
        return std::optional<std::string>();
    }
    if (!value.is_string()) {
        errors.push_back(bodyError("description", "Input should be a valid string", "string_type"));
        return std::nullopt;
    }

    std::string description = value.get<std::string>();
    if (characterCount(description) > kMaxDescriptionLength) {
        errors.push_back(bodyError("description", "String should have at most 500 characters", "string_too_long"));
        return std::nullopt;
    }
    return std::optional<std::string>(description);
}

std::optional<double> ItemValidator::checkPrice(const nlohmann::json& value, ValidationErrors& errors) {
    // booleans are not numbers here even though JSON libraries convert them
    if (!value.is_number()) {
        errors.push_back(bodyError("price", "Input should be a valid number", "float_type"));
        return std::nullopt;
    }

    double price = value.get<double>();
    if (!(price > 0.0)) {
        errors.push_back(bodyError("price", "Input should be greater than 0", "greater_than"));
        return std::nullopt;
    }
    return price;
}

std::optional<ItemDraft> ItemValidator::parseDraft(const std::string& body, ValidationErrors& errors) {
    auto doc = parseObject(body, errors);
    if (!doc) {
        return std::nullopt;
    }

    size_t errorsBefore = errors.size();
    ItemDraft draft;

    auto name = doc->find("name");
    if (name == doc->end()) {
        errors.push_back(bodyError("name", "Field required", "missing"));
    } else if (auto checked = checkName(*name, errors)) {
        draft.name = *checked;
    }

    auto description = doc->find("description");
    if (description != doc->end()) {
        if (auto checked = checkDescription(*description, errors)) {
            draft.description = *checked;
        }
    }

    auto price = doc->find("price");
    if (price == doc->end()) {
        errors.push_back(bodyError("price", "Field required", "missing"));
    } else if (auto checked = checkPrice(*price, errors)) {
        draft.price = *checked;
    }

    if (errors.size() != errorsBefore) {
        return std::nullopt;
    }
    return draft;
}

std::optional<ItemPatch> ItemValidator::parsePatch(const std::string& body, ValidationErrors& errors) {
    auto doc = parseObject(body, errors);
    if (!doc) {
        return std::nullopt;
    }

    size_t errorsBefore = errors.size();
    ItemPatch patch;

    // name and price do not accept null; a null for them is a type error
    auto name = doc->find("name");
    if (name != doc->end()) {
        patch.name = checkName(*name, errors);
    }

    auto description = doc->find("description");
    if (description != doc->end()) {
        patch.description = checkDescription(*description, errors);
    }

    auto price = doc->find("price");
    if (price != doc->end()) {
        patch.price = checkPrice(*price, errors);
    }

    if (errors.size() != errorsBefore) {
        return std::nullopt;
    }
    return patch;
}

std::optional<int64_t> ItemValidator::parseId(const std::string& segment, ValidationErrors& errors) {
    int64_t id = 0;
    const char* begin = segment.data();
    const char* end = segment.data() + segment.size();
    if (segment.size() > 1 && *begin == '+' && std::isdigit(static_cast<unsigned char>(begin[1]))) {
        ++begin;
    }

    auto result = std::from_chars(begin, end, id);
    if (segment.empty() || result.ec != std::errc() || result.ptr != end) {
        errors.emplace_back(std::vector<std::string>{"path", "item_id"},
                            "Input should be a valid integer, unable to parse string as an integer",
                            "int_parsing");
        return std::nullopt;
    }
    return id;
}

} // namespace catalog
