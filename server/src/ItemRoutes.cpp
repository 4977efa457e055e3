#include "ItemRoutes.hpp"
#include <iostream>

namespace catalog {

ItemRoutes::ItemRoutes(ItemManager& manager)
    : manager_(manager) {
}

HttpResponse ItemRoutes::handle(const HttpRequest& request) {
    std::string path = request.path;
    // "/items/" and "/items" are the same collection
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    if (path == "/") {
        if (request.method == "GET") {
            return handleRoot();
        }
        return methodNotAllowed("GET");
    }

    if (path == "/items") {
        if (request.method == "GET") {
            return handleList();
        }
        if (request.method == "POST") {
            return handleCreate(request);
        }
        if (request.method == "DELETE") {
            return handleDeleteAll();
        }
        return methodNotAllowed("GET, POST, DELETE");
    }

    const std::string prefix = "/items/";
    if (path.compare(0, prefix.size(), prefix) == 0) {
        std::string segment = path.substr(prefix.size());
        if (segment.find('/') != std::string::npos) {
            return routeNotFound();
        }

        if (request.method != "GET" && request.method != "PUT" && request.method != "DELETE") {
            return methodNotAllowed("GET, PUT, DELETE");
        }

        ValidationErrors errors;
        auto id = ItemValidator::parseId(segment, errors);
        if (!id) {
            return validationFailed(errors);
        }

        if (request.method == "GET") {
            return handleGet(*id);
        }
        if (request.method == "PUT") {
            return handleUpdate(*id, request);
        }
        return handleDelete(*id);
    }

    return routeNotFound();
}

HttpResponse ItemRoutes::handleRoot() {
    nlohmann::json body = {
        {"message", "Welcome to CRUD Service API"},
        {"service", kServiceName},
        {"version", kServiceVersion},
        {"endpoints", {
            "GET /items",
            "POST /items",
            "DELETE /items",
            "GET /items/{id}",
            "PUT /items/{id}",
            "DELETE /items/{id}"
        }}
    };
    return HttpResponse::json(HttpStatus::OK, body);
}

HttpResponse ItemRoutes::handleCreate(const HttpRequest& request) {
    ValidationErrors errors;
    auto draft = ItemValidator::parseDraft(request.body, errors);
    if (!draft) {
        return validationFailed(errors);
    }

    Item created;
    auto result = manager_.createItem(*draft, created);
    if (result != ItemManager::OperationResult::SUCCESS) {
        return storageFailed(result);
    }
    return HttpResponse::json(HttpStatus::CREATED, created);
}

HttpResponse ItemRoutes::handleList() {
    return HttpResponse::json(HttpStatus::OK, manager_.listItems());
}

HttpResponse ItemRoutes::handleDeleteAll() {
    auto result = manager_.deleteAllItems();
    if (result != ItemManager::OperationResult::SUCCESS) {
        return storageFailed(result);
    }
    return HttpResponse(HttpStatus::NO_CONTENT);
}

HttpResponse ItemRoutes::handleGet(int64_t id) {
    auto item = manager_.getItem(id);
    if (!item) {
        return itemNotFound(id);
    }
    return HttpResponse::json(HttpStatus::OK, *item);
}

HttpResponse ItemRoutes::handleUpdate(int64_t id, const HttpRequest& request) {
    // an invalid body is rejected before the store is consulted, even for an unknown id
    ValidationErrors errors;
    auto patch = ItemValidator::parsePatch(request.body, errors);
    if (!patch) {
        return validationFailed(errors);
    }

    Item updated;
    auto result = manager_.updateItem(id, *patch, updated);
    if (result == ItemManager::OperationResult::NOT_FOUND) {
        return itemNotFound(id);
    }
    if (result != ItemManager::OperationResult::SUCCESS) {
        return storageFailed(result);
    }
    return HttpResponse::json(HttpStatus::OK, updated);
}

HttpResponse ItemRoutes::handleDelete(int64_t id) {
    auto result = manager_.deleteItem(id);
    if (result == ItemManager::OperationResult::NOT_FOUND) {
        return itemNotFound(id);
    }
    if (result != ItemManager::OperationResult::SUCCESS) {
        return storageFailed(result);
    }
    return HttpResponse(HttpStatus::NO_CONTENT);
}

HttpResponse ItemRoutes::validationFailed(const ValidationErrors& errors) {
    return HttpResponse::json(HttpStatus::UNPROCESSABLE_ENTITY, {{"detail", errors}});
}

HttpResponse ItemRoutes::itemNotFound(int64_t id) {
    return HttpResponse::json(HttpStatus::NOT_FOUND,
                              {{"detail", "Item with ID " + std::to_string(id) + " not found"}});
}

HttpResponse ItemRoutes::storageFailed(ItemManager::OperationResult result) {
    std::cerr << "Request failed: " << operationResultToString(result) << std::endl;
    return HttpResponse::json(HttpStatus::INTERNAL_SERVER_ERROR, {{"detail", "Internal Server Error"}});
}

HttpResponse ItemRoutes::methodNotAllowed(const std::string& allow) {
    HttpResponse response = HttpResponse::json(HttpStatus::METHOD_NOT_ALLOWED, {{"detail", "Method Not Allowed"}});
    response.setHeader("Allow", allow);
    return response;
}

HttpResponse ItemRoutes::routeNotFound() {
    return HttpResponse::json(HttpStatus::NOT_FOUND, {{"detail", "Not Found"}});
}

} // namespace catalog
