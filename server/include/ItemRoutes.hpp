#pragma once

#include "HttpMessage.hpp"
#include "ItemManager.hpp"
#include "ItemValidator.hpp"
#include <string>

namespace catalog {

// Maps HTTP requests onto ItemManager operations:
//   GET    /             service info
//   POST   /items        create        201 / 422
//   GET    /items        list          200
//   DELETE /items        delete all    204
//   GET    /items/{id}   fetch         200 / 404 / 422
//   PUT    /items/{id}   update        200 / 404 / 422
//   DELETE /items/{id}   delete        204 / 404 / 422
// Storage failures answer 500.
class ItemRoutes {
public:
    explicit ItemRoutes(ItemManager& manager);

    HttpResponse handle(const HttpRequest& request);

    static constexpr const char* kServiceName = "CRUD Service API";
    static constexpr const char* kServiceVersion = "1.0.0";

private:
    ItemManager& manager_;

    HttpResponse handleRoot();
    HttpResponse handleCreate(const HttpRequest& request);
    HttpResponse handleList();
    HttpResponse handleDeleteAll();
    HttpResponse handleGet(int64_t id);
    HttpResponse handleUpdate(int64_t id, const HttpRequest& request);
    HttpResponse handleDelete(int64_t id);

    static HttpResponse validationFailed(const ValidationErrors& errors);
    static HttpResponse itemNotFound(int64_t id);
    static HttpResponse storageFailed(ItemManager::OperationResult result);
    static HttpResponse methodNotAllowed(const std::string& allow);
    static HttpResponse routeNotFound();
};

} // namespace catalog
