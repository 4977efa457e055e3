#include "Client.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

namespace {

void printUsage() {
    std::cout << "Usage: catalog_client [--host <ip>] [--port <port>] <command> [args...]\n"
              << "\nCommands:\n"
              << "  info                                  - Service information\n"
              << "  list                                  - List all items\n"
              << "  get <id>                              - Show one item\n"
              << "  create <name> <price> [description]   - Create an item\n"
              << "  update <id> [name=<v>] [description=<v>|description=null] [price=<v>]\n"
              << "                                        - Change only the given fields\n"
              << "  delete <id>                           - Delete one item\n"
              << "  clear                                 - Delete all items" << std::endl;
}

bool parseId(const std::string& text, int64_t& id) {
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0') {
        return false;
    }
    id = static_cast<int64_t>(value);
    return true;
}

bool parsePrice(const std::string& text, double& price) {
    char* end = nullptr;
    price = std::strtod(text.c_str(), &end);
    return !text.empty() && *end == '\0';
}

// "price=12.5" style assignments for the update command
bool parseAssignments(const std::vector<std::string>& args, size_t first, nlohmann::json& fields) {
    fields = nlohmann::json::object();
    for (size_t i = first; i < args.size(); ++i) {
        size_t eq = args[i].find('=');
        if (eq == std::string::npos) {
            std::cerr << "Expected field=value, got '" << args[i] << "'" << std::endl;
            return false;
        }
        std::string key = args[i].substr(0, eq);
        std::string value = args[i].substr(eq + 1);

        if (key == "name") {
            fields["name"] = value;
        } else if (key == "description") {
            if (value == "null") {
                fields["description"] = nullptr;
            } else {
                fields["description"] = value;
            }
        } else if (key == "price") {
            double price = 0.0;
            if (!parsePrice(value, price)) {
                std::cerr << "Invalid price: " << value << std::endl;
                return false;
            }
            fields["price"] = price;
        } else {
            std::cerr << "Unknown field: " << key << std::endl;
            return false;
        }
    }
    return true;
}

void printResponse(const catalog::HttpResponse& response) {
    std::cout << "HTTP " << response.statusCode << " " << catalog::reasonPhrase(response.statusCode) << std::endl;
    if (response.body.empty()) {
        return;
    }

    nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        std::cout << response.body << std::endl;
    } else {
        std::cout << body.dump(2) << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    int port = 8000;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::atoi(argv[++i]);
            if (port <= 0 || port > 65535) {
                std::cerr << "Invalid port number: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage();
        return 1;
    }

    catalog::Client client;
    if (!client.connect(host.c_str(), port)) {
        return 1;
    }

    const std::string& cmd = args[0];
    std::optional<catalog::HttpResponse> response;
    int64_t id = 0;

    if (cmd == "info") {
        response = client.getInfo();
    }
    else if (cmd == "list") {
        response = client.listItems();
    }
    else if (cmd == "get" && args.size() == 2 && parseId(args[1], id)) {
        response = client.getItem(id);
    }
    else if (cmd == "create" && (args.size() == 3 || args.size() == 4)) {
        double price = 0.0;
        if (!parsePrice(args[2], price)) {
            std::cerr << "Invalid price: " << args[2] << std::endl;
            return 1;
        }
        nlohmann::json item = {{"name", args[1]}, {"price", price}};
        if (args.size() == 4) {
            item["description"] = args[3];
        }
        response = client.createItem(item);
    }
    else if (cmd == "update" && args.size() >= 2 && parseId(args[1], id)) {
        nlohmann::json fields;
        if (!parseAssignments(args, 2, fields)) {
            return 1;
        }
        response = client.updateItem(id, fields);
    }
    else if (cmd == "delete" && args.size() == 2 && parseId(args[1], id)) {
        response = client.deleteItem(id);
    }
    else if (cmd == "clear") {
        response = client.deleteAllItems();
    }
    else {
        std::cerr << "Unknown or incomplete command: " << cmd << std::endl;
        printUsage();
        return 1;
    }

    if (!response) {
        std::cerr << "No response from server" << std::endl;
        return 1;
    }

    printResponse(*response);
    return response->isSuccess() ? 0 : 1;
}
