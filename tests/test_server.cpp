#include <gtest/gtest.h>
#include "Client.hpp"
#include "ItemManager.hpp"
#include "JsonFileItemStore.hpp"
#include "Server.hpp"
#include "TestSupport.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using catalog::Client;
using catalog::Server;
using catalog::ServerConfig;

namespace {

ServerConfig loopbackConfig(const std::string& dataFile) {
    ServerConfig config;
    config.port = 0;
    config.dataFile = dataFile;
    config.maxRequestBytes = 4096;
    return config;
}

int connectRaw(int port) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(sock, (sockaddr*)&addr, sizeof(addr)) < 0) {
        close(sock);
        return -1;
    }
    return sock;
}

// sends raw bytes and returns everything the server answers before closing
std::string exchangeRaw(int port, const std::string& bytes) {
    int sock = connectRaw(port);
    if (sock < 0) {
        return "";
    }

    send(sock, bytes.data(), bytes.size(), MSG_NOSIGNAL);

    std::string reply;
    char buffer[4096];
    ssize_t n;
    while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
        reply.append(buffer, static_cast<size_t>(n));
    }
    close(sock);
    return reply;
}

} // namespace

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_unique<Server>(loopbackConfig(dir.file("data.json")));
        ASSERT_TRUE(server->start());
        ASSERT_GT(server->getPort(), 0);
        ASSERT_TRUE(client.connect("127.0.0.1", server->getPort()));
    }

    void TearDown() override {
        client.disconnect();
        server->stop();
    }

    catalog_test::TempDir dir;
    std::unique_ptr<Server> server;
    Client client;
};

TEST_F(ServerTest, ServesCrudOverOneConnection) {
    auto created = client.createItem({{"name", "Widget"}, {"price", 9.99}});
    ASSERT_TRUE(created.has_value());
    ASSERT_EQ(created->statusCode, 201);
    auto item = nlohmann::json::parse(created->body);
    EXPECT_EQ(item["id"], 1);

    auto fetched = client.getItem(1);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->statusCode, 200);
    EXPECT_EQ(nlohmann::json::parse(fetched->body), item);

    auto updated = client.updateItem(1, {{"price", 12.5}});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->statusCode, 200);

    auto missing = client.getItem(2);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->statusCode, 404);

    auto deleted = client.deleteItem(1);
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted->statusCode, 204);

    auto listed = client.listItems();
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(nlohmann::json::parse(listed->body), nlohmann::json::array());
    EXPECT_TRUE(client.isConnected());
}

TEST_F(ServerTest, PersistsToTheDataFile) {
    client.createItem({{"name", "Widget"}, {"price", 9.99}});
    client.createItem({{"name", "Gadget"}, {"description", "Shiny"}, {"price", 3.0}});

    catalog::JsonFileItemStore reader(dir.file("data.json"));
    auto items = reader.load();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[1].getName(), "Gadget");
    EXPECT_EQ(server->getItemManager().count(), 2u);

    auto cleared = client.deleteAllItems();
    ASSERT_TRUE(cleared.has_value());
    EXPECT_EQ(cleared->statusCode, 204);
    EXPECT_TRUE(reader.load().empty());
}

TEST_F(ServerTest, AnswersInfoRequest) {
    auto info = client.getInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->statusCode, 200);
    EXPECT_EQ(nlohmann::json::parse(info->body)["message"], "Welcome to CRUD Service API");
}

TEST_F(ServerTest, MalformedRequestGets400AndClose) {
    std::string reply = exchangeRaw(server->getPort(), "HELLO\r\n\r\n");
    EXPECT_EQ(reply.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_NE(reply.find("Connection: close"), std::string::npos);
}

TEST_F(ServerTest, OversizedRequestGets413) {
    std::string request = "POST /items HTTP/1.1\r\nContent-Length: 100000\r\n\r\n";
    std::string reply = exchangeRaw(server->getPort(), request);
    EXPECT_EQ(reply.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0), 0u);
}

TEST_F(ServerTest, ConnectionCloseIsHonoured) {
    std::string reply = exchangeRaw(server->getPort(),
                                    "GET /items HTTP/1.1\r\nConnection: close\r\n\r\n");
    EXPECT_EQ(reply.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_EQ(reply.substr(reply.size() - 2), "[]");
}

TEST_F(ServerTest, ClientThatNeverReadsCannotGrowTheOutputBacklog) {
    // make every list response much larger than the request asking for it
    for (int i = 0; i < 20; ++i) {
        client.createItem({{"name", "item" + std::to_string(i)},
                           {"description", std::string(400, 'd')},
                           {"price", 1.0}});
    }
    auto listed = client.listItems();
    ASSERT_TRUE(listed.has_value());
    const size_t responseBytes = listed->serialize(true).size();

    int sock = connectRaw(server->getPort());
    ASSERT_GE(sock, 0);

    const std::string request = "GET /items HTTP/1.1\r\nHost: x\r\n\r\n";
    std::string batch;
    for (int i = 0; i < 100; ++i) {
        batch += request;
    }

    // pipeline requests without reading until the server stops taking input
    size_t sentBytes = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline && sentBytes < 64u * 1024 * 1024) {
        ssize_t n = send(sock, batch.data(), batch.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0) {
            sentBytes += static_cast<size_t>(n);
        }
        else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            break;
        }
        else {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_LT(sentBytes, 64u * 1024 * 1024);
    EXPECT_LE(server->getPendingOutputBytes(), 4096 + responseBytes);

    // the responses that were queued are still delivered in order
    std::string head(64, '\0');
    ssize_t n = recv(sock, &head[0], head.size(), 0);
    ASSERT_GT(n, 0);
    EXPECT_EQ(head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    close(sock);
}

TEST(ServerStartTest, FailsWhenPortIsTaken) {
    catalog_test::TempDir dir;
    Server first(loopbackConfig(dir.file("data.json")));
    ASSERT_TRUE(first.start());

    ServerConfig config = loopbackConfig(dir.file("data.json"));
    config.port = first.getPort();
    Server second(config);
    EXPECT_FALSE(second.start());
    EXPECT_FALSE(second.isRunning());
}
