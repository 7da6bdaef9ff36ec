#include "respkv/net/client/client.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "respkv/core/store.hpp"
#include "respkv/net/server/server.hpp"

namespace respkv::net::test {

using client::Client;
using client::ClientOptions;

class ClientTest : public ::testing::Test {
   protected:
    void SetUp() override {
        store_ = std::make_unique<core::Store>();
        server::ServerOptions server_opts;
        server_opts.port = 0;
        server_ = std::make_unique<server::Server>(*store_, server_opts);
        server_->start();

        ClientOptions client_opts;
        client_opts.port = server_->port();
        client_opts.timeout_seconds = 5;
        client_ = std::make_unique<Client>(client_opts);
        client_->connect();
    }

    void TearDown() override {
        client_->disconnect();
        server_->stop();
    }

    std::unique_ptr<core::Store> store_;
    std::unique_ptr<server::Server> server_;
    std::unique_ptr<Client> client_;
};

TEST_F(ClientTest, Ping) {
    EXPECT_TRUE(client_->ping());
}

TEST_F(ClientTest, Echo) {
    EXPECT_EQ(client_->echo("hello world"), "hello world");
}

TEST_F(ClientTest, SetAndGet) {
    client_->set("key1", "value1");

    auto result = client_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value1");
}

TEST_F(ClientTest, GetMissing) {
    auto result = client_->get("nonexistent");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ClientTest, SetOverwrites) {
    client_->set("key1", "value1");
    client_->set("key1", "value2");

    auto result = client_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value2");
}

TEST_F(ClientTest, BinarySafeValue) {
    std::string value("line1\r\nline2\0end", 16);
    client_->set("key1", value);

    auto result = client_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, value);
}

TEST_F(ClientTest, Remove) {
    client_->set("key1", "value1");

    EXPECT_TRUE(client_->remove("key1"));
    EXPECT_FALSE(client_->contains("key1"));
    EXPECT_FALSE(client_->remove("key1"));
}

TEST_F(ClientTest, Contains) {
    EXPECT_FALSE(client_->contains("key1"));

    client_->set("key1", "value1");
    EXPECT_TRUE(client_->contains("key1"));
}

TEST_F(ClientTest, SizeAndClear) {
    EXPECT_EQ(client_->size(), 0u);

    client_->set("key1", "value1");
    client_->set("key2", "value2");
    EXPECT_EQ(client_->size(), 2u);

    client_->clear();
    EXPECT_EQ(client_->size(), 0u);
}

TEST_F(ClientTest, SetWithTTL) {
    client_->set("key1", "value1", util::Duration(60000));

    auto result = client_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value1");

    auto remaining = client_->pttl("key1");
    EXPECT_GT(remaining, 0);
    EXPECT_LE(remaining, 60000);
}

TEST_F(ClientTest, ExpireAndPttl) {
    EXPECT_EQ(client_->pttl("key1"), -2);
    EXPECT_FALSE(client_->expire("key1", util::Duration(1000)));

    client_->set("key1", "value1");
    EXPECT_EQ(client_->pttl("key1"), -1);
    EXPECT_TRUE(client_->expire("key1", util::Duration(1000)));
    EXPECT_GT(client_->pttl("key1"), 0);
}

TEST_F(ClientTest, Keys) {
    client_->set("user:1", "a");
    client_->set("user:2", "b");
    client_->set("other", "c");

    auto keys = client_->keys("user:*");
    EXPECT_EQ(keys, (std::vector<std::string>{"user:1", "user:2"}));
}

TEST_F(ClientTest, RawCommandReturnsErrorReplies) {
    auto reply = client_->command({"NOSUCHCOMMAND"});
    EXPECT_TRUE(reply.is_error());

    // the connection survives an error reply
    EXPECT_TRUE(client_->ping());
}

TEST_F(ClientTest, TypedHelperThrowsOnErrorReply) {
    // PX 0 is rejected by the server
    EXPECT_THROW(client_->set("key1", "value1", util::Duration(0)), std::runtime_error);
    EXPECT_TRUE(client_->ping());
}

TEST_F(ClientTest, Pipelining) {
    for (int i = 0; i < 50; ++i) {
        client_->send_command({"SET", "key" + std::to_string(i), std::to_string(i)});
    }
    client_->send_command({"DBSIZE"});

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(client_->read_reply(), Value::ok());
    }
    EXPECT_EQ(client_->read_reply(), Value::integer_value(50));
}

TEST_F(ClientTest, MultipleOperations) {
    for (int i = 0; i < 100; ++i) {
        client_->set("key" + std::to_string(i), "value" + std::to_string(i));
    }

    EXPECT_EQ(client_->size(), 100u);

    for (int i = 0; i < 100; ++i) {
        auto result = client_->get("key" + std::to_string(i));
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, "value" + std::to_string(i));
    }
}

TEST_F(ClientTest, ConnectDisconnectReconnect) {
    client_->set("key1", "value1");
    client_->disconnect();

    EXPECT_FALSE(client_->connected());
    EXPECT_THROW((void)client_->command({"PING"}), std::runtime_error);

    client_->connect();
    EXPECT_TRUE(client_->connected());

    auto result = client_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value1");
}

TEST_F(ClientTest, QuitLeavesClientDisconnected) {
    EXPECT_EQ(client_->command({"QUIT"}), Value::ok());
    EXPECT_THROW((void)client_->read_reply(), std::runtime_error);
    EXPECT_FALSE(client_->connected());
}

TEST(ClientConnectTest, RefusedConnectionThrows) {
    core::Store store;
    server::ServerOptions server_opts;
    server_opts.port = 0;
    server::Server server(store, server_opts);
    server.start();
    uint16_t port = server.port();
    server.stop();

    ClientOptions opts;
    opts.port = port;
    Client client(opts);
    EXPECT_THROW(client.connect(), std::runtime_error);
    EXPECT_FALSE(client.connected());
    EXPECT_FALSE(client.ping());
}

TEST(ClientConnectTest, InvalidHostThrows) {
    ClientOptions opts;
    opts.host = "not-an-address";
    Client client(opts);
    EXPECT_THROW(client.connect(), std::runtime_error);
}

}  // namespace respkv::net::test
