#ifndef RESPKV_NET_CLIENT_CLIENT_HPP
#define RESPKV_NET_CLIENT_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "respkv/net/types.hpp"
#include "respkv/util/types.hpp"

namespace respkv::net::client {

struct ClientOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    int timeout_seconds = 30;
};

/*
    blocking RESP client for one connection.
    - command() / send_command() + read_reply() return replies as-is, error replies included
    - the typed helpers throw std::runtime_error when the server answers with an error
    - transport failures throw std::runtime_error and leave the client disconnected
*/
class Client {
   public:
    explicit Client(const ClientOptions& options = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    void connect();
    void disconnect();
    [[nodiscard]] bool connected() const noexcept;

    [[nodiscard]] Value command(const std::vector<std::string>& args);

    // pipelining: queue any number of requests, then read the replies in order
    void send_command(const std::vector<std::string>& args);
    [[nodiscard]] Value read_reply();

    [[nodiscard]] bool ping();
    [[nodiscard]] std::string echo(std::string_view message);
    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, std::string_view value, util::Duration ttl);
    [[nodiscard]] std::optional<std::string> get(std::string_view key);
    [[nodiscard]] bool remove(std::string_view key);
    [[nodiscard]] bool contains(std::string_view key);
    [[nodiscard]] bool expire(std::string_view key, util::Duration ttl);
    // remaining milliseconds, -1 without expiry, -2 when missing
    [[nodiscard]] int64_t pttl(std::string_view key);
    [[nodiscard]] std::vector<std::string> keys(std::string_view pattern);
    [[nodiscard]] std::size_t size();
    void clear();

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace respkv::net::client

#endif
