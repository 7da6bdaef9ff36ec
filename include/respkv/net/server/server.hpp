#ifndef RESPKV_NET_SERVER_SERVER_HPP
#define RESPKV_NET_SERVER_SERVER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "respkv/core/istore.hpp"
#include "respkv/util/types.hpp"

namespace respkv::net::server {

struct ServerOptions {
    std::string host = "127.0.0.1";  // local host
    uint16_t port = 6379;            // redis' default port. 0 picks a free port
    std::size_t max_connections = 1000;
    int client_timeout_seconds = 300;  // 5 minutes, 0 = no timeout
    // how often expired keys are swept. 0 = no sweeper, expiry is purely lazy
    util::Duration sweep_interval = util::Duration(100);
};

/*
    accept loop on its own thread, one handler thread per client connection.
    the store is borrowed and must outlive the server
*/
class Server {
   public:
    Server(core::IStore& store, const ServerOptions& options = {});
    ~Server();

    // owns threads, a mutex and socket fds: no copies. PIMPL makes moves trivial
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    // throws std::runtime_error if the socket cannot be set up
    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] uint16_t port() const noexcept;
    [[nodiscard]] std::size_t connection_count() const;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace respkv::net::server

#endif
