#include "respkv/net/server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "respkv/cmd/command_table.hpp"
#include "respkv/net/connection.hpp"
#include "respkv/net/resp_protocol.hpp"
#include "respkv/util/logger.hpp"

namespace respkv::net::server {

namespace {

/*
    writing to a socket whose peer has closed raises SIGPIPE, which terminates the process by
    default. ignore it once at startup; every send() also passes MSG_NOSIGNAL
*/
struct SigpipeIgnorer {
    SigpipeIgnorer() {
        signal(SIGPIPE, SIG_IGN);
    }
};

static SigpipeIgnorer sigpipe_ignorer;

std::string errno_string() {
    return std::string(strerror(errno));
}

}  // namespace

class Server::Impl {
   public:
    Impl(core::IStore& store, const ServerOptions& options)
        : store_(store),
          options_(options),
          status_(std::make_shared<cmd::ServerStatus>()),
          table_(store, status_) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        if (options_.max_connections == 0) {
            throw std::runtime_error("max_connections must be at least 1");
        }

        // AF_INET = IPv4, SOCK_STREAM = TCP
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw std::runtime_error("failed to create socket: " + errno_string());
        }

        // SO_REUSEADDR lets us rebind right after a restart instead of waiting out TIME_WAIT
        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            close(fd);
            throw std::runtime_error("failed to set SO_REUSEADDR: " + errno_string());
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);

        if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(fd);
            throw std::runtime_error("Invalid address: " + options_.host);
        }

        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            throw std::runtime_error("failed to bind to " + options_.host + ":" +
                                     std::to_string(options_.port) + ": " + errno_string());
        }

        // query actual bound port (for options_.port == 0)
        sockaddr_in bound_addr{};
        socklen_t bound_len = sizeof(bound_addr);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound_addr), &bound_len) == 0) {
            actual_port_ = ntohs(bound_addr.sin_port);
        } else {
            actual_port_ = options_.port;
        }

        if (listen(fd, SOMAXCONN) < 0) {
            close(fd);
            throw std::runtime_error("failed to listen: " + errno_string());
        }

        publish_parameters();

        server_fd_.store(fd);
        running_ = true;
        accept_thread_ = std::thread(&Impl::accept_loop, this);
        if (options_.sweep_interval.count() > 0) {
            sweep_thread_ = std::thread(&Impl::sweep_loop, this);
        }

        LOG_INFO("Server started on " + options_.host + ":" + std::to_string(actual_port_));
    }

    void stop() {
        // if already stopped, return early
        if (!running_.exchange(false)) {
            return;
        }

        LOG_INFO("Server stopping...");

        // shutdown unblocks the accept() call, close releases the fd
        int fd = server_fd_.exchange(-1);
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
            close(fd);
        }

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        {
            // taking the lock orders the notify after the sweeper's predicate check
            std::lock_guard lock(sweep_mutex_);
        }
        sweep_cv_.notify_all();
        if (sweep_thread_.joinable()) {
            sweep_thread_.join();
        }

        // wake every handler blocked in recv(), then join them without holding the lock:
        // handlers take clients_mutex_ on their way out
        std::vector<std::unique_ptr<ClientInfo>> clients;
        {
            std::lock_guard lock(clients_mutex_);
            for (auto& info : clients_) {
                if (info->fd >= 0) {
                    shutdown(info->fd, SHUT_RDWR);
                }
            }
            clients.swap(clients_);
        }
        for (auto& info : clients) {
            if (info->thread.joinable()) {
                info->thread.join();
            }
        }

        LOG_INFO("Server stopped");
    }

    [[nodiscard]] bool running() const noexcept {
        return running_;
    }

    [[nodiscard]] uint16_t port() const noexcept {
        return actual_port_;
    }

    [[nodiscard]] std::size_t connection_count() const {
        return static_cast<std::size_t>(status_->connected_clients.load());
    }

   private:
    struct ClientInfo {
        std::thread thread;
        int fd = -1;  // guarded by clients_mutex_, -1 once closed
        std::atomic<bool> finished{false};
    };

    void publish_parameters() {
        status_->port = actual_port_;
        status_->started_at = std::chrono::steady_clock::now();
        status_->parameters = {
            {"bind", options_.host},
            {"port", std::to_string(actual_port_)},
            {"maxclients", std::to_string(options_.max_connections)},
            {"timeout", std::to_string(options_.client_timeout_seconds)},
            {"sweep-interval", std::to_string(options_.sweep_interval.count())},
        };
    }

    void accept_loop() {
        while (running_) {
            cleanup_finished_clients();

            {
                std::lock_guard lock(clients_mutex_);
                if (clients_.size() >= options_.max_connections) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                    continue;
                }
            }

            int fd = server_fd_.load();
            if (fd < 0) {
                break;
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client_fd = accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);

            if (client_fd < 0) {
                if (!running_ || errno == EINTR) {
                    continue;
                }
                LOG_ERROR("Accept failed: " + errno_string());
                // out of fds: give running handlers a chance to finish and release theirs
                if (errno == EMFILE || errno == ENFILE || errno == ENOBUFS || errno == ENOMEM) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                continue;
            }

            if (options_.client_timeout_seconds > 0) {
                timeval tv{};
                tv.tv_sec = options_.client_timeout_seconds;
                tv.tv_usec = 0;
                setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            }

            char ip[INET_ADDRSTRLEN] = "?";
            inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
            LOG_DEBUG("Client connected from " + std::string(ip) + ":" +
                      std::to_string(ntohs(client_addr.sin_port)) +
                      ", fd=" + std::to_string(client_fd));

            status_->total_connections.fetch_add(1);
            status_->connected_clients.fetch_add(1);

            {
                std::lock_guard lock(clients_mutex_);
                auto info = std::make_unique<ClientInfo>();
                info->fd = client_fd;
                // heap-allocated so the pointer survives reallocation of clients_
                auto* info_ptr = info.get();
                info->thread = std::thread(&Impl::handle_client, this, client_fd, info_ptr);
                clients_.push_back(std::move(info));
            }
        }
    }

    void cleanup_finished_clients() {
        std::lock_guard lock(clients_mutex_);
        auto it = clients_.begin();
        while (it != clients_.end()) {
            if ((*it)->finished.load()) {
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void handle_client(int client_fd, ClientInfo* info) {
        Connection connection(client_fd);
        try {
            while (running_) {
                auto frame = connection.read_frame();
                if (!frame) {
                    break;
                }

                cmd::Reply reply = table_.dispatch(*frame);
                if (!connection.write_value(reply.value) || reply.close_connection) {
                    break;
                }
            }
        } catch (const ProtocolError& e) {
            LOG_WARN("Closing fd=" + std::to_string(client_fd) + ": " + e.what());
            // best effort, the connection is closed either way
            (void)connection.write_value(Value::error(std::string("ERR ") + e.what()));
        } catch (const std::exception& e) {
            LOG_ERROR("Client handler error: " + std::string(e.what()));
        }

        {
            std::lock_guard lock(clients_mutex_);
            close(client_fd);
            info->fd = -1;
        }
        status_->connected_clients.fetch_sub(1);
        info->finished.store(true);
        LOG_DEBUG("Client disconnected, fd=" + std::to_string(client_fd));
    }

    void sweep_loop() {
        std::unique_lock lock(sweep_mutex_);
        while (running_) {
            sweep_cv_.wait_for(lock, options_.sweep_interval, [this] { return !running_; });
            if (!running_) {
                break;
            }
            std::size_t removed = store_.cleanup_expired();
            if (removed > 0) {
                LOG_DEBUG("Swept " + std::to_string(removed) + " expired keys");
            }
        }
    }

    core::IStore& store_;
    ServerOptions options_;
    std::shared_ptr<cmd::ServerStatus> status_;
    cmd::CommandTable table_;

    uint16_t actual_port_{0};

    // written by stop() on the caller's thread while accept_loop() reads it
    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    std::thread sweep_thread_;
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;

    std::vector<std::unique_ptr<ClientInfo>> clients_;
    std::mutex clients_mutex_;
};

// PIMPL INTERFACE -------------------------------------------------------------------------------
Server::Server(core::IStore& store, const ServerOptions& options)
    : impl_(std::make_unique<Impl>(store, options)) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;
void Server::start() {
    impl_->start();
}
void Server::stop() {
    impl_->stop();
}
bool Server::running() const noexcept {
    return impl_->running();
}
uint16_t Server::port() const noexcept {
    return impl_->port();
}
std::size_t Server::connection_count() const {
    return impl_->connection_count();
}

}  // namespace respkv::net::server
