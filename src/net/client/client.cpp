#include "respkv/net/client/client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <initializer_list>
#include <stdexcept>
#include <utility>

#include "respkv/net/connection.hpp"
#include "respkv/net/resp_protocol.hpp"

namespace respkv::net::client {

namespace {

std::vector<std::string> make_args(std::initializer_list<std::string_view> parts) {
    std::vector<std::string> args;
    args.reserve(parts.size());
    for (auto part : parts) {
        args.emplace_back(part);
    }
    return args;
}

Value make_request(const std::vector<std::string>& args) {
    std::vector<Value> elements;
    elements.reserve(args.size());
    for (const auto& arg : args) {
        elements.push_back(Value::bulk(arg));
    }
    return Value::array(std::move(elements));
}

int64_t expect_integer(const Value& reply, std::string_view what) {
    if (reply.is_error()) {
        throw std::runtime_error(std::string(what) + " failed: " + reply.str);
    }
    if (reply.type != ValueType::Integer) {
        throw std::runtime_error(std::string(what) + " failed: unexpected reply type");
    }
    return reply.integer;
}

void expect_ok(const Value& reply, std::string_view what) {
    if (reply.is_error()) {
        throw std::runtime_error(std::string(what) + " failed: " + reply.str);
    }
    if (reply.type != ValueType::SimpleString || reply.str != "OK") {
        throw std::runtime_error(std::string(what) + " failed: unexpected reply");
    }
}

}  // namespace

class Client::Impl {
   public:
    explicit Impl(const ClientOptions& options) : options_(options) {}

    ~Impl() {
        disconnect();
    }

    void connect() {
        if (socket_fd_ >= 0) {
            return;
        }

        socket_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (socket_fd_ < 0) {
            throw std::runtime_error("failed to create socket");
        }

        if (options_.timeout_seconds > 0) {
            timeval tv{};
            tv.tv_sec = options_.timeout_seconds;
            tv.tv_usec = 0;
            setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);

        if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(socket_fd_);
            socket_fd_ = -1;
            throw std::runtime_error("Invalid address: " + options_.host);
        }

        if (::connect(socket_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(socket_fd_);
            socket_fd_ = -1;
            throw std::runtime_error("failed to connect to " + options_.host + ":" +
                                     std::to_string(options_.port));
        }

        connection_ = std::make_unique<Connection>(socket_fd_);
    }

    void disconnect() {
        connection_.reset();
        if (socket_fd_ >= 0) {
            close(socket_fd_);
            socket_fd_ = -1;
        }
    }

    [[nodiscard]] bool connected() const noexcept {
        return socket_fd_ >= 0;
    }

    Value command(const std::vector<std::string>& args) {
        send_command(args);
        return read_reply();
    }

    void send_command(const std::vector<std::string>& args) {
        if (!connection_) {
            throw std::runtime_error("Not connected");
        }
        if (!connection_->write_value(make_request(args))) {
            disconnect();
            throw std::runtime_error("failed to send request");
        }
    }

    Value read_reply() {
        if (!connection_) {
            throw std::runtime_error("Not connected");
        }
        std::optional<Value> reply;
        try {
            reply = connection_->read_frame();
        } catch (const ProtocolError&) {
            disconnect();
            throw;
        }
        if (!reply) {
            disconnect();
            throw std::runtime_error("Failed to receive response");
        }
        return std::move(*reply);
    }

    bool ping() {
        try {
            auto reply = command({"PING"});
            return reply.type == ValueType::SimpleString && reply.str == "PONG";
        } catch (const std::exception&) {
            return false;
        }
    }

    std::string echo(std::string_view message) {
        auto reply = command(make_args({"ECHO", message}));
        if (reply.type != ValueType::BulkString || reply.null) {
            throw std::runtime_error("ECHO failed: " + reply.str);
        }
        return reply.str;
    }

    void set(std::string_view key, std::string_view value) {
        expect_ok(command(make_args({"SET", key, value})), "SET");
    }

    void set(std::string_view key, std::string_view value, util::Duration ttl) {
        auto ms = std::to_string(ttl.count());
        expect_ok(command(make_args({"SET", key, value, "PX", ms})), "SET");
    }

    std::optional<std::string> get(std::string_view key) {
        auto reply = command(make_args({"GET", key}));
        if (reply.is_error()) {
            throw std::runtime_error("GET failed: " + reply.str);
        }
        if (reply.null) {
            return std::nullopt;
        }
        return reply.str;
    }

    bool remove(std::string_view key) {
        return expect_integer(command(make_args({"DEL", key})), "DEL") > 0;
    }

    bool contains(std::string_view key) {
        return expect_integer(command(make_args({"EXISTS", key})), "EXISTS") > 0;
    }

    bool expire(std::string_view key, util::Duration ttl) {
        auto ms = std::to_string(ttl.count());
        return expect_integer(command(make_args({"PEXPIRE", key, ms})), "PEXPIRE") == 1;
    }

    int64_t pttl(std::string_view key) {
        return expect_integer(command(make_args({"PTTL", key})), "PTTL");
    }

    std::vector<std::string> keys(std::string_view pattern) {
        auto reply = command(make_args({"KEYS", pattern}));
        if (reply.is_error()) {
            throw std::runtime_error("KEYS failed: " + reply.str);
        }
        std::vector<std::string> result;
        result.reserve(reply.elements.size());
        for (auto& element : reply.elements) {
            result.push_back(std::move(element.str));
        }
        return result;
    }

    std::size_t size() {
        return static_cast<std::size_t>(expect_integer(command({"DBSIZE"}), "DBSIZE"));
    }

    void clear() {
        expect_ok(command({"FLUSHDB"}), "FLUSHDB");
    }

   private:
    ClientOptions options_;
    int socket_fd_ = -1;
    std::unique_ptr<Connection> connection_;
};

// PIMPL INTERFACE ------------------------------------------------------------------------
Client::Client(const ClientOptions& options) : impl_(std::make_unique<Impl>(options)) {}
Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;
void Client::connect() {
    impl_->connect();
}
void Client::disconnect() {
    impl_->disconnect();
}
bool Client::connected() const noexcept {
    return impl_->connected();
}
Value Client::command(const std::vector<std::string>& args) {
    return impl_->command(args);
}
void Client::send_command(const std::vector<std::string>& args) {
    impl_->send_command(args);
}
Value Client::read_reply() {
    return impl_->read_reply();
}
bool Client::ping() {
    return impl_->ping();
}
std::string Client::echo(std::string_view message) {
    return impl_->echo(message);
}
void Client::set(std::string_view key, std::string_view value) {
    impl_->set(key, value);
}
void Client::set(std::string_view key, std::string_view value, util::Duration ttl) {
    impl_->set(key, value, ttl);
}
std::optional<std::string> Client::get(std::string_view key) {
    return impl_->get(key);
}
bool Client::remove(std::string_view key) {
    return impl_->remove(key);
}
bool Client::contains(std::string_view key) {
    return impl_->contains(key);
}
bool Client::expire(std::string_view key, util::Duration ttl) {
    return impl_->expire(key, ttl);
}
int64_t Client::pttl(std::string_view key) {
    return impl_->pttl(key);
}
std::vector<std::string> Client::keys(std::string_view pattern) {
    return impl_->keys(pattern);
}
std::size_t Client::size() {
    return impl_->size();
}
void Client::clear() {
    impl_->clear();
}

}  // namespace respkv::net::client
