#include "respkv/net/connection.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <string_view>

#include "respkv/net/resp_protocol.hpp"

namespace respkv::net {

namespace {

bool send_all(int fd, const char* data, size_t len) {
    size_t total_sent = 0;
    while (total_sent < len) {
        ssize_t sent = send(fd, data + total_sent, len - total_sent, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

}  // namespace

std::optional<Value> Connection::read_frame() {
    char chunk[kReadChunkSize];

    while (true) {
        std::size_t consumed = 0;
        std::string_view pending(buffer_.data() + read_pos_, buffer_.size() - read_pos_);
        auto value = decoder_.decode(pending, consumed);
        if (value) {
            read_pos_ += consumed;
            compact();
            return value;
        }

        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return std::nullopt;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

bool Connection::write_value(const Value& value) {
    std::string data = RespProtocol::encode(value);
    return send_all(fd_, data.data(), data.size());
}

bool Connection::write_raw(std::string_view data) {
    return send_all(fd_, data.data(), data.size());
}

// drop consumed bytes once they dominate the buffer, instead of erasing after every frame
void Connection::compact() {
    if (read_pos_ == buffer_.size()) {
        buffer_.clear();
        read_pos_ = 0;
    } else if (read_pos_ > kReadChunkSize && read_pos_ * 2 > buffer_.size()) {
        buffer_.erase(0, read_pos_);
        read_pos_ = 0;
    }
}

}  // namespace respkv::net
