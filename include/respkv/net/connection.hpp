#ifndef RESPKV_NET_CONNECTION_HPP
#define RESPKV_NET_CONNECTION_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "respkv/net/resp_protocol.hpp"
#include "respkv/net/types.hpp"

namespace respkv::net {

/*
    one socket plus its read buffer, used on both the server and the client side. does not own
    the fd. read_frame() decodes from bytes already buffered before touching the socket, so
    pipelined frames are handed out one at a time in arrival order
*/
class Connection {
   public:
    static constexpr std::size_t kReadChunkSize = 16 * 1024;

    explicit Connection(int fd) : fd_(fd) {}

    // next complete frame. nullopt on peer close or read error. throws ProtocolError
    [[nodiscard]] std::optional<Value> read_frame();

    // false if the peer is gone or the send failed
    [[nodiscard]] bool write_value(const Value& value);
    [[nodiscard]] bool write_raw(std::string_view data);

    [[nodiscard]] int fd() const noexcept {
        return fd_;
    }

    [[nodiscard]] std::size_t buffered() const noexcept {
        return buffer_.size() - read_pos_;
    }

   private:
    void compact();

    int fd_;
    std::string buffer_;
    // start of the unconsumed bytes in buffer_
    std::size_t read_pos_ = 0;
    // remembers how far into the current frame it got, so a frame split over many reads is
    // parsed once
    RespDecoder decoder_;
};

}  // namespace respkv::net

#endif
