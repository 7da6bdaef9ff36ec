#ifndef RESPKV_NET_RESP_PROTOCOL_HPP
#define RESPKV_NET_RESP_PROTOCOL_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "respkv/net/types.hpp"

namespace respkv::net {

// malformed bytes on the wire. the stream cannot be resynchronised, so this is connection-fatal
class ProtocolError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

class RespProtocol {
   public:
    static constexpr std::size_t kMaxBulkLength = 512 * 1024 * 1024;
    static constexpr std::size_t kMaxArrayLength = 1024 * 1024;
    static constexpr std::size_t kMaxNestingDepth = 128;
    // longest line without a payload: simple strings, errors, integers and $ / * headers
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    // encode value to bytes. CR and LF inside simple strings and errors are replaced by spaces
    static std::string encode(const Value& value);
    static void encode(const Value& value, std::string& out);

    // encode a client request: array of bulk strings
    static std::string encode_command(const std::vector<std::string>& args);

    /*
        decode one frame from the front of data.
        - returns nullopt if data holds only a prefix of a frame; bytes_consumed is untouched
        - on success sets bytes_consumed to the length of the frame
        - throws ProtocolError on malformed input
    */
    static std::optional<Value> decode(std::string_view data, std::size_t& bytes_consumed);
};

/*
    stateful decoder for a growing buffer. each call must see the bytes of the previous call
    followed by whatever arrived since, until a frame comes back. the caller then drops
    bytes_consumed from the front and the next frame starts over at zero. keeps the cost of a
    large array linear in its size when it arrives in many reads
*/
class RespDecoder {
   public:
    // same contract as RespProtocol::decode
    std::optional<Value> decode(std::string_view data, std::size_t& bytes_consumed);

    void reset() noexcept;

    // bytes of the current frame already parsed into complete elements
    [[nodiscard]] std::size_t progress() const noexcept {
        return offset_;
    }

   private:
    struct Pending {
        std::vector<Value> elements;
        std::size_t expected = 0;
    };

    std::vector<Pending> stack_;
    std::size_t offset_ = 0;
};

}  // namespace respkv::net

#endif
