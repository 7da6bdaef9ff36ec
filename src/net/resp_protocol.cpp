#include "respkv/net/resp_protocol.hpp"

#include <algorithm>

#include "respkv/util/strings.hpp"

/*
    wire format (RESP2), every line terminated by CRLF:
    - simple string: +<text>
    - error:         -<text>
    - integer:       :<int64>
    - bulk string:   $<len>\r\n<len bytes>      ($-1 = null)
    - array:         *<count>\r\n<count values> (*-1 = null)
*/

namespace respkv::net {

namespace {

constexpr std::string_view kCrlf = "\r\n";

void append_sanitized(std::string& out, std::string_view text) {
    for (char c : text) {
        out.push_back((c == '\r' || c == '\n') ? ' ' : c);
    }
}

// offending input echoed back in an error, cut short so the reply stays a small line
std::string excerpt(std::string_view text) {
    constexpr std::size_t kMaxExcerpt = 64;
    if (text.size() <= kMaxExcerpt) {
        return "'" + std::string(text) + "'";
    }
    return "'" + std::string(text.substr(0, kMaxExcerpt)) + "...'";
}

// parses the non-aggregate types. arrays are driven by RespDecoder's stack
class ScalarParser {
   public:
    explicit ScalarParser(std::string_view data) : data_(data) {}

    std::optional<Value> parse(std::size_t& offset) {
        char prefix = data_[offset];
        switch (prefix) {
            case '+':
            case '-': {
                auto line = read_line(offset + 1);
                if (!line) {
                    return std::nullopt;
                }
                offset += 1 + line->size() + kCrlf.size();
                return prefix == '+' ? Value::simple(std::string(*line))
                                     : Value::error(std::string(*line));
            }

            case ':': {
                auto line = read_line(offset + 1);
                if (!line) {
                    return std::nullopt;
                }
                int64_t n = 0;
                if (!util::parse_int64(*line, n)) {
                    throw ProtocolError("Protocol error: invalid integer " + excerpt(*line));
                }
                offset += 1 + line->size() + kCrlf.size();
                return Value::integer_value(n);
            }

            case '$':
                return parse_bulk(offset);

            default:
                throw ProtocolError(std::string("Protocol error: unexpected type byte '") +
                                    prefix + "'");
        }
    }

    // reads the length/count header of a bulk string or array. -1 means null
    std::optional<int64_t> read_length(std::size_t& offset, std::string_view what,
                                       std::size_t limit) {
        auto line = read_line(offset + 1);
        if (!line) {
            return std::nullopt;
        }
        int64_t len = 0;
        if (!util::parse_int64(*line, len)) {
            throw ProtocolError("Protocol error: invalid " + std::string(what) + " " +
                                excerpt(*line));
        }
        if (len < -1) {
            throw ProtocolError("Protocol error: negative " + std::string(what));
        }
        if (len > static_cast<int64_t>(limit)) {
            throw ProtocolError("Protocol error: " + std::string(what) + " too large");
        }
        offset += 1 + line->size() + kCrlf.size();
        return len;
    }

   private:
    // text between start and the next CRLF, or nullopt if the CRLF has not arrived yet
    std::optional<std::string_view> read_line(std::size_t start) {
        auto end = data_.find(kCrlf, start);
        if (end == std::string_view::npos) {
            if (data_.size() - start > RespProtocol::kMaxLineLength) {
                throw ProtocolError("Protocol error: line too long");
            }
            return std::nullopt;
        }
        return data_.substr(start, end - start);
    }

    std::optional<Value> parse_bulk(std::size_t& offset) {
        std::size_t cursor = offset;
        auto len = read_length(cursor, "bulk length", RespProtocol::kMaxBulkLength);
        if (!len) {
            return std::nullopt;
        }
        if (*len == -1) {
            offset = cursor;
            return Value::null_bulk();
        }

        auto size = static_cast<std::size_t>(*len);
        if (data_.size() - cursor < size + kCrlf.size()) {
            // the bytes we do have must not already contradict the frame
            std::size_t available = data_.size() - cursor;
            if (available > size && data_[cursor + size] != '\r') {
                throw ProtocolError("Protocol error: bulk string not terminated by CRLF");
            }
            return std::nullopt;
        }
        if (data_.substr(cursor + size, kCrlf.size()) != kCrlf) {
            throw ProtocolError("Protocol error: bulk string not terminated by CRLF");
        }

        Value value = Value::bulk(std::string(data_.substr(cursor, size)));
        offset = cursor + size + kCrlf.size();
        return value;
    }

    std::string_view data_;
};

}  // namespace

std::string RespProtocol::encode(const Value& value) {
    std::string out;
    encode(value, out);
    return out;
}

void RespProtocol::encode(const Value& value, std::string& out) {
    switch (value.type) {
        case ValueType::SimpleString:
            out.push_back('+');
            append_sanitized(out, value.str);
            out.append(kCrlf);
            break;

        case ValueType::Error:
            out.push_back('-');
            append_sanitized(out, value.str);
            out.append(kCrlf);
            break;

        case ValueType::Integer:
            out.push_back(':');
            out.append(std::to_string(value.integer));
            out.append(kCrlf);
            break;

        case ValueType::BulkString:
            if (value.null) {
                out.append("$-1\r\n");
                break;
            }
            out.push_back('$');
            out.append(std::to_string(value.str.size()));
            out.append(kCrlf);
            out.append(value.str);
            out.append(kCrlf);
            break;

        case ValueType::Array:
            if (value.null) {
                out.append("*-1\r\n");
                break;
            }
            out.push_back('*');
            out.append(std::to_string(value.elements.size()));
            out.append(kCrlf);
            for (const auto& element : value.elements) {
                encode(element, out);
            }
            break;
    }
}

std::string RespProtocol::encode_command(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out.push_back('$');
        out.append(std::to_string(arg.size()));
        out.append(kCrlf);
        out.append(arg);
        out.append(kCrlf);
    }
    return out;
}

std::optional<Value> RespProtocol::decode(std::string_view data, std::size_t& bytes_consumed) {
    RespDecoder decoder;
    return decoder.decode(data, bytes_consumed);
}

/*
    elements that are already complete stay on stack_ between calls, and offset_ points at the
    first byte not folded into them. only the value under the cursor is parsed again when more
    bytes arrive
*/
std::optional<Value> RespDecoder::decode(std::string_view data, std::size_t& bytes_consumed) {
    ScalarParser parser(data);
    std::size_t cursor = offset_;

    while (true) {
        if (stack_.size() > RespProtocol::kMaxNestingDepth) {
            reset();
            throw ProtocolError("Protocol error: nesting too deep");
        }
        if (cursor >= data.size()) {
            offset_ = cursor;
            return std::nullopt;
        }

        std::optional<Value> value;
        try {
            if (data[cursor] == '*') {
                std::size_t next = cursor;
                auto count = parser.read_length(next, "multibulk length",
                                                RespProtocol::kMaxArrayLength);
                if (!count) {
                    offset_ = cursor;
                    return std::nullopt;
                }
                cursor = next;
                if (*count == -1) {
                    value = Value::null_array();
                } else if (*count == 0) {
                    value = Value::array({});
                } else {
                    Pending pending;
                    pending.expected = static_cast<std::size_t>(*count);
                    // don't trust the count for the reservation until the elements arrive
                    pending.elements.reserve(std::min<std::size_t>(pending.expected, 1024));
                    stack_.push_back(std::move(pending));
                    continue;
                }
            } else {
                value = parser.parse(cursor);
                if (!value) {
                    offset_ = cursor;
                    return std::nullopt;
                }
            }
        } catch (const ProtocolError&) {
            reset();
            throw;
        }

        // fold the finished value into its parents
        while (!stack_.empty()) {
            auto& top = stack_.back();
            top.elements.push_back(std::move(*value));
            if (top.elements.size() < top.expected) {
                break;
            }
            value = Value::array(std::move(top.elements));
            stack_.pop_back();
        }
        if (stack_.empty()) {
            bytes_consumed = cursor;
            reset();
            return value;
        }
    }
}

void RespDecoder::reset() noexcept {
    stack_.clear();
    offset_ = 0;
}

}  // namespace respkv::net
