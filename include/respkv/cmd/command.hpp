#ifndef RESPKV_CMD_COMMAND_HPP
#define RESPKV_CMD_COMMAND_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "respkv/core/istore.hpp"
#include "respkv/net/types.hpp"
#include "respkv/util/types.hpp"

namespace respkv::cmd {

// well-formed frame, bad command or arguments. becomes an error reply, the connection stays open
class CommandError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// a decoded request frame: command name plus its arguments, all raw byte strings
struct CommandRequest {
    std::string name;
    std::vector<std::string> args;
};

// typed commands. one alternative per supported command
struct Ping {
    std::optional<std::string> message;
};

struct Echo {
    std::string message;
};

struct Set {
    std::string key;
    std::string value;
    core::SetOptions options;
};

struct Get {
    std::string key;
};

struct Del {
    std::vector<std::string> keys;
};

struct Exists {
    std::vector<std::string> keys;
};

// EXPIRE and PEXPIRE, ttl already converted to milliseconds
struct Expire {
    std::string key;
    util::Duration ttl;
};

// TTL and PTTL
struct Ttl {
    std::string key;
    bool milliseconds = false;
};

struct Persist {
    std::string key;
};

struct Keys {
    std::string pattern;
};

struct DbSize {};

struct FlushDb {};

struct ConfigGet {
    std::string parameter;
};

struct Info {
    std::vector<std::string> sections;
};

struct Quit {};

using Command = std::variant<Ping, Echo, Set, Get, Del, Exists, Expire, Ttl, Persist, Keys, DbSize,
                             FlushDb, ConfigGet, Info, Quit>;

// frame -> request. frame must be a non-empty array of bulk strings, throws CommandError otherwise
[[nodiscard]] CommandRequest to_request(const net::Value& frame);

// request -> typed command. name is case-insensitive, throws CommandError
[[nodiscard]] Command parse_command(const CommandRequest& request);

}  // namespace respkv::cmd

#endif
