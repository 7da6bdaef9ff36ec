#include "respkv/cmd/command.hpp"

#include <algorithm>
#include <array>

#include "respkv/util/strings.hpp"

namespace respkv::cmd {

namespace {

using ParseFn = Command (*)(const CommandRequest&);

/*
    arity follows the redis convention and counts the command name itself:
    positive = exactly that many, negative = at least -arity
*/
struct CommandSpec {
    std::string_view name;
    int arity;
    std::string_view usage;
    ParseFn parse;
};

CommandError arity_error(const CommandSpec& spec) {
    return CommandError("ERR wrong number of arguments for '" + util::to_lower(spec.name) +
                        "' command (usage: " + std::string(spec.usage) + ")");
}

CommandError syntax_error() {
    return CommandError("ERR syntax error");
}

int64_t parse_integer(const std::string& arg) {
    int64_t n = 0;
    if (!util::parse_int64(arg, n)) {
        throw CommandError("ERR value is not an integer or out of range");
    }
    return n;
}

// seconds or milliseconds -> milliseconds, nullopt when beyond core::kMaxTtl
std::optional<int64_t> to_millis(int64_t amount, bool seconds) {
    constexpr int64_t kMaxMillis = core::kMaxTtl.count();
    int64_t limit = seconds ? kMaxMillis / 1000 : kMaxMillis;
    if (amount > limit) {
        return std::nullopt;
    }
    if (amount < 0) {
        // any negative expiry deletes, clamp so the conversion cannot overflow
        return seconds ? std::max(amount, -limit) * 1000 : std::max(amount, -limit);
    }
    return seconds ? amount * 1000 : amount;
}

Command parse_ping(const CommandRequest& req) {
    if (req.args.size() > 1) {
        throw CommandError(
            "ERR wrong number of arguments for 'ping' command (usage: PING [message])");
    }
    Ping ping;
    if (!req.args.empty()) {
        ping.message = req.args[0];
    }
    return ping;
}

Command parse_echo(const CommandRequest& req) {
    return Echo{req.args[0]};
}

/*
    SET key value [NX | XX] [EX seconds | PX milliseconds | KEEPTTL]
    options may come in any order, each at most once per group
*/
Command parse_set(const CommandRequest& req) {
    Set set{req.args[0], req.args[1], core::SetOptions{}};
    bool has_condition = false;
    bool has_expiry = false;

    for (std::size_t i = 2; i < req.args.size(); ++i) {
        std::string option = util::to_upper(req.args[i]);

        if (option == "NX" || option == "XX") {
            if (has_condition) {
                throw syntax_error();
            }
            has_condition = true;
            set.options.condition =
                option == "NX" ? core::SetCondition::IfAbsent : core::SetCondition::IfExists;
        } else if (option == "EX" || option == "PX") {
            if (has_expiry || i + 1 >= req.args.size()) {
                throw syntax_error();
            }
            has_expiry = true;
            int64_t amount = parse_integer(req.args[++i]);
            auto millis = to_millis(amount, option == "EX");
            if (amount <= 0 || !millis) {
                throw CommandError("ERR invalid expire time in 'set' command");
            }
            set.options.ttl = util::Duration(*millis);
        } else if (option == "KEEPTTL") {
            if (has_expiry) {
                throw syntax_error();
            }
            has_expiry = true;
            set.options.keep_ttl = true;
        } else {
            throw syntax_error();
        }
    }
    return set;
}

Command parse_get(const CommandRequest& req) {
    return Get{req.args[0]};
}

Command parse_del(const CommandRequest& req) {
    return Del{req.args};
}

Command parse_exists(const CommandRequest& req) {
    return Exists{req.args};
}

Command parse_expire_common(const CommandRequest& req, bool seconds) {
    int64_t amount = parse_integer(req.args[1]);
    auto millis = to_millis(amount, seconds);
    if (!millis) {
        throw CommandError("ERR invalid expire time in '" + util::to_lower(req.name) +
                           "' command");
    }
    return Expire{req.args[0], util::Duration(*millis)};
}

Command parse_expire(const CommandRequest& req) {
    return parse_expire_common(req, true);
}

Command parse_pexpire(const CommandRequest& req) {
    return parse_expire_common(req, false);
}

Command parse_ttl(const CommandRequest& req) {
    return Ttl{req.args[0], false};
}

Command parse_pttl(const CommandRequest& req) {
    return Ttl{req.args[0], true};
}

Command parse_persist(const CommandRequest& req) {
    return Persist{req.args[0]};
}

Command parse_keys(const CommandRequest& req) {
    return Keys{req.args[0]};
}

Command parse_dbsize(const CommandRequest&) {
    return DbSize{};
}

// FLUSHDB / FLUSHALL [ASYNC | SYNC]. both modes flush synchronously
Command parse_flush(const CommandRequest& req) {
    if (req.args.size() > 1) {
        throw syntax_error();
    }
    if (req.args.size() == 1) {
        std::string mode = util::to_upper(req.args[0]);
        if (mode != "ASYNC" && mode != "SYNC") {
            throw syntax_error();
        }
    }
    return FlushDb{};
}

Command parse_config(const CommandRequest& req) {
    std::string sub = util::to_upper(req.args[0]);
    if (sub != "GET") {
        throw CommandError("ERR unknown subcommand '" + req.args[0] + "'. Try CONFIG GET.");
    }
    if (req.args.size() != 2) {
        throw CommandError(
            "ERR wrong number of arguments for 'config|get' command (usage: CONFIG GET "
            "parameter)");
    }
    return ConfigGet{req.args[1]};
}

Command parse_info(const CommandRequest& req) {
    return Info{req.args};
}

Command parse_quit(const CommandRequest&) {
    return Quit{};
}

constexpr std::array<CommandSpec, 18> kCommands{{
    {"PING", -1, "PING [message]", parse_ping},
    {"ECHO", 2, "ECHO message", parse_echo},
    {"SET", -3, "SET key value [NX|XX] [EX seconds|PX milliseconds|KEEPTTL]", parse_set},
    {"GET", 2, "GET key", parse_get},
    {"DEL", -2, "DEL key [key ...]", parse_del},
    {"EXISTS", -2, "EXISTS key [key ...]", parse_exists},
    {"EXPIRE", 3, "EXPIRE key seconds", parse_expire},
    {"PEXPIRE", 3, "PEXPIRE key milliseconds", parse_pexpire},
    {"TTL", 2, "TTL key", parse_ttl},
    {"PTTL", 2, "PTTL key", parse_pttl},
    {"PERSIST", 2, "PERSIST key", parse_persist},
    {"KEYS", 2, "KEYS pattern", parse_keys},
    {"DBSIZE", 1, "DBSIZE", parse_dbsize},
    {"FLUSHDB", -1, "FLUSHDB [ASYNC|SYNC]", parse_flush},
    {"FLUSHALL", -1, "FLUSHALL [ASYNC|SYNC]", parse_flush},
    {"CONFIG", -2, "CONFIG GET parameter", parse_config},
    {"INFO", -1, "INFO [section ...]", parse_info},
    {"QUIT", -1, "QUIT", parse_quit},
}};

const CommandSpec* find_spec(std::string_view name) {
    for (const auto& spec : kCommands) {
        if (util::iequals(spec.name, name)) {
            return &spec;
        }
    }
    return nullptr;
}

// name and args are echoed at most kMaxEcho bytes each, and args stop once kMaxEcho is used up
CommandError unknown_command(const CommandRequest& req) {
    constexpr std::size_t kMaxEcho = 128;
    std::string msg =
        "ERR unknown command '" + req.name.substr(0, kMaxEcho) + "', with args beginning with: ";
    std::size_t echoed = 0;
    for (const auto& arg : req.args) {
        if (echoed >= kMaxEcho) {
            break;
        }
        std::string part = arg.substr(0, kMaxEcho - echoed);
        echoed += part.size();
        msg += "'" + part + "' ";
    }
    return CommandError(msg);
}

}  // namespace

CommandRequest to_request(const net::Value& frame) {
    if (frame.type != net::ValueType::Array) {
        throw CommandError("ERR Protocol error: expected array of bulk strings");
    }
    if (frame.null || frame.elements.empty()) {
        throw CommandError("ERR empty command");
    }
    for (const auto& element : frame.elements) {
        if (element.type != net::ValueType::BulkString || element.null) {
            throw CommandError("ERR Protocol error: expected array of bulk strings");
        }
    }

    CommandRequest request;
    request.name = frame.elements.front().str;
    request.args.reserve(frame.elements.size() - 1);
    for (std::size_t i = 1; i < frame.elements.size(); ++i) {
        request.args.push_back(frame.elements[i].str);
    }
    return request;
}

Command parse_command(const CommandRequest& request) {
    const CommandSpec* spec = find_spec(request.name);
    if (spec == nullptr) {
        throw unknown_command(request);
    }

    int argc = static_cast<int>(request.args.size()) + 1;
    if ((spec->arity > 0 && argc != spec->arity) || (spec->arity < 0 && argc < -spec->arity)) {
        throw arity_error(*spec);
    }
    return spec->parse(request);
}

}  // namespace respkv::cmd
