#include "respkv/cmd/command_table.hpp"

#include <algorithm>
#include <variant>

#include "respkv/util/logger.hpp"
#include "respkv/util/strings.hpp"

namespace respkv::cmd {

namespace {

using net::Value;

// one overload per Command alternative. std::visit refuses to compile if one is missing
struct Executor {
    core::IStore& store;
    const ServerStatus& status;

    Value operator()(const Ping& cmd) const {
        if (cmd.message.has_value()) {
            return Value::bulk(*cmd.message);
        }
        return Value::simple("PONG");
    }

    Value operator()(const Echo& cmd) const {
        return Value::bulk(cmd.message);
    }

    Value operator()(const Set& cmd) const {
        if (!store.set(cmd.key, cmd.value, cmd.options)) {
            return Value::null_bulk();
        }
        return Value::ok();
    }

    Value operator()(const Get& cmd) const {
        auto value = store.get(cmd.key);
        if (!value) {
            return Value::null_bulk();
        }
        return Value::bulk(std::move(*value));
    }

    Value operator()(const Del& cmd) const {
        int64_t removed = 0;
        for (const auto& key : cmd.keys) {
            if (store.remove(key)) {
                ++removed;
            }
        }
        return Value::integer_value(removed);
    }

    Value operator()(const Exists& cmd) const {
        int64_t found = 0;
        for (const auto& key : cmd.keys) {
            if (store.contains(key)) {
                ++found;
            }
        }
        return Value::integer_value(found);
    }

    Value operator()(const Expire& cmd) const {
        return Value::integer_value(store.expire(cmd.key, cmd.ttl) ? 1 : 0);
    }

    Value operator()(const Ttl& cmd) const {
        int64_t ms = store.ttl(cmd.key);
        if (ms < 0 || cmd.milliseconds) {
            return Value::integer_value(ms);
        }
        // round to the nearest second
        return Value::integer_value((ms + 500) / 1000);
    }

    Value operator()(const Persist& cmd) const {
        return Value::integer_value(store.persist(cmd.key) ? 1 : 0);
    }

    Value operator()(const Keys& cmd) const {
        auto keys = store.keys(cmd.pattern);
        std::sort(keys.begin(), keys.end());
        std::vector<Value> elements;
        elements.reserve(keys.size());
        for (auto& key : keys) {
            elements.push_back(Value::bulk(std::move(key)));
        }
        return Value::array(std::move(elements));
    }

    Value operator()(const DbSize&) const {
        return Value::integer_value(static_cast<int64_t>(store.size()));
    }

    Value operator()(const FlushDb&) const {
        store.clear();
        return Value::ok();
    }

    Value operator()(const ConfigGet& cmd) const {
        if (util::iequals(cmd.parameter, "loglevel")) {
            auto level = util::log_level_name(util::Logger::instance().level());
            return Value::array({Value::bulk("loglevel"), Value::bulk(std::string(level))});
        }
        for (const auto& [name, value] : status.parameters) {
            if (util::iequals(name, cmd.parameter)) {
                return Value::array({Value::bulk(name), Value::bulk(value)});
            }
        }
        return Value::null_bulk();
    }

    Value operator()(const Info& cmd) const {
        auto wanted = [&cmd](std::string_view section) {
            if (cmd.sections.empty()) {
                return true;
            }
            for (const auto& requested : cmd.sections) {
                if (util::iequals(requested, section) || util::iequals(requested, "all") ||
                    util::iequals(requested, "default") || util::iequals(requested, "everything")) {
                    return true;
                }
            }
            return false;
        };

        std::string text;
        auto begin_section = [&text](std::string_view title) {
            if (!text.empty()) {
                text += "\r\n";
            }
            text += "# " + std::string(title) + "\r\n";
        };

        if (wanted("server")) {
            auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - status.started_at);
            begin_section("Server");
            text += "respkv_version:" + std::string(kVersion) + "\r\n";
            text += "tcp_port:" + std::to_string(status.port) + "\r\n";
            text += "uptime_in_seconds:" + std::to_string(uptime.count()) + "\r\n";
        }
        if (wanted("clients")) {
            begin_section("Clients");
            text += "connected_clients:" + std::to_string(status.connected_clients.load()) + "\r\n";
        }
        if (wanted("stats")) {
            begin_section("Stats");
            text += "total_connections_received:" +
                    std::to_string(status.total_connections.load()) + "\r\n";
            text += "total_commands_processed:" + std::to_string(status.total_commands.load()) +
                    "\r\n";
        }
        if (wanted("replication")) {
            begin_section("Replication");
            text += "role:master\r\n";
        }
        if (wanted("keyspace")) {
            begin_section("Keyspace");
            auto keys = store.size();
            if (keys > 0) {
                text += "db0:keys=" + std::to_string(keys) + "\r\n";
            }
        }
        return Value::bulk(std::move(text));
    }

    Value operator()(const Quit&) const {
        return Value::ok();
    }
};

}  // namespace

CommandTable::CommandTable(core::IStore& store, std::shared_ptr<ServerStatus> status)
    : store_(store), status_(std::move(status)) {
    if (!status_) {
        status_ = std::make_shared<ServerStatus>();
    }
}

Reply CommandTable::dispatch(const net::Value& frame) {
    status_->total_commands.fetch_add(1);
    try {
        Command command = parse_command(to_request(frame));
        bool quit = std::holds_alternative<Quit>(command);
        return Reply{execute(command), quit};
    } catch (const CommandError& e) {
        return Reply{Value::error(e.what()), false};
    }
}

net::Value CommandTable::execute(const CommandRequest& request) {
    try {
        return execute(parse_command(request));
    } catch (const CommandError& e) {
        return Value::error(e.what());
    }
}

net::Value CommandTable::execute(const Command& command) {
    try {
        return std::visit(Executor{store_, *status_}, command);
    } catch (const std::exception& e) {
        LOG_ERROR("command failed: " + std::string(e.what()));
        return Value::error(std::string("ERR internal error: ") + e.what());
    }
}

}  // namespace respkv::cmd
