#ifndef RESPKV_CMD_COMMAND_TABLE_HPP
#define RESPKV_CMD_COMMAND_TABLE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "respkv/cmd/command.hpp"
#include "respkv/core/istore.hpp"
#include "respkv/net/types.hpp"
#include "respkv/util/types.hpp"

namespace respkv::cmd {

inline constexpr std::string_view kVersion = "1.0.0";

// server state visible to INFO and CONFIG GET. counters are bumped from handler threads
struct ServerStatus {
    // CONFIG GET parameters, filled in before the server starts serving
    std::vector<std::pair<std::string, std::string>> parameters;
    uint16_t port = 0;
    util::TimePoint started_at = std::chrono::steady_clock::now();

    std::atomic<uint64_t> connected_clients{0};
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> total_commands{0};
};

struct Reply {
    net::Value value;
    bool close_connection = false;
};

/*
    executes commands against a store. holds no per-connection state, so one instance is shared
    by every handler thread. nothing in here throws on bad client input: every validation
    failure comes back as an error value
*/
class CommandTable {
   public:
    explicit CommandTable(core::IStore& store,
                          std::shared_ptr<ServerStatus> status = std::make_shared<ServerStatus>());

    // full path for one decoded frame: frame -> request -> command -> reply
    [[nodiscard]] Reply dispatch(const net::Value& frame);

    [[nodiscard]] net::Value execute(const CommandRequest& request);
    [[nodiscard]] net::Value execute(const Command& command);

    [[nodiscard]] const ServerStatus& status() const noexcept {
        return *status_;
    }

   private:
    core::IStore& store_;
    std::shared_ptr<ServerStatus> status_;
};

}  // namespace respkv::cmd

#endif
