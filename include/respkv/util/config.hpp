#ifndef RESPKV_UTIL_CONFIG_HPP
#define RESPKV_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "respkv/util/logger.hpp"

namespace respkv::util {

struct Config {
    // server
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::size_t max_connections = 1000;
    int client_timeout_seconds = 300;

    // storage. 0 disables the background sweep and leaves expiry purely lazy
    int64_t sweep_interval_ms = 100;

    // logging
    LogLevel log_level = LogLevel::Info;

    // config file names of the settings that load_file / parse_args actually saw
    std::set<std::string> given;

    // Load from file ("key = value" lines, '#' comments)
    // returns nullopt if the file cannot be opened, throws std::invalid_argument on bad values
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help. throws std::invalid_argument on bad input
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // path given with -c/--config, if any
    static std::optional<std::filesystem::path> config_path(int argc, char* argv[]);

    // merge: CLI overrides file overrides defaults
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);
};

}  // namespace respkv::util

#endif
