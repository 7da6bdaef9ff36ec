#include "respkv/util/config.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace respkv::util {

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// std::stoll accepts trailing garbage ("12abc"), so check the whole string was consumed
int64_t to_int(const std::string& key, const std::string& value) {
    size_t pos = 0;
    int64_t result = 0;
    try {
        result = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + key + ": '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument("invalid value for " + key + ": '" + value + "'");
    }
    return result;
}

uint16_t to_port(const std::string& key, const std::string& value) {
    auto port = to_int(key, value);
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw std::invalid_argument("port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

// integer setting that must fall inside [min, max]
int64_t to_bounded(const std::string& key, const std::string& value, int64_t min, int64_t max) {
    auto n = to_int(key, value);
    if (n < min || n > max) {
        throw std::invalid_argument(key + " out of range [" + std::to_string(min) + ", " +
                                    std::to_string(max) + "]: " + value);
    }
    return n;
}

LogLevel to_log_level(const std::string& value) {
    auto level = parse_log_level(value);
    if (!level) {
        throw std::invalid_argument("invalid log level: '" + value + "'");
    }
    return *level;
}

// sets one option by its config file name and records it as given. false for unknown keys
bool apply(Config& config, const std::string& key, const std::string& value) {
    if (key == "host") {
        config.host = value;
    } else if (key == "port") {
        config.port = to_port(key, value);
    } else if (key == "max_connections") {
        config.max_connections = static_cast<std::size_t>(
            to_bounded(key, value, 1, std::numeric_limits<int64_t>::max()));
    } else if (key == "client_timeout_seconds") {
        config.client_timeout_seconds =
            static_cast<int>(to_bounded(key, value, 0, std::numeric_limits<int>::max()));
    } else if (key == "sweep_interval_ms") {
        config.sweep_interval_ms = to_bounded(key, value, 0, std::numeric_limits<int64_t>::max());
    } else if (key == "log_level") {
        config.log_level = to_log_level(value);
    } else {
        return false;
    }
    config.given.insert(key);
    return true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config FILE          Config file path\n"
              << "  -H, --host HOST            Host to bind (default: 127.0.0.1)\n"
              << "  -p, --port PORT            Port to listen on (default: 6379)\n"
              << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
              << "  --max-connections N        Max client connections (default: 1000)\n"
              << "  --client-timeout SEC       Client timeout seconds, 0 = none (default: 300)\n"
              << "  --sweep-interval MS        Expired key sweep interval, 0 = lazy only "
                 "(default: 100)\n"
              << "  -h, --help                 Show this help\n";
}

}  // namespace

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!apply(config, key, value)) {
            std::cerr << "Warning: unknown config key '" << key << "' in " << path << std::endl;
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return std::nullopt;
        }
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            apply(config, "host", argv[++i]);
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            apply(config, "port", argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            apply(config, "log_level", argv[++i]);
        } else if (arg == "--max-connections" && i + 1 < argc) {
            apply(config, "max_connections", argv[++i]);
        } else if (arg == "--client-timeout" && i + 1 < argc) {
            apply(config, "client_timeout_seconds", argv[++i]);
        } else if (arg == "--sweep-interval" && i + 1 < argc) {
            apply(config, "sweep_interval_ms", argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // config file handled by config_path()
            ++i;
        } else {
            throw std::invalid_argument("unknown or incomplete option: " + arg);
        }
    }

    return config;
}

std::optional<std::filesystem::path> Config::config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return std::filesystem::path(argv[i + 1]);
        }
    }
    return std::nullopt;
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;

    // file overrides defaults, CLI overrides file. a source wins for a setting it named
    // explicitly, or for one it changed from the default when built by hand
    for (const Config* source : {&file_config, &cli_config}) {
        auto wins = [&](const char* key, bool differs) {
            return source->given.count(key) > 0 || differs;
        };
        if (wins("host", source->host != defaults.host)) result.host = source->host;
        if (wins("port", source->port != defaults.port)) result.port = source->port;
        if (wins("max_connections", source->max_connections != defaults.max_connections))
            result.max_connections = source->max_connections;
        if (wins("client_timeout_seconds",
                 source->client_timeout_seconds != defaults.client_timeout_seconds))
            result.client_timeout_seconds = source->client_timeout_seconds;
        if (wins("sweep_interval_ms", source->sweep_interval_ms != defaults.sweep_interval_ms))
            result.sweep_interval_ms = source->sweep_interval_ms;
        if (wins("log_level", source->log_level != defaults.log_level))
            result.log_level = source->log_level;
        result.given.insert(source->given.begin(), source->given.end());
    }

    return result;
}

}  // namespace respkv::util
