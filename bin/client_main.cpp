#include <cctype>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "respkv/net/client/client.hpp"
#include "respkv/util/strings.hpp"

using namespace respkv::net;
using namespace respkv::net::client;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -H, --host HOST     Server host (default: 127.0.0.1)\n"
              << "  -p, --port PORT     Server port (default: 6379)\n"
              << "  --timeout SECS      Connection timeout (default: 30)\n"
              << "  -h, --help          Show this help\n"
              << "\n"
              << "Type any command, e.g. SET key \"some value\" EX 10. QUIT or EXIT leaves.\n";
}

// whitespace separated, "double quoted" args may hold spaces and \" \\ \n \r \t escapes.
// nullopt on an unterminated quote
std::optional<std::vector<std::string>> split_args(const std::string& line) {
    std::vector<std::string> args;
    std::size_t i = 0;

    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        if (i >= line.size()) {
            break;
        }

        std::string current;
        if (line[i] == '"') {
            ++i;
            bool closed = false;
            while (i < line.size()) {
                char c = line[i++];
                if (c == '"') {
                    closed = true;
                    break;
                }
                if (c == '\\' && i < line.size()) {
                    char next = line[i++];
                    switch (next) {
                        case 'n': current.push_back('\n'); break;
                        case 'r': current.push_back('\r'); break;
                        case 't': current.push_back('\t'); break;
                        default: current.push_back(next); break;
                    }
                    continue;
                }
                current.push_back(c);
            }
            if (!closed) {
                return std::nullopt;
            }
        } else {
            while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) {
                current.push_back(line[i++]);
            }
        }
        args.push_back(std::move(current));
    }

    return args;
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    out.push_back('"');
    return out;
}

// redis-cli style rendering
void print_value(const Value& value, const std::string& indent = "") {
    switch (value.type) {
        case ValueType::SimpleString:
            std::cout << value.str << "\n";
            break;
        case ValueType::Error:
            std::cout << "(error) " << value.str << "\n";
            break;
        case ValueType::Integer:
            std::cout << "(integer) " << value.integer << "\n";
            break;
        case ValueType::BulkString:
            if (value.null) {
                std::cout << "(nil)\n";
            } else {
                std::cout << quote(value.str) << "\n";
            }
            break;
        case ValueType::Array:
            if (value.null) {
                std::cout << "(nil)\n";
            } else if (value.elements.empty()) {
                std::cout << "(empty array)\n";
            } else {
                for (std::size_t i = 0; i < value.elements.size(); ++i) {
                    std::string prefix = std::to_string(i + 1) + ") ";
                    if (i > 0) {
                        std::cout << indent;
                    }
                    std::cout << prefix;
                    print_value(value.elements[i], indent + std::string(prefix.size(), ' '));
                }
            }
            break;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    ClientOptions opts;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
                opts.host = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                opts.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--timeout" && i + 1 < argc) {
                opts.timeout_seconds = std::stoi(argv[++i]);
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 1;
    }

    Client client(opts);

    try {
        client.connect();
    } catch (const std::exception& e) {
        std::cerr << "Connection failed: " << e.what() << std::endl;
        return 1;
    }

    const std::string prompt = opts.host + ":" + std::to_string(opts.port) + "> ";
    std::string line;
    std::cout << prompt;

    while (std::getline(std::cin, line)) {
        auto args = split_args(line);
        if (!args) {
            std::cout << "Invalid argument(s): unbalanced quotes" << std::endl;
            std::cout << prompt;
            continue;
        }
        if (args->empty()) {
            std::cout << prompt;
            continue;
        }

        std::string name = respkv::util::to_upper((*args)[0]);
        if (name == "EXIT") {
            break;
        }

        try {
            auto reply = client.command(*args);
            print_value(reply);
            if (name == "QUIT") {
                break;
            }
        } catch (const std::exception& e) {
            std::cout << "(error) " << e.what() << std::endl;

            if (!client.connected()) {
                try {
                    client.connect();
                    std::cout << "Reconnected" << std::endl;
                } catch (const std::exception& reconnect_error) {
                    std::cerr << "Reconnection failed: " << reconnect_error.what() << std::endl;
                    return 1;
                }
            }
        }

        std::cout << prompt << std::flush;
    }

    client.disconnect();
    return 0;
}
