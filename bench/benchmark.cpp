#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "benchmark.hpp"
#include "respkv/core/store.hpp"
#include "respkv/net/client/client.hpp"
#include "respkv/net/server/server.hpp"
#include "respkv/util/logger.hpp"

using namespace respkv;
using namespace respkv::bench;

namespace {

struct Options {
    size_t requests = 100000;
    size_t keys = 10000;
    size_t value_size = 64;
    size_t pipeline = 16;
    size_t threads = 4;
    bool network = true;
    bool latency = true;
    bool parallel = true;
};

net::client::Client connect_client(uint16_t port) {
    net::client::ClientOptions opts;
    opts.port = port;
    net::client::Client client(opts);
    client.connect();
    return client;
}

// =========================================================================================
// store benchmarks (direct, no network)
// =========================================================================================

void run_store(const Options& opts) {
    print_header("Store (in process)");

    core::Store store;
    Workload work(opts.keys, opts.value_size);

    measure("set", opts.requests, [&](size_t i) { store.set(work.key(i), work.value(i)); })
        .print();
    measure("get", opts.requests, [&](size_t i) { (void)store.get(work.key(i)); }).print();
    measure("set with ttl", opts.requests, [&](size_t i) {
        store.set(work.key(i), work.value(i), util::Duration(60'000));
    }).print();

    for (double reads : {0.8, 0.5}) {
        std::string label = "mixed " + std::to_string(static_cast<int>(reads * 100)) + "% get";
        measure(label, opts.requests, [&](size_t) {
            size_t idx = work.random_index();
            if (work.coin(reads)) {
                (void)store.get(work.key(idx));
            } else {
                store.set(work.key(idx), work.value(idx));
            }
        }).print();
    }

    measure_parallel("set/get", opts.threads, opts.requests / opts.threads, [&](size_t t, size_t i) {
        if ((i + t) % 2 == 0) {
            store.set(work.key(i), work.value(i));
        } else {
            (void)store.get(work.key(i));
        }
    }).print();

    std::cout << std::endl;
}

// =========================================================================================
// network benchmarks
// =========================================================================================

void run_network(uint16_t port, const Options& opts) {
    print_header("RESP over loopback");

    auto client = connect_client(port);
    Workload work(opts.keys, opts.value_size);

    measure("PING", opts.requests, [&](size_t) { (void)client.ping(); }).print();
    measure("SET", opts.requests, [&](size_t i) { client.set(work.key(i), work.value(i)); })
        .print();
    measure("GET", opts.requests, [&](size_t i) { (void)client.get(work.key(i)); }).print();

    // one timed op is a whole batch: queue `pipeline` requests, then drain the replies
    size_t batches = std::max<size_t>(1, opts.requests / opts.pipeline);
    std::string suffix = " (pipeline " + std::to_string(opts.pipeline) + ")";

    auto set_batch = measure("SET" + suffix, batches, [&](size_t b) {
        for (size_t j = 0; j < opts.pipeline; ++j) {
            size_t i = b * opts.pipeline + j;
            client.send_command({"SET", work.key(i), work.value(i)});
        }
        for (size_t j = 0; j < opts.pipeline; ++j) {
            (void)client.read_reply();
        }
    });
    set_batch.requests *= opts.pipeline;
    set_batch.print();

    auto get_batch = measure("GET" + suffix, batches, [&](size_t b) {
        for (size_t j = 0; j < opts.pipeline; ++j) {
            client.send_command({"GET", work.key(b * opts.pipeline + j)});
        }
        for (size_t j = 0; j < opts.pipeline; ++j) {
            (void)client.read_reply();
        }
    });
    get_batch.requests *= opts.pipeline;
    get_batch.print();

    std::cout << std::endl;
}

void run_latency(uint16_t port, const Options& opts) {
    print_header("Request latency");

    auto client = connect_client(port);
    Workload work(opts.keys, opts.value_size);
    size_t samples = std::max<size_t>(1, opts.requests / 10);

    measure_latency("SET", samples, [&](size_t i) { client.set(work.key(i), work.value(i)); })
        .print();
    measure_latency("GET", samples, [&](size_t i) { (void)client.get(work.key(i)); }).print();

    std::cout << std::endl;
}

void run_parallel(uint16_t port, const Options& opts) {
    print_header("Concurrent connections");

    Workload work(opts.keys, opts.value_size);

    for (size_t threads : {size_t{2}, opts.threads, opts.threads * 2}) {
        std::vector<std::unique_ptr<net::client::Client>> clients;
        for (size_t t = 0; t < threads; ++t) {
            clients.push_back(std::make_unique<net::client::Client>(connect_client(port)));
        }

        measure_parallel("SET/GET", threads, opts.requests / threads, [&](size_t t, size_t i) {
            if (i % 2 == 0) {
                clients[t]->set(work.key(i), work.value(i));
            } else {
                (void)clients[t]->get(work.key(i));
            }
        }).print();
    }

    std::cout << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --requests N      requests per test (default: 100000)\n"
              << "  --keys N          distinct keys (default: 10000)\n"
              << "  --value-size N    value size in bytes (default: 64)\n"
              << "  --pipeline N      requests per pipelined batch (default: 16)\n"
              << "  --threads N       threads for the concurrent tests (default: 4)\n"
              << "  --no-network      skip loopback throughput tests\n"
              << "  --no-latency      skip latency percentiles\n"
              << "  --no-parallel     skip concurrent connection tests\n"
              << "  --help            show this help\n";
}

}  // namespace

// =========================================================================================
// main
// =========================================================================================

int main(int argc, char* argv[]) {
    Options opts;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--requests" && i + 1 < argc) {
                opts.requests = std::stoull(argv[++i]);
            } else if (arg == "--keys" && i + 1 < argc) {
                opts.keys = std::stoull(argv[++i]);
            } else if (arg == "--value-size" && i + 1 < argc) {
                opts.value_size = std::stoull(argv[++i]);
            } else if (arg == "--pipeline" && i + 1 < argc) {
                opts.pipeline = std::stoull(argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                opts.threads = std::stoull(argv[++i]);
            } else if (arg == "--no-network") {
                opts.network = false;
            } else if (arg == "--no-latency") {
                opts.latency = false;
            } else if (arg == "--no-parallel") {
                opts.parallel = false;
            } else if (arg == "--help") {
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

    if (opts.requests == 0 || opts.keys == 0 || opts.pipeline == 0 || opts.threads == 0) {
        std::cerr << "--requests, --keys, --pipeline and --threads must be positive" << std::endl;
        return 1;
    }

    util::Logger::instance().set_level(util::LogLevel::Warn);

    std::cout << "=== respkv benchmark ===" << std::endl;
    std::cout << "requests=" << opts.requests << " keys=" << opts.keys
              << " value_size=" << opts.value_size << std::endl;
    std::cout << std::endl;

    try {
        run_store(opts);

        if (opts.network || opts.latency || opts.parallel) {
            core::Store store;
            net::server::ServerOptions server_opts;
            server_opts.port = 0;
            server_opts.client_timeout_seconds = 0;
            net::server::Server server(store, server_opts);
            server.start();

            if (opts.network) {
                run_network(server.port(), opts);
            }
            if (opts.latency) {
                run_latency(server.port(), opts);
            }
            if (opts.parallel) {
                run_parallel(server.port(), opts);
            }

            server.stop();
        }
    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Benchmark complete" << std::endl;
    return 0;
}
