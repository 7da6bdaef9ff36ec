#include "respkv/util/signal_handler.hpp"

#include <chrono>
#include <csignal>
#include <thread>

namespace respkv::util {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

namespace {

// only async-signal-safe work here: a lock-free atomic store
void signal_handler(int signal) {
    (void)signal;
    SignalHandler::request_shutdown();
}

}  // namespace

void SignalHandler::install() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

bool SignalHandler::should_shutdown() {
    return shutdown_requested_.load();
}

// polls instead of waiting on a condition variable: notify_all() is not safe to call from
// inside a signal handler
void SignalHandler::wait_for_shutdown() {
    while (!shutdown_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

void SignalHandler::request_shutdown() {
    shutdown_requested_.store(true);
}

void SignalHandler::reset() {
    shutdown_requested_.store(false);
}

}  // namespace respkv::util
