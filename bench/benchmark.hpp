#ifndef RESPKV_BENCH_BENCHMARK_HPP
#define RESPKV_BENCH_BENCHMARK_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace respkv::bench {

using Clock = std::chrono::steady_clock;

inline double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// one line of output: how many requests, over how long, on how many threads
struct Throughput {
    std::string label;
    size_t requests = 0;
    double seconds = 0.0;
    size_t threads = 1;

    double requests_per_second() const {
        return seconds > 0.0 ? static_cast<double>(requests) / seconds : 0.0;
    }

    void print() const {
        std::cout << std::left << std::setw(32) << label << std::right << std::setw(10)
                  << requests << " requests";
        if (threads > 1) {
            std::cout << "  threads=" << threads;
        }
        std::cout << "  " << std::fixed << std::setprecision(2) << seconds << " s  "
                  << std::setprecision(0) << requests_per_second() << " req/s";
        if (requests > 0 && threads == 1) {
            std::cout << "  avg=" << std::setprecision(2)
                      << seconds * 1e6 / static_cast<double>(requests) << " us";
        }
        std::cout << std::endl;
    }
};

// per-request samples in microseconds, sorted before printing
struct Latency {
    std::string label;
    std::vector<double> samples_us;

    double at(double quantile) const {
        if (samples_us.empty()) return 0.0;
        auto idx = static_cast<size_t>(quantile * static_cast<double>(samples_us.size()));
        return samples_us[std::min(idx, samples_us.size() - 1)];
    }

    void print() const {
        std::cout << std::left << std::setw(32) << label << std::right << std::fixed
                  << std::setprecision(2);
        for (auto [name, q] : {std::pair{"p50", 0.50}, std::pair{"p90", 0.90},
                               std::pair{"p99", 0.99}, std::pair{"p99.9", 0.999}}) {
            std::cout << "  " << name << "=" << at(q) << " us";
        }
        std::cout << "  max=" << (samples_us.empty() ? 0.0 : samples_us.back()) << " us"
                  << std::endl;
    }
};

// `requests` calls of op(i), timed as a whole
inline Throughput measure(const std::string& label, size_t requests,
                          const std::function<void(size_t)>& op) {
    auto start = Clock::now();
    for (size_t i = 0; i < requests; ++i) {
        op(i);
    }
    return {label, requests, seconds_since(start)};
}

// same as measure(), timing every call on its own
inline Latency measure_latency(const std::string& label, size_t requests,
                               const std::function<void(size_t)>& op) {
    Latency result{label, {}};
    result.samples_us.reserve(requests);
    for (size_t i = 0; i < requests; ++i) {
        auto start = Clock::now();
        op(i);
        result.samples_us.push_back(seconds_since(start) * 1e6);
    }
    std::sort(result.samples_us.begin(), result.samples_us.end());
    return result;
}

// op(thread, i) on `threads` threads at once, `per_thread` calls each
inline Throughput measure_parallel(const std::string& label, size_t threads, size_t per_thread,
                                   const std::function<void(size_t, size_t)>& op) {
    std::vector<std::thread> workers;
    workers.reserve(threads);
    auto start = Clock::now();
    for (size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&op, t, per_thread]() {
            for (size_t i = 0; i < per_thread; ++i) {
                op(t, i);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    return {label, threads * per_thread, seconds_since(start), threads};
}

/*
    pre-generated keys and values so string building stays out of the timed loops.
    keys look like "key:000042", values are random alphanumerics of a fixed size
*/
class Workload {
   public:
    Workload(size_t keys, size_t value_size, uint32_t seed = 42) : rng_(seed) {
        keys_.reserve(keys);
        values_.reserve(keys);
        for (size_t i = 0; i < keys; ++i) {
            std::ostringstream name;
            name << "key:" << std::setw(6) << std::setfill('0') << i;
            keys_.push_back(name.str());
            values_.push_back(random_value(value_size));
        }
    }

    const std::string& key(size_t i) const { return keys_[i % keys_.size()]; }
    const std::string& value(size_t i) const { return values_[i % values_.size()]; }
    size_t size() const { return keys_.size(); }

    size_t random_index() {
        return std::uniform_int_distribution<size_t>(0, keys_.size() - 1)(rng_);
    }

    bool coin(double probability) {
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < probability;
    }

   private:
    std::string random_value(size_t length) {
        static constexpr char kAlphabet[] =
            "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
        std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);
        std::string out(length, ' ');
        for (auto& c : out) {
            c = kAlphabet[pick(rng_)];
        }
        return out;
    }

    std::mt19937 rng_;
    std::vector<std::string> keys_;
    std::vector<std::string> values_;
};

inline void print_header(const std::string& title) {
    std::cout << "--- " << title << " ---" << std::endl;
}

}  // namespace respkv::bench

#endif
