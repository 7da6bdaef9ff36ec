#ifndef RESPKV_UTIL_CLOCK_HPP
#define RESPKV_UTIL_CLOCK_HPP

#include <chrono>
#include <memory>
#include <mutex>

#include "respkv/util/types.hpp"

namespace respkv::util {

class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }
};

// manually driven clock for TTL tests. guarded because the store reads it from
// handler threads while the test thread advances it
class MockClock : public Clock {
public:
    [[nodiscard]] TimePoint now() const override {
        std::lock_guard lock(mutex_);
        return current_;
    }

    void set(TimePoint time) {
        std::lock_guard lock(mutex_);
        current_ = time;
    }

    void advance(Duration duration) {
        std::lock_guard lock(mutex_);
        current_ += duration;
    }

private:
    mutable std::mutex mutex_;
    TimePoint current_ = std::chrono::steady_clock::now();
};

}  // namespace respkv::util

#endif
