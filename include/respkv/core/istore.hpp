#ifndef RESPKV_CORE_ISTORE_HPP
#define RESPKV_CORE_ISTORE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "respkv/util/types.hpp"

namespace respkv::core {

enum class SetCondition : uint8_t {
    Always = 0,
    IfAbsent = 1,  // NX
    IfExists = 2,  // XX
};

struct SetOptions {
    std::optional<util::Duration> ttl = std::nullopt;
    SetCondition condition = SetCondition::Always;
    bool keep_ttl = false;  // ignored when ttl is set
};

// returned by ttl() for keys that do not exist / exist without expiry
inline constexpr int64_t kTtlMissing = -2;
inline constexpr int64_t kTtlPersistent = -1;

// longest accepted expiry, 100 years. deadlines are steady_clock nanoseconds,
// so this keeps now() + ttl well inside int64
inline constexpr util::Duration kMaxTtl{100LL * 365 * 24 * 60 * 60 * 1000};

class IStore {
   public:
    virtual ~IStore() = default;

    virtual void set(std::string_view key, std::string_view value) = 0;
    virtual void set(std::string_view key, std::string_view value, util::Duration ttl) = 0;
    // returns false when the condition in options prevented the write
    virtual bool set(std::string_view key, std::string_view value, const SetOptions& options) = 0;

    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) = 0;
    [[nodiscard]] virtual bool remove(std::string_view key) = 0;
    [[nodiscard]] virtual bool contains(std::string_view key) = 0;

    // ttl <= 0 removes the key. returns false if the key does not exist
    virtual bool expire(std::string_view key, util::Duration ttl) = 0;
    // returns true if an expiry was removed
    virtual bool persist(std::string_view key) = 0;
    // remaining milliseconds, kTtlPersistent or kTtlMissing
    [[nodiscard]] virtual int64_t ttl(std::string_view key) = 0;

    // live keys matching a glob pattern (*, ?, [...], \x)
    [[nodiscard]] virtual std::vector<std::string> keys(std::string_view pattern) = 0;

    [[nodiscard]] virtual std::size_t size() const = 0;
    [[nodiscard]] virtual bool empty() const = 0;

    virtual void clear() = 0;
    // erases every expired entry, returns how many were removed
    virtual std::size_t cleanup_expired() = 0;
};

}  // namespace respkv::core

#endif
