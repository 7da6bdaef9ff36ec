#ifndef RESPKV_CORE_STORE_HPP
#define RESPKV_CORE_STORE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "respkv/core/istore.hpp"
#include "respkv/util/clock.hpp"
#include "respkv/util/types.hpp"

namespace respkv::core {

struct StoreOptions {
    std::shared_ptr<util::Clock> clock = std::make_shared<util::SystemClock>();
};

/*
    in-memory store shared by every connection.
    expiry is lazy: an expired entry is invisible to every read and is erased by the first
    operation that touches its key. cleanup_expired() erases the ones nobody touches.
*/
class Store : public IStore {
   public:
    Store();
    explicit Store(const StoreOptions& options);
    ~Store() override;

    // holds a mutex internally, cannot be copied. moves are cheap because of PIMPL
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) noexcept;
    Store& operator=(Store&&) noexcept;

    void set(std::string_view key, std::string_view value) override;
    void set(std::string_view key, std::string_view value, util::Duration ttl) override;
    bool set(std::string_view key, std::string_view value, const SetOptions& options) override;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) override;
    [[nodiscard]] bool remove(std::string_view key) override;
    [[nodiscard]] bool contains(std::string_view key) override;

    bool expire(std::string_view key, util::Duration ttl) override;
    bool persist(std::string_view key) override;
    [[nodiscard]] int64_t ttl(std::string_view key) override;

    [[nodiscard]] std::vector<std::string> keys(std::string_view pattern) override;

    [[nodiscard]] std::size_t size() const override;
    [[nodiscard]] bool empty() const override;

    void clear() override;
    std::size_t cleanup_expired() override;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace respkv::core

#endif
