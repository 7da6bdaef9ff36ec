#include "respkv/core/store.hpp"

#include <fnmatch.h>

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace respkv::core {

namespace {

/*
    fnmatch stops at the first NUL, so keys or patterns holding one are
    compared byte for byte instead. a bare "*" still matches every key
*/
bool glob_matches(const std::string& glob, const std::string& key) {
    bool has_nul = glob.find('\0') != std::string::npos || key.find('\0') != std::string::npos;
    if (has_nul) {
        return glob == "*" || glob == key;
    }
    return fnmatch(glob.c_str(), key.c_str(), 0) == 0;
}

}  // namespace

struct Entry {
    std::string value;
    std::optional<util::TimePoint> expires_at = std::nullopt;
};

class Store::Impl {
   public:
    Impl() : clock_(std::make_shared<util::SystemClock>()) {}

    explicit Impl(const StoreOptions& options) : clock_(options.clock) {
        if (!clock_) {
            clock_ = std::make_shared<util::SystemClock>();
        }
    }

    void set(std::string_view key, std::string_view value) {
        std::unique_lock lock(mutex_);
        data_[std::string(key)] = Entry{std::string(value), std::nullopt};
    }

    void set(std::string_view key, std::string_view value, util::Duration ttl) {
        std::unique_lock lock(mutex_);
        data_[std::string(key)] = Entry{std::string(value), deadline(ttl)};
    }

    bool set(std::string_view key, std::string_view value, const SetOptions& options) {
        std::unique_lock lock(mutex_);
        auto it = find_live(key);
        bool exists = it != data_.end();

        if ((options.condition == SetCondition::IfAbsent && exists) ||
            (options.condition == SetCondition::IfExists && !exists)) {
            return false;
        }

        std::optional<util::TimePoint> expires_at = std::nullopt;
        if (options.ttl.has_value()) {
            expires_at = deadline(options.ttl.value());
        } else if (options.keep_ttl && exists) {
            expires_at = it->second.expires_at;
        }

        if (exists) {
            it->second = Entry{std::string(value), expires_at};
        } else {
            data_[std::string(key)] = Entry{std::string(value), expires_at};
        }
        return true;
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) {
        // exclusive lock: a read may erase an expired entry
        std::unique_lock lock(mutex_);
        auto it = find_live(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    [[nodiscard]] bool remove(std::string_view key) {
        std::unique_lock lock(mutex_);
        auto it = find_live(key);
        if (it == data_.end()) {
            return false;
        }
        data_.erase(it);
        return true;
    }

    [[nodiscard]] bool contains(std::string_view key) {
        std::unique_lock lock(mutex_);
        return find_live(key) != data_.end();
    }

    bool expire(std::string_view key, util::Duration ttl) {
        std::unique_lock lock(mutex_);
        auto it = find_live(key);
        if (it == data_.end()) {
            return false;
        }
        if (ttl.count() <= 0) {
            data_.erase(it);
        } else {
            it->second.expires_at = deadline(ttl);
        }
        return true;
    }

    bool persist(std::string_view key) {
        std::unique_lock lock(mutex_);
        auto it = find_live(key);
        if (it == data_.end() || !it->second.expires_at.has_value()) {
            return false;
        }
        it->second.expires_at = std::nullopt;
        return true;
    }

    [[nodiscard]] int64_t ttl(std::string_view key) {
        std::unique_lock lock(mutex_);
        auto it = find_live(key);
        if (it == data_.end()) {
            return kTtlMissing;
        }
        if (!it->second.expires_at.has_value()) {
            return kTtlPersistent;
        }
        auto remaining = std::chrono::duration_cast<util::Duration>(
            it->second.expires_at.value() - clock_->now());
        return remaining.count();
    }

    [[nodiscard]] std::vector<std::string> keys(std::string_view pattern) {
        std::string glob(pattern);
        std::vector<std::string> result;

        std::shared_lock lock(mutex_);
        for (const auto& [key, entry] : data_) {
            if (is_expired(entry)) {
                continue;
            }
            if (glob_matches(glob, key)) {
                result.push_back(key);
            }
        }
        return result;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::shared_lock lock(mutex_);
        return data_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        std::shared_lock lock(mutex_);
        return data_.empty();
    }

    void clear() noexcept {
        std::unique_lock lock(mutex_);
        data_.clear();
    }

    std::size_t cleanup_expired() {
        std::unique_lock lock(mutex_);
        auto now = clock_->now();
        std::size_t removed = 0;
        for (auto it = data_.begin(); it != data_.end();) {
            if (it->second.expires_at.has_value() && it->second.expires_at.value() <= now) {
                it = data_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

   private:
    using Map = std::unordered_map<std::string, Entry>;

    // saturates instead of overflowing the nanosecond time_point
    [[nodiscard]] util::TimePoint deadline(util::Duration ttl) const {
        auto now = clock_->now();
        if (ttl.count() <= 0) {
            return now;
        }
        auto headroom = std::chrono::duration_cast<util::Duration>(util::TimePoint::max() - now);
        if (ttl >= headroom) {
            return util::TimePoint::max();
        }
        return now + ttl;
    }

    [[nodiscard]] bool is_expired(const Entry& entry) const {
        if (!entry.expires_at.has_value()) {
            return false;
        }
        return clock_->now() >= entry.expires_at.value();
    }

    // caller holds the exclusive lock. erases the entry if it has expired
    Map::iterator find_live(std::string_view key) {
        auto it = data_.find(std::string(key));
        if (it == data_.end()) {
            return it;
        }
        if (is_expired(it->second)) {
            data_.erase(it);
            return data_.end();
        }
        return it;
    }

    std::shared_ptr<util::Clock> clock_;
    mutable std::shared_mutex mutex_;
    Map data_;
};

Store::Store() : impl_(std::make_unique<Impl>()) {}

Store::Store(const StoreOptions& options) : impl_(std::make_unique<Impl>(options)) {}

Store::~Store() = default;

Store::Store(Store&&) noexcept = default;

Store& Store::operator=(Store&&) noexcept = default;

void Store::set(std::string_view key, std::string_view value) {
    impl_->set(key, value);
}

void Store::set(std::string_view key, std::string_view value, util::Duration ttl) {
    impl_->set(key, value, ttl);
}

bool Store::set(std::string_view key, std::string_view value, const SetOptions& options) {
    return impl_->set(key, value, options);
}

std::optional<std::string> Store::get(std::string_view key) {
    return impl_->get(key);
}

bool Store::remove(std::string_view key) {
    return impl_->remove(key);
}

bool Store::contains(std::string_view key) {
    return impl_->contains(key);
}

bool Store::expire(std::string_view key, util::Duration ttl) {
    return impl_->expire(key, ttl);
}

bool Store::persist(std::string_view key) {
    return impl_->persist(key);
}

int64_t Store::ttl(std::string_view key) {
    return impl_->ttl(key);
}

std::vector<std::string> Store::keys(std::string_view pattern) {
    return impl_->keys(pattern);
}

std::size_t Store::size() const {
    return impl_->size();
}

bool Store::empty() const {
    return impl_->empty();
}

void Store::clear() {
    impl_->clear();
}

std::size_t Store::cleanup_expired() {
    return impl_->cleanup_expired();
}

}  // namespace respkv::core
