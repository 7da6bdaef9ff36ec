#include <gtest/gtest.h>

#include "respkv/core/store.hpp"
#include "respkv/util/clock.hpp"
#include "respkv/util/types.hpp"

namespace respkv::core::test {

using util::Duration;
using util::MockClock;

class TTLTest : public ::testing::Test {
   protected:
    void SetUp() override {
        clock_ = std::make_shared<MockClock>();
        StoreOptions opts;
        opts.clock = clock_;
        store_ = std::make_unique<Store>(opts);
    }
    std::shared_ptr<MockClock> clock_;
    std::unique_ptr<Store> store_;
};

TEST_F(TTLTest, KeyExpiresAfterTTL) {
    store_->set("key1", "value1", Duration(1000));

    auto result = store_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value1");

    clock_->advance(Duration(500));
    result = store_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value1");

    clock_->advance(Duration(600));
    result = store_->get("key1");
    EXPECT_FALSE(result.has_value());
}

TEST_F(TTLTest, ExpiresExactlyAtDeadline) {
    store_->set("key1", "value1", Duration(1000));

    clock_->advance(Duration(999));
    EXPECT_TRUE(store_->contains("key1"));

    clock_->advance(Duration(1));
    EXPECT_FALSE(store_->contains("key1"));
}

TEST_F(TTLTest, ContainsReturnsFalseForExpired) {
    store_->set("key1", "value1", Duration(1000));

    EXPECT_TRUE(store_->contains("key1"));

    clock_->advance(Duration(1001));

    EXPECT_FALSE(store_->contains("key1"));
}

TEST_F(TTLTest, KeyWithoutTTLNeverExpires) {
    store_->set("key1", "value1");

    clock_->advance(Duration(1000000));

    auto result = store_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value1");
}

TEST_F(TTLTest, SetOverwritesTTL) {
    store_->set("key1", "value1", Duration(1000));

    clock_->advance(Duration(500));

    store_->set("key1", "value2", Duration(2000));

    clock_->advance(Duration(1500));

    auto result = store_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value2");
}

TEST_F(TTLTest, SetWithoutTTLRemovesTTL) {
    store_->set("key1", "value1", Duration(1000));

    clock_->advance(Duration(500));

    store_->set("key1", "value2");

    clock_->advance(Duration(1000));

    auto result = store_->get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value2");
}

TEST_F(TTLTest, KeepTtlKeepsDeadline) {
    store_->set("key1", "value1", Duration(1000));
    clock_->advance(Duration(400));

    SetOptions keep;
    keep.keep_ttl = true;
    EXPECT_TRUE(store_->set("key1", "value2", keep));
    EXPECT_EQ(store_->ttl("key1"), 600);

    clock_->advance(Duration(600));
    EXPECT_FALSE(store_->get("key1").has_value());
}

TEST_F(TTLTest, ExpiredKeyCountsAsAbsentForConditionalSet) {
    store_->set("key1", "old", Duration(100));
    clock_->advance(Duration(100));

    SetOptions xx;
    xx.condition = SetCondition::IfExists;
    EXPECT_FALSE(store_->set("key1", "new", xx));

    SetOptions nx;
    nx.condition = SetCondition::IfAbsent;
    EXPECT_TRUE(store_->set("key1", "new", nx));
    EXPECT_EQ(store_->ttl("key1"), kTtlPersistent);
}

TEST_F(TTLTest, ExpireAndTtl) {
    store_->set("key1", "value1");
    EXPECT_TRUE(store_->expire("key1", Duration(5000)));
    EXPECT_EQ(store_->ttl("key1"), 5000);

    clock_->advance(Duration(1250));
    EXPECT_EQ(store_->ttl("key1"), 3750);

    EXPECT_FALSE(store_->expire("missing", Duration(5000)));
}

TEST_F(TTLTest, NonPositiveExpireDeletes) {
    store_->set("key1", "value1");
    EXPECT_TRUE(store_->expire("key1", Duration(0)));
    EXPECT_FALSE(store_->contains("key1"));

    store_->set("key2", "value2");
    EXPECT_TRUE(store_->expire("key2", Duration(-10)));
    EXPECT_FALSE(store_->contains("key2"));
}

TEST_F(TTLTest, PersistRemovesExpiry) {
    store_->set("key1", "value1", Duration(1000));
    EXPECT_TRUE(store_->persist("key1"));
    EXPECT_EQ(store_->ttl("key1"), kTtlPersistent);

    clock_->advance(Duration(5000));
    EXPECT_TRUE(store_->contains("key1"));
}

TEST_F(TTLTest, TtlOfExpiredKeyIsMissing) {
    store_->set("key1", "value1", Duration(10));
    clock_->advance(Duration(10));
    EXPECT_EQ(store_->ttl("key1"), kTtlMissing);
}

TEST_F(TTLTest, KeysSkipsExpired) {
    store_->set("a", "1", Duration(100));
    store_->set("b", "2");

    clock_->advance(Duration(200));
    EXPECT_EQ(store_->keys("*"), (std::vector<std::string>{"b"}));
}

TEST_F(TTLTest, ReadEvictsExpiredEntry) {
    store_->set("key1", "value1", Duration(100));
    EXPECT_EQ(store_->size(), 1u);

    clock_->advance(Duration(100));
    // not observed yet, still stored
    EXPECT_EQ(store_->size(), 1u);

    EXPECT_FALSE(store_->get("key1").has_value());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(TTLTest, CleanupExpiredRemovesExpiredKeys) {
    store_->set("key1", "value1", Duration(1000));
    store_->set("key2", "value2", Duration(2000));
    store_->set("key3", "value3");

    clock_->advance(Duration(1500));

    EXPECT_EQ(store_->cleanup_expired(), 1u);
    EXPECT_EQ(store_->size(), 2u);

    EXPECT_FALSE(store_->contains("key1"));
    EXPECT_TRUE(store_->contains("key2"));
    EXPECT_TRUE(store_->contains("key3"));
}

TEST_F(TTLTest, MultipleTTLs) {
    store_->set("key1", "value1", Duration(100));
    store_->set("key2", "value2", Duration(200));
    store_->set("key3", "value3", Duration(300));

    clock_->advance(Duration(150));
    EXPECT_FALSE(store_->contains("key1"));
    EXPECT_TRUE(store_->contains("key2"));
    EXPECT_TRUE(store_->contains("key3"));

    clock_->advance(Duration(100));
    EXPECT_FALSE(store_->contains("key2"));
    EXPECT_TRUE(store_->contains("key3"));

    clock_->advance(Duration(100));
    EXPECT_FALSE(store_->contains("key3"));
}

TEST_F(TTLTest, HugeTTLSaturatesInsteadOfExpiring) {
    store_->set("plain", "v", Duration::max());
    EXPECT_TRUE(store_->set("opts", "v", SetOptions{Duration::max()}));
    store_->set("later", "v");
    EXPECT_TRUE(store_->expire("later", Duration::max()));

    clock_->advance(kMaxTtl);
    for (const char* key : {"plain", "opts", "later"}) {
        EXPECT_TRUE(store_->get(key).has_value()) << key;
        EXPECT_GT(store_->ttl(key), 0) << key;
    }
}

TEST_F(TTLTest, MaxTTLIsExact) {
    store_->set("key1", "value1", kMaxTtl);
    EXPECT_EQ(store_->ttl("key1"), kMaxTtl.count());

    clock_->advance(kMaxTtl - Duration(1));
    EXPECT_TRUE(store_->contains("key1"));
    clock_->advance(Duration(1));
    EXPECT_FALSE(store_->contains("key1"));
}

}  // namespace respkv::core::test
