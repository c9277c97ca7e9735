#include <gtest/gtest.h>
#include "storage/memory_store.h"

namespace kvindex {

namespace {
std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}
} // namespace

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* k : {"a:1", "a:2", "a:3", "ab:1", "b:1"}) {
            ASSERT_TRUE(store_.write(k, bytes(k)).ok);
        }
    }

    std::vector<std::string> keysOf(const std::vector<KVRecord>& recs) {
        std::vector<std::string> keys;
        for (const auto& r : recs) keys.push_back(r.key);
        return keys;
    }

    MemoryStore store_;
};

TEST_F(MemoryStoreTest, ExactRead) {
    auto [st, recs] = store_.read("a:2");
    ASSERT_TRUE(st.ok);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].value, bytes("a:2"));

    // exakter Lookup ist kein Prefix-Scan
    auto [st2, none] = store_.read("a:");
    ASSERT_TRUE(st2.ok);
    EXPECT_TRUE(none.empty());
}

TEST_F(MemoryStoreTest, PrefixScanIsOrdered) {
    auto [st, recs] = store_.scanPrefix("a:");
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(keysOf(recs), (std::vector<std::string>{"a:1", "a:2", "a:3"}));

    auto [st2, all] = store_.scanPrefix("a");
    ASSERT_TRUE(st2.ok);
    EXPECT_EQ(all.size(), 4u);
}

TEST_F(MemoryStoreTest, OffsetAndLimit) {
    auto [st, recs] = store_.scanPrefix("a:", 1, 1);
    ASSERT_TRUE(st.ok);
    EXPECT_EQ(keysOf(recs), (std::vector<std::string>{"a:2"}));

    auto [st2, tail] = store_.scanPrefix("a:", 2, 0);
    ASSERT_TRUE(st2.ok);
    EXPECT_EQ(keysOf(tail), (std::vector<std::string>{"a:3"}));

    auto [st3, past] = store_.scanPrefix("a:", 10, 0);
    ASSERT_TRUE(st3.ok);
    EXPECT_TRUE(past.empty());
}

TEST_F(MemoryStoreTest, OverwriteAndDelete) {
    ASSERT_TRUE(store_.write("a:1", bytes("new")).ok);
    auto [st, recs] = store_.read("a:1");
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].value, bytes("new"));

    EXPECT_TRUE(store_.del("a:1").ok);
    EXPECT_TRUE(store_.del("does-not-exist").ok);
    EXPECT_EQ(store_.size(), 4u);
}

TEST_F(MemoryStoreTest, EmptyKeyIsRejected) {
    auto st = store_.write("", bytes("x"));
    EXPECT_FALSE(st.ok);
    EXPECT_EQ(st.code, ErrorCode::StoreError);
}

TEST_F(MemoryStoreTest, Clear) {
    store_.clear();
    EXPECT_EQ(store_.size(), 0u);
    auto [st, recs] = store_.scanPrefix("");
    ASSERT_TRUE(st.ok);
    EXPECT_TRUE(recs.empty());
}

} // namespace kvindex
