#include <gtest/gtest.h>
#include "common/crypto.hpp"
#include "common/nonce_store.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace agentrelay;

class NonceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        now_ = NonceStore::Clock::time_point{} + std::chrono::hours(1);
    }

    NonceStore::TimeSource fake_clock() {
        return [this] { return now_; };
    }

    NonceStore::Clock::time_point now_;
};

TEST_F(NonceStoreTest, IssuedNonceIsHex) {
    NonceStore store;
    auto nonce = store.issue();

    EXPECT_EQ(nonce.size(), NonceStore::kNonceBytes * 2);
    EXPECT_EQ(nonce.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(NonceStoreTest, NoncesAreUnique) {
    NonceStore store;
    EXPECT_NE(store.issue(), store.issue());
    EXPECT_EQ(store.size(), 2u);
}

TEST_F(NonceStoreTest, ConsumeSucceedsExactlyOnce) {
    NonceStore store;
    auto nonce = store.issue();

    EXPECT_TRUE(store.consume(nonce));
    EXPECT_FALSE(store.consume(nonce));
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(NonceStoreTest, UnknownNonceRejected) {
    NonceStore store;
    store.issue();

    EXPECT_FALSE(store.consume("deadbeef"));
    EXPECT_FALSE(store.consume(""));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(NonceStoreTest, ExpiredNonceRejectedAndRemoved) {
    NonceStore store(std::chrono::seconds(300), fake_clock());
    auto nonce = store.issue();

    now_ += std::chrono::seconds(301);
    EXPECT_FALSE(store.consume(nonce));
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(NonceStoreTest, NonceValidJustBeforeExpiry) {
    NonceStore store(std::chrono::seconds(300), fake_clock());
    auto nonce = store.issue();

    now_ += std::chrono::seconds(299);
    EXPECT_TRUE(store.consume(nonce));
}

TEST_F(NonceStoreTest, SweepRemovesOnlyExpired) {
    NonceStore store(std::chrono::seconds(60), fake_clock());
    auto old_nonce = store.issue();

    now_ += std::chrono::seconds(45);
    auto fresh_nonce = store.issue();

    now_ += std::chrono::seconds(30);
    EXPECT_EQ(store.sweep_expired(), 1u);
    EXPECT_EQ(store.size(), 1u);

    EXPECT_FALSE(store.consume(old_nonce));
    EXPECT_TRUE(store.consume(fresh_nonce));
}

TEST_F(NonceStoreTest, ConcurrentConsumeHasOneWinner) {
    NonceStore store;

    for (int round = 0; round < 20; ++round) {
        auto nonce = store.issue();
        std::atomic<int> winners{0};
        std::atomic<bool> go{false};

        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                if (store.consume(nonce)) {
                    winners.fetch_add(1);
                }
            });
        }

        go.store(true);
        for (auto& t : threads) {
            t.join();
        }

        EXPECT_EQ(winners.load(), 1) << "round " << round;
    }
    EXPECT_EQ(store.size(), 0u);
}
