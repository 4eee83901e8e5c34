#include <gtest/gtest.h>

#include "access_guard/consent/consent_store.hpp"
#include "../support/TestConfig.hpp"

using namespace access_guard;
using namespace access_guard::tests;
using common::ConsentType;

class ConsentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(businessHours());
    }

    std::string grant(const std::string& user, ConsentType type,
                      std::optional<common::Timestamp> expires_at = std::nullopt) {
        return store_.recordConsent(user, type, true, "203.0.113.9", "browser", expires_at);
    }

    common::ManualClock clock_;
    consent::ConsentStore store_{clock_};
};

TEST_F(ConsentStoreTest, NoRecord_NoConsent) {
    EXPECT_FALSE(store_.hasConsent("u1", ConsentType::MARKETING));
}

TEST_F(ConsentStoreTest, Grant_IsPerUserAndType) {
    grant("u1", ConsentType::MARKETING);

    EXPECT_TRUE(store_.hasConsent("u1", ConsentType::MARKETING));
    EXPECT_FALSE(store_.hasConsent("u1", ConsentType::THIRD_PARTY));
    EXPECT_FALSE(store_.hasConsent("u2", ConsentType::MARKETING));
}

TEST_F(ConsentStoreTest, LatestRecordDecides) {
    grant("u1", ConsentType::DATA_SHARING);
    clock_.advance(std::chrono::minutes(1));
    store_.recordConsent("u1", ConsentType::DATA_SHARING, false, "203.0.113.9", "browser");

    EXPECT_FALSE(store_.hasConsent("u1", ConsentType::DATA_SHARING));
    EXPECT_EQ(store_.size(), 2u);
    EXPECT_EQ(store_.activeCount(), 0u);
}

TEST_F(ConsentStoreTest, ExpiredGrant_CountsAsNoConsent) {
    grant("u1", ConsentType::THIRD_PARTY, clock_.now() + std::chrono::hours(1));
    EXPECT_TRUE(store_.hasConsent("u1", ConsentType::THIRD_PARTY));

    clock_.advance(std::chrono::hours(1));
    EXPECT_FALSE(store_.hasConsent("u1", ConsentType::THIRD_PARTY));
}

TEST_F(ConsentStoreTest, RecordConsent_StampsRecord) {
    std::string id = grant("u1", ConsentType::AUTOMATED_DECISIONS);

    auto records = store_.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].consent_id, id);
    EXPECT_EQ(records[0].granted_at, clock_.now());
    EXPECT_EQ(records[0].version, "1.0");
    EXPECT_EQ(records[0].ip_address, "203.0.113.9");
}

TEST_F(ConsentStoreTest, ActiveCount_CountsLatestEffectivePairs) {
    grant("u1", ConsentType::MARKETING);
    grant("u1", ConsentType::MARKETING);
    grant("u2", ConsentType::MARKETING);
    grant("u3", ConsentType::MARKETING, clock_.now() - std::chrono::seconds(1));

    EXPECT_EQ(store_.activeCount(), 2u);
}
