#include <gtest/gtest.h>
#include <stdexcept>
#include "journal.h"
#include "replay_cache.h"

using namespace txguard;

namespace {

Verdict verdict(const std::string& user, const std::string& txn, Action action) {
    Verdict v;
    v.user_id = user;
    v.transaction_id = txn;
    v.action = action;
    v.reason = "test";
    return v;
}

}

TEST(ReplayCache, FirstClaimOwnsLaterClaimsWait) {
    ReplayCache cache(10);
    auto first = cache.claim("u1", "t1");
    ASSERT_TRUE(first.owner);

    auto second = cache.claim("u1", "t1");
    EXPECT_FALSE(second.owner);

    cache.publish(first, verdict("u1", "t1", Action::Flag));
    EXPECT_EQ(second.verdict.get().action, Action::Flag);

    auto third = cache.claim("u1", "t1");
    EXPECT_FALSE(third.owner);
    EXPECT_EQ(third.verdict.get().transaction_id, "t1");
}

TEST(ReplayCache, KeysAreScopedPerUser) {
    ReplayCache cache(10);
    EXPECT_TRUE(cache.claim("u1", "t1").owner);
    EXPECT_TRUE(cache.claim("u2", "t1").owner);
    // Concatenation alone would make these collide.
    EXPECT_TRUE(cache.claim("ab", "c").owner);
    EXPECT_TRUE(cache.claim("a", "bc").owner);
}

TEST(ReplayCache, AbandonLetsRetryRecompute) {
    ReplayCache cache(10);
    auto first = cache.claim("u1", "t1");
    auto waiter = cache.claim("u1", "t1");
    cache.abandon(first, std::make_exception_ptr(std::runtime_error("boom")));

    EXPECT_THROW(waiter.verdict.get(), std::runtime_error);
    EXPECT_FALSE(cache.contains("u1", "t1"));
    EXPECT_TRUE(cache.claim("u1", "t1").owner);
}

TEST(ReplayCache, EvictsOldestPastCapacity) {
    ReplayCache cache(2);
    for (const char* id : {"t1", "t2", "t3"}) {
        auto c = cache.claim("u1", id);
        cache.publish(c, verdict("u1", id, Action::Allow));
    }
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.contains("u1", "t1"));
    EXPECT_TRUE(cache.contains("u1", "t2"));
    EXPECT_TRUE(cache.contains("u1", "t3"));
}

TEST(DecisionJournal, NewestFirstAndBounded) {
    DecisionJournal journal(3);
    for (const char* id : {"t1", "t2", "t3", "t4"}) journal.record(verdict("u1", id, Action::Allow));

    EXPECT_EQ(journal.size(), 3u);
    const auto recent = journal.recent(10);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].transaction_id, "t4");
    EXPECT_EQ(recent[2].transaction_id, "t2");
    EXPECT_EQ(journal.recent(1).size(), 1u);
}
