#include "proxyrot/session/StickySessionTable.hpp"
#include "proxyrot/util/Clock.hpp"

#include <gtest/gtest.h>

namespace proxyrot::session {
namespace {

using namespace std::chrono_literals;

class StickySessionTableTest : public ::testing::Test {
protected:
    util::ManualClock clock;
    StickySessionTable table{clock};
};

TEST(StickySessionNormalizeTest, StripsSchemePortPathAndCase) {
    EXPECT_EQ(StickySessionTable::normalizeDomain("https://User@WWW.Example.com:8443/a/b?q=1"), "www.example.com");
    EXPECT_EQ(StickySessionTable::normalizeDomain("Example.COM"), "example.com");
    EXPECT_EQ(StickySessionTable::normalizeDomain("example.com."), "example.com");
}

TEST(StickySessionNormalizeTest, WildcardMatchesSubdomainsAndApex) {
    EXPECT_TRUE(StickySessionTable::matchesWildcard("api.example.com", "*.example.com"));
    EXPECT_TRUE(StickySessionTable::matchesWildcard("example.com", "*.example.com"));
    EXPECT_FALSE(StickySessionTable::matchesWildcard("badexample.com", "*.example.com"));
    EXPECT_TRUE(StickySessionTable::matchesWildcard("example.com", "example.com"));
}

TEST_F(StickySessionTableTest, UpsertThenGetWithinTtl) {
    table.upsert("https://Example.com/login", "cfg", "p1", 60s);
    auto entry = table.get("example.com", "cfg");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->proxyId, "p1");
    EXPECT_EQ(entry->domain, "example.com");
    EXPECT_FALSE(entry->wildcard);

    EXPECT_FALSE(table.get("example.com", "other-config"));
}

TEST_F(StickySessionTableTest, ExpiredEntryIsAbsentButPeekable) {
    table.upsert("example.com", "cfg", "p1", 60s);
    clock.advance(60s);
    EXPECT_FALSE(table.get("example.com", "cfg"));
    auto stale = table.peek("example.com", "cfg");
    ASSERT_TRUE(stale);
    EXPECT_EQ(stale->proxyId, "p1");
}

TEST_F(StickySessionTableTest, ExactMatchBeatsWildcardAndLongestWildcardWins) {
    table.upsert("*.example.com", "cfg", "wide", 60s);
    table.upsert("*.api.example.com", "cfg", "narrow", 60s);
    table.upsert("v2.api.example.com", "cfg", "exact", 60s);

    EXPECT_EQ(table.get("v2.api.example.com", "cfg")->proxyId, "exact");
    EXPECT_EQ(table.get("v1.api.example.com", "cfg")->proxyId, "narrow");
    EXPECT_EQ(table.get("www.example.com", "cfg")->proxyId, "wide");
    EXPECT_TRUE(table.get("v1.api.example.com", "cfg")->wildcard);
}

TEST_F(StickySessionTableTest, TouchCountsAndRefreshesTtl) {
    table.upsert("example.com", "cfg", "p1", 60s);
    clock.advance(50s);
    EXPECT_TRUE(table.touch("example.com", "cfg", 60s));
    EXPECT_TRUE(table.touch("example.com", "cfg"));
    clock.advance(50s);

    auto entry = table.get("example.com", "cfg");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->requestCount, 2u);
    EXPECT_FALSE(table.touch("missing.com", "cfg"));
}

TEST_F(StickySessionTableTest, RebindingRestartsRequestCount) {
    table.upsert("example.com", "cfg", "p1", 60s);
    table.touch("example.com", "cfg");
    table.upsert("example.com", "cfg", "p1", 60s);
    EXPECT_EQ(table.get("example.com", "cfg")->requestCount, 1u);

    table.upsert("example.com", "cfg", "p2", 60s);
    EXPECT_EQ(table.get("example.com", "cfg")->requestCount, 0u);
}

TEST_F(StickySessionTableTest, InvalidateByProxyRemovesEveryBinding) {
    table.upsert("a.com", "cfg", "p1", 60s);
    table.upsert("b.com", "cfg", "p1", 60s);
    table.upsert("c.com", "cfg", "p2", 60s);

    EXPECT_EQ(table.invalidateByProxy("p1"), 2u);
    EXPECT_FALSE(table.get("a.com", "cfg"));
    EXPECT_TRUE(table.get("c.com", "cfg"));
    EXPECT_TRUE(table.invalidate("c.com", "cfg"));
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(StickySessionTableTest, PurgeExpiredKeepsLiveEntries) {
    table.upsert("short.com", "cfg", "p1", 10s);
    table.upsert("long.com", "cfg", "p2", 100s);
    clock.advance(20s);

    EXPECT_EQ(table.purgeExpired(), 1u);
    auto remaining = table.entries();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining.front().domain, "long.com");
    table.clear();
    EXPECT_EQ(table.size(), 0u);
}

} // namespace
} // namespace proxyrot::session
