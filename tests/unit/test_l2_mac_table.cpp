// tests/unit/test_l2_mac_table.cpp
#include <gtest/gtest.h>
#include "../../src/core/l2/mac_table.hpp"

using namespace NetSim::Common;
using namespace NetSim::Core::L2;

class MacTableTest : public ::testing::Test
{
protected:
    MacTable table{300000, 4};
    MacAddress a = MacAddress::generate(1);
    MacAddress b = MacAddress::generate(2);
};

// ==================== Learning tests ====================
TEST_F(MacTableTest, LearnAndLookup)
{
    EXPECT_TRUE(table.learn(a, "Fa0/1", 1, 0));

    auto entry = table.lookup(a, 1, 1000);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->port, "Fa0/1");
    EXPECT_EQ(entry->vlan, 1);
    EXPECT_EQ(table.getStatistics().learned, 1u);
    EXPECT_EQ(table.getStatistics().hits, 1u);
}

TEST_F(MacTableTest, OnlyUnicastLearned)
{
    EXPECT_FALSE(table.learn(MacAddress::broadcast(), "Fa0/1", 1, 0));
    EXPECT_FALSE(table.learn(MacAddress::fromString("01:00:5e:00:00:05"), "Fa0/1", 1, 0));
    EXPECT_FALSE(table.learn(MacAddress(), "Fa0/1", 1, 0));
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(MacTableTest, StationMoveUpdatesPort)
{
    table.learn(a, "Fa0/1", 1, 0);
    table.learn(a, "Fa0/3", 1, 10);

    EXPECT_EQ(table.lookup(a, 1, 20)->port, "Fa0/3");
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.getStatistics().moved, 1u);
}

TEST_F(MacTableTest, UnknownIsMiss)
{
    EXPECT_FALSE(table.lookup(b, 1, 0).has_value());
    EXPECT_EQ(table.getStatistics().misses, 1u);
}

// ==================== VLAN tests ====================
// Sub-interface router dùng chung một MAC trên nhiều VLAN
TEST_F(MacTableTest, SameMacKeptPerVlan)
{
    table.learn(a, "Fa0/1", 10, 0);
    table.learn(a, "Gi0/1", 20, 5);

    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(table.getStatistics().moved, 0u);
    EXPECT_EQ(table.lookup(a, 10, 10)->port, "Fa0/1");
    EXPECT_EQ(table.lookup(a, 20, 10)->port, "Gi0/1");
}

TEST_F(MacTableTest, LookupInOtherVlanMisses)
{
    table.learn(a, "Fa0/1", 10, 0);

    EXPECT_FALSE(table.lookup(a, 20, 10).has_value());
    EXPECT_TRUE(table.lookup(a, 10, 10).has_value());
}

// ==================== Aging tests ====================
TEST_F(MacTableTest, EntryExpiresAtAgingTime)
{
    table.learn(a, "Fa0/1", 1, 0);

    EXPECT_TRUE(table.lookup(a, 1, 299999).has_value());
    EXPECT_FALSE(table.lookup(a, 1, 300000).has_value());
    EXPECT_EQ(table.size(), 0u);
    EXPECT_EQ(table.getStatistics().aged, 1u);
}

TEST_F(MacTableTest, RefreshExtendsLifetime)
{
    table.learn(a, "Fa0/1", 1, 0);
    table.learn(a, "Fa0/1", 1, 200000);
    EXPECT_TRUE(table.lookup(a, 1, 400000).has_value());
}

TEST_F(MacTableTest, AgeOutRemovesStale)
{
    table.learn(a, "Fa0/1", 1, 0);
    table.learn(b, "Fa0/2", 1, 100000);

    EXPECT_EQ(table.ageOut(350000), 1u);
    EXPECT_EQ(table.size(), 1u);
    EXPECT_FALSE(table.lookup(a, 1, 350000).has_value());
}

TEST_F(MacTableTest, ZeroAgingNeverExpires)
{
    MacTable forever(0, 0);
    forever.learn(a, "Fa0/1", 1, 0);
    EXPECT_TRUE(forever.lookup(a, 1, 1000000000).has_value());
}

TEST_F(MacTableTest, ShorterAgingAppliesToLearnedEntries)
{
    table.learn(a, "Fa0/1", 1, 0);
    table.setAgingTime(1000);

    EXPECT_EQ(table.getAgingTime(), 1000u);
    EXPECT_FALSE(table.lookup(a, 1, 1000).has_value());
}

// ==================== Capacity tests ====================
TEST_F(MacTableTest, FullTableEvictsOldest)
{
    for (uint32_t i = 1; i <= 4; ++i)
        table.learn(MacAddress::generate(i), "Fa0/1", 1, i);

    table.learn(MacAddress::generate(5), "Fa0/2", 1, 10);

    EXPECT_EQ(table.size(), 4u);
    EXPECT_FALSE(table.lookup(MacAddress::generate(1), 1, 10).has_value());
    EXPECT_TRUE(table.lookup(MacAddress::generate(5), 1, 10).has_value());
    EXPECT_EQ(table.getStatistics().evicted, 1u);
}

// ==================== Removal tests ====================
TEST_F(MacTableTest, RemovePortPurgesEntries)
{
    table.learn(a, "Fa0/1", 1, 0);
    table.learn(b, "Fa0/1", 2, 0);
    table.learn(MacAddress::generate(3), "Fa0/2", 1, 0);

    EXPECT_EQ(table.removePort("Fa0/1"), 2u);
    EXPECT_EQ(table.size(), 1u);
    EXPECT_TRUE(table.lookup(MacAddress::generate(3), 1, 0).has_value());
}

TEST_F(MacTableTest, EntriesSortedByMacThenVlan)
{
    table.learn(b, "Fa0/2", 1, 0);
    table.learn(a, "Gi0/1", 20, 0);
    table.learn(a, "Fa0/1", 10, 0);

    auto entries = table.getEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].mac, a);
    EXPECT_EQ(entries[0].vlan, 10);
    EXPECT_EQ(entries[1].vlan, 20);
    EXPECT_EQ(entries[2].mac, b);
}
