// tests/unit/test_l3_routing_table.cpp
#include <gtest/gtest.h>
#include "../../src/core/l3/routing_table.hpp"
#include "../../src/core/l3/arp_cache.hpp"
#include "../../src/core/packet/packet_builder.hpp"

using namespace NetSim::Common;
using namespace NetSim::Core::L3;
using namespace NetSim::Core::Packet;

class RoutingTableTest : public ::testing::Test
{
protected:
    RoutingTable table;

    Route connected(const std::string &net, int prefix, const std::string &iface)
    {
        Route route;
        route.network = IPv4Address::fromString(net);
        route.mask = SubnetMask::fromPrefixLength(prefix);
        route.interface_name = iface;
        route.source = RouteSource::CONNECTED;
        return route;
    }

    Route via(const std::string &net, int prefix, const std::string &nh, const std::string &iface,
              RouteSource source, uint32_t metric = 0)
    {
        Route route;
        route.network = IPv4Address::fromString(net);
        route.mask = SubnetMask::fromPrefixLength(prefix);
        route.next_hop = IPv4Address::fromString(nh);
        route.interface_name = iface;
        route.source = source;
        route.metric = metric;
        return route;
    }
};

// ==================== Lookup tests ====================
TEST_F(RoutingTableTest, EmptyTableNoRoute)
{
    EXPECT_FALSE(table.lookup(IPv4Address(8, 8, 8, 8)).has_value());
}

TEST_F(RoutingTableTest, LongestPrefixWins)
{
    table.addRoute(via("0.0.0.0", 0, "10.0.12.2", "Gi0/1", RouteSource::STATIC));
    table.addRoute(via("10.0.0.0", 8, "10.0.13.3", "Gi0/2", RouteSource::STATIC));
    table.addRoute(via("10.0.2.0", 24, "10.0.12.2", "Gi0/1", RouteSource::OSPF, 20));

    EXPECT_EQ(table.lookup(IPv4Address(10, 0, 2, 5))->network, IPv4Address(10, 0, 2, 0));
    EXPECT_EQ(table.lookup(IPv4Address(10, 9, 9, 9))->interface_name, "Gi0/2");
    EXPECT_EQ(table.lookup(IPv4Address(8, 8, 8, 8))->mask.prefixLength(), 0);
}

TEST_F(RoutingTableTest, MetricBreaksPrefixTie)
{
    table.addRoute(via("10.0.2.0", 24, "10.0.12.2", "Gi0/1", RouteSource::OSPF, 30));
    table.addRoute(via("10.0.2.0", 24, "10.0.13.3", "Gi0/2", RouteSource::OSPF, 20));

    EXPECT_EQ(table.lookup(IPv4Address(10, 0, 2, 1))->interface_name, "Gi0/2");
}

TEST_F(RoutingTableTest, SourceBreaksMetricTie)
{
    table.addRoute(via("10.0.2.0", 24, "10.0.12.2", "Gi0/1", RouteSource::OSPF, 0));
    table.addRoute(via("10.0.2.0", 24, "10.0.13.3", "Gi0/2", RouteSource::STATIC, 0));

    EXPECT_EQ(table.lookup(IPv4Address(10, 0, 2, 1))->source, RouteSource::STATIC);
}

TEST_F(RoutingTableTest, ConnectedRouteHasNoNextHop)
{
    table.addRoute(connected("10.0.1.0", 24, "Gi0/0"));
    auto route = table.lookup(IPv4Address(10, 0, 1, 99));
    ASSERT_TRUE(route.has_value());
    EXPECT_FALSE(route->next_hop.has_value());
    EXPECT_EQ(route->toString(), "C 10.0.1.0/24 is directly connected, Gi0/0");
}

// ==================== Mutation tests ====================
TEST_F(RoutingTableTest, NetworkNormalizedAndDuplicatesIgnored)
{
    EXPECT_TRUE(table.addRoute(connected("10.0.1.77", 24, "Gi0/0")));
    EXPECT_FALSE(table.addRoute(connected("10.0.1.0", 24, "Gi0/0")));
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.getRoutes()[0].network, IPv4Address(10, 0, 1, 0));
}

TEST_F(RoutingTableTest, RemoveRouteBySource)
{
    table.addRoute(via("10.0.2.0", 24, "10.0.12.2", "Gi0/1", RouteSource::STATIC));
    table.addRoute(via("10.0.2.0", 24, "10.0.12.2", "Gi0/1", RouteSource::OSPF, 20));

    EXPECT_TRUE(table.removeRoute(IPv4Address(10, 0, 2, 0), SubnetMask::fromPrefixLength(24), RouteSource::STATIC));
    EXPECT_FALSE(table.removeRoute(IPv4Address(10, 0, 2, 0), SubnetMask::fromPrefixLength(24), RouteSource::STATIC));
    EXPECT_EQ(table.lookup(IPv4Address(10, 0, 2, 1))->source, RouteSource::OSPF);
}

TEST_F(RoutingTableTest, RemoveRoutesVia)
{
    table.addRoute(connected("10.0.1.0", 24, "Gi0/0"));
    table.addRoute(via("10.0.2.0", 24, "10.0.1.2", "Gi0/0", RouteSource::STATIC));
    table.addRoute(via("10.0.3.0", 24, "10.0.1.2", "Gi0/0", RouteSource::STATIC));

    EXPECT_EQ(table.removeRoutesVia("Gi0/0", RouteSource::STATIC), 2u);
    EXPECT_EQ(table.size(), 1u);
}

TEST_F(RoutingTableTest, ReplaceRoutesFromSource)
{
    table.addRoute(connected("10.0.12.0", 30, "Gi0/1"));
    table.addRoute(via("10.0.2.0", 24, "10.0.12.2", "Gi0/1", RouteSource::OSPF, 20));

    table.replaceRoutesFromSource(RouteSource::OSPF,
                                  {via("10.0.3.0", 24, "10.0.12.2", "Gi0/1", RouteSource::STATIC, 30)});

    auto ospf = table.getRoutes(RouteSource::OSPF);
    ASSERT_EQ(ospf.size(), 1u);
    EXPECT_EQ(ospf[0].network, IPv4Address(10, 0, 3, 0));
    EXPECT_FALSE(table.lookup(IPv4Address(10, 0, 2, 1)).has_value());
    EXPECT_EQ(table.getRoutes(RouteSource::CONNECTED).size(), 1u);
}

TEST_F(RoutingTableTest, RouteFormatting)
{
    Route route = via("10.0.2.0", 24, "10.0.12.2", "Gi0/1", RouteSource::OSPF, 20);
    EXPECT_EQ(route.toString(), "O 10.0.2.0/24 [110/20] via 10.0.12.2, Gi0/1");
    EXPECT_EQ(administrativeDistance(RouteSource::STATIC), 1);
    EXPECT_EQ(routeSourceToString(RouteSource::CONNECTED), "connected");
}

// ==================== ARP cache tests ====================
class ArpCacheTest : public ::testing::Test
{
protected:
    ArpCache cache{14400000};
    IPv4Address hop{10, 0, 1, 2};

    IPv4Packet packet(uint16_t id)
    {
        return PacketBuilder::createIPv4Packet(IPv4Address(10, 0, 1, 1), IPv4Address(10, 0, 9, 9), IpProtocol::UDP,
                                               64, PacketBuilder::createUdpDatagram(1, 2), 0, id);
    }
};

TEST_F(ArpCacheTest, InsertAndExpire)
{
    cache.insert(hop, MacAddress::generate(9), "Gi0/0", 0);

    EXPECT_EQ(cache.lookup(hop, 1000), MacAddress::generate(9));
    EXPECT_FALSE(cache.lookup(hop, 14400000).has_value());
    EXPECT_FALSE(cache.lookup(IPv4Address(10, 0, 1, 3), 0).has_value());
}

TEST_F(ArpCacheTest, FirstPendingTriggersRequest)
{
    EXPECT_TRUE(cache.enqueue(hop, "Gi0/0", packet(1)));
    EXPECT_FALSE(cache.enqueue(hop, "Gi0/0", packet(2)));
    EXPECT_EQ(cache.pendingCount(), 2u);

    auto pending = cache.takePending(hop);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].packet.header().identification, 1);
    EXPECT_EQ(cache.pendingCount(), 0u);
    EXPECT_TRUE(cache.takePending(hop).empty());
}

TEST_F(ArpCacheTest, QueueDropsOldestWhenFull)
{
    for (uint16_t i = 0; i < ArpCache::MAX_PENDING_PER_HOP + 2; ++i)
        cache.enqueue(hop, "Gi0/0", packet(i));

    auto pending = cache.takePending(hop);
    ASSERT_EQ(pending.size(), ArpCache::MAX_PENDING_PER_HOP);
    EXPECT_EQ(pending.front().packet.header().identification, 2);
}

TEST_F(ArpCacheTest, RemoveInterfaceDropsEntriesAndPending)
{
    cache.insert(hop, MacAddress::generate(9), "Gi0/0", 0);
    cache.insert(IPv4Address(10, 0, 12, 2), MacAddress::generate(10), "Gi0/1", 0);
    cache.enqueue(IPv4Address(10, 0, 1, 5), "Gi0/0", packet(1));

    EXPECT_EQ(cache.removeInterface("Gi0/0"), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.pendingCount(), 0u);
}
