// tests/integration/test_ospf_convergence.cpp
#include <gtest/gtest.h>
#include "../../src/core/l3/router.hpp"
#include "../../src/core/l3/host.hpp"
#include "../../src/core/sim/simulation_context.hpp"
#include "../../src/core/ospf/ospf_engine.hpp"

using namespace NetSim::Common;
using namespace NetSim::Core;
using namespace NetSim::Core::L3;
using namespace NetSim::Core::Packet;

// H1 --- R1 ==10.0.12.0/24 (broadcast)== R2 ==10.0.23.0/30 (p2p)== R3 --- H3
class OspfConvergenceTest : public ::testing::Test
{
protected:
    Sim::SimulationContext ctx;
    Router *r1 = nullptr;
    Router *r2 = nullptr;
    Router *r3 = nullptr;
    Host *h1 = nullptr;
    Host *h3 = nullptr;

    IPv4Address h1_ip{10, 0, 1, 10};
    IPv4Address h3_ip{10, 0, 3, 10};
    SubnetMask mask24 = SubnetMask::fromPrefixLength(24);
    SubnetMask mask30 = SubnetMask::fromPrefixLength(30);

    void SetUp() override
    {
        r1 = ctx.createDevice<Router>("R1", 2);
        r2 = ctx.createDevice<Router>("R2", 2);
        r3 = ctx.createDevice<Router>("R3", 2);
        h1 = ctx.createDevice<Host>("H1");
        h3 = ctx.createDevice<Host>("H3");
        ASSERT_TRUE(r1 && r2 && r3 && h1 && h3);

        ASSERT_TRUE(r1->configureInterface("Gi0/0", IPv4Address(10, 0, 1, 1), mask24));
        ASSERT_TRUE(r1->configureInterface("Gi0/1", IPv4Address(10, 0, 12, 1), mask24));
        ASSERT_TRUE(r2->configureInterface("Gi0/0", IPv4Address(10, 0, 12, 2), mask24));
        ASSERT_TRUE(r2->configureInterface("Gi0/1", IPv4Address(10, 0, 23, 1), mask30));
        ASSERT_TRUE(r3->configureInterface("Gi0/0", IPv4Address(10, 0, 23, 2), mask30));
        ASSERT_TRUE(r3->configureInterface("Gi0/1", IPv4Address(10, 0, 3, 1), mask24));
        ASSERT_TRUE(h1->configure(h1_ip, mask24, IPv4Address(10, 0, 1, 1)));
        ASSERT_TRUE(h3->configure(h3_ip, mask24, IPv4Address(10, 0, 3, 1)));

        ASSERT_TRUE(ctx.connect("H1", "eth0", "R1", "Gi0/0"));
        ASSERT_TRUE(ctx.connect("R1", "Gi0/1", "R2", "Gi0/0"));
        ASSERT_TRUE(ctx.connect("R2", "Gi0/1", "R3", "Gi0/0"));
        ASSERT_TRUE(ctx.connect("R3", "Gi0/1", "H3", "eth0"));

        Ospf::InterfaceOptions p2p;
        p2p.network_type = Ospf::NetworkType::POINT_TO_POINT;
        ASSERT_TRUE(r2->setOspfInterfaceOptions("Gi0/1", p2p));
        ASSERT_TRUE(r3->setOspfInterfaceOptions("Gi0/0", p2p));

        enable(r1, IPv4Address(1, 1, 1, 1));
        enable(r2, IPv4Address(2, 2, 2, 2));
        enable(r3, IPv4Address(3, 3, 3, 3));
    }

    void enable(Router *router, const IPv4Address &router_id)
    {
        router->enableOspf(router_id);
        ASSERT_TRUE(router->ospfNetwork(IPv4Address(10, 0, 0, 0), WildcardMask::fromString("0.255.255.255"),
                                        IPv4Address::any()));
    }

    void converge()
    {
        ctx.advanceTime(120000);
    }

    const Ospf::OspfNeighbor *neighbor(Router *router, const std::string &iface, const IPv4Address &rid)
    {
        return router->ospf()->getNeighbor(iface, rid);
    }
};

// ==================== Convergence tests ====================
TEST_F(OspfConvergenceTest, AdjacenciesReachFull)
{
    converge();

    ASSERT_NE(neighbor(r1, "Gi0/1", IPv4Address(2, 2, 2, 2)), nullptr);
    EXPECT_EQ(neighbor(r1, "Gi0/1", IPv4Address(2, 2, 2, 2))->state, Ospf::NeighborState::FULL);
    ASSERT_NE(neighbor(r2, "Gi0/1", IPv4Address(3, 3, 3, 3)), nullptr);
    EXPECT_EQ(neighbor(r2, "Gi0/1", IPv4Address(3, 3, 3, 3))->state, Ospf::NeighborState::FULL);
    ASSERT_NE(neighbor(r3, "Gi0/0", IPv4Address(2, 2, 2, 2)), nullptr);
    EXPECT_EQ(neighbor(r3, "Gi0/0", IPv4Address(2, 2, 2, 2))->state, Ospf::NeighborState::FULL);
}

TEST_F(OspfConvergenceTest, HighestRouterIdIsDrOnBroadcastSegment)
{
    converge();

    const Ospf::OspfInterface *r1_iface = r1->ospf()->getInterface("Gi0/1");
    const Ospf::OspfInterface *r2_iface = r2->ospf()->getInterface("Gi0/0");
    ASSERT_NE(r1_iface, nullptr);
    ASSERT_NE(r2_iface, nullptr);

    EXPECT_EQ(r2_iface->state, Ospf::InterfaceState::DR);
    EXPECT_EQ(r1_iface->state, Ospf::InterfaceState::BACKUP);
    EXPECT_EQ(r1_iface->designated_router, IPv4Address(10, 0, 12, 2));
    EXPECT_EQ(r1_iface->backup_designated_router, IPv4Address(10, 0, 12, 1));

    // DR quảng bá Network-LSA cho segment
    LsaKey key{LsaType::NETWORK, IPv4Address(10, 0, 12, 2), IPv4Address(2, 2, 2, 2)};
    EXPECT_TRUE(r1->ospf()->getLsdb()->contains(key));
}

TEST_F(OspfConvergenceTest, LsdbsSynchronized)
{
    converge();

    // 3 Router-LSA + 1 Network-LSA
    EXPECT_EQ(r1->ospf()->getLsdb()->size(), 4u);
    EXPECT_EQ(r2->ospf()->getLsdb()->size(), 4u);
    EXPECT_EQ(r3->ospf()->getLsdb()->size(), 4u);
}

TEST_F(OspfConvergenceTest, RoutesInstalledWithCumulativeCost)
{
    converge();

    auto remote = r1->getRoutingTable().lookup(h3_ip);
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->source, RouteSource::OSPF);
    EXPECT_EQ(remote->network, IPv4Address(10, 0, 3, 0));
    EXPECT_EQ(remote->metric, 30u);
    EXPECT_EQ(remote->next_hop, IPv4Address(10, 0, 12, 2));
    EXPECT_EQ(remote->interface_name, "Gi0/1");

    auto back = r3->getRoutingTable().lookup(h1_ip);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->source, RouteSource::OSPF);
    EXPECT_EQ(back->metric, 30u);
    EXPECT_EQ(back->next_hop, IPv4Address(10, 0, 23, 1));
}

TEST_F(OspfConvergenceTest, HostsReachEachOtherOverOspfRoutes)
{
    EXPECT_FALSE(r1->getRoutingTable().lookup(h3_ip).has_value());
    converge();

    ASSERT_TRUE(h1->ping(h3_ip));
    EXPECT_EQ(h3->getStatistics().echo_replies_sent, 1u);
    ASSERT_FALSE(h1->getReceivedPackets().empty());
    const IPv4Packet &reply = h1->getReceivedPackets().back();
    EXPECT_EQ(reply.source(), h3_ip);
    EXPECT_EQ(reply.ttl(), 61);
}

// ==================== Reconvergence tests ====================
TEST_F(OspfConvergenceTest, LinkFailureWithdrawsRoutes)
{
    converge();
    ASSERT_TRUE(r1->getRoutingTable().lookup(h3_ip).has_value());

    ASSERT_TRUE(r3->shutdownInterface("Gi0/0"));
    ctx.advanceTime(50000);

    EXPECT_EQ(r2->ospf()->getNeighbor("Gi0/1", IPv4Address(3, 3, 3, 3)), nullptr);
    EXPECT_FALSE(r1->getRoutingTable().lookup(h3_ip).has_value());

    // R2 vẫn còn link 10.0.23.0/30 của chính nó
    auto transit = r1->getRoutingTable().lookup(IPv4Address(10, 0, 23, 1));
    ASSERT_TRUE(transit.has_value());
    EXPECT_EQ(transit->metric, 20u);
}

TEST_F(OspfConvergenceTest, LinkRestoreRelearnsRoutes)
{
    converge();
    ASSERT_TRUE(r3->shutdownInterface("Gi0/0"));
    ctx.advanceTime(50000);
    ASSERT_FALSE(r1->getRoutingTable().lookup(h3_ip).has_value());

    ASSERT_TRUE(r3->noShutdownInterface("Gi0/0"));
    ctx.advanceTime(60000);

    EXPECT_TRUE(r1->getRoutingTable().lookup(h3_ip).has_value());
    ASSERT_TRUE(h1->ping(h3_ip));
    EXPECT_EQ(h3->getStatistics().echo_replies_sent, 1u);
}

TEST_F(OspfConvergenceTest, CostChangeAltersMetric)
{
    converge();

    Ospf::InterfaceOptions expensive;
    expensive.cost = 100;
    ASSERT_TRUE(r1->setOspfInterfaceOptions("Gi0/1", expensive));
    ctx.advanceTime(120000);

    auto remote = r1->getRoutingTable().lookup(h3_ip);
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->metric, 120u);
}

TEST_F(OspfConvergenceTest, DisableOspfRemovesLearnedRoutes)
{
    converge();
    ASSERT_FALSE(r1->getRoutingTable().getRoutes(RouteSource::OSPF).empty());

    r1->disableOspf();
    EXPECT_EQ(r1->ospf(), nullptr);
    EXPECT_TRUE(r1->getRoutingTable().getRoutes(RouteSource::OSPF).empty());
    EXPECT_EQ(r1->getRoutingTable().getRoutes(RouteSource::CONNECTED).size(), 2u);
}
