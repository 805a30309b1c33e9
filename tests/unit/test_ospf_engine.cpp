// tests/unit/test_ospf_engine.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/core/ospf/ospf_engine.hpp"
#include <algorithm>

using namespace NetSim::Common;
using namespace NetSim::Core;
using namespace NetSim::Core::Ospf;
using namespace NetSim::Core::Packet;
using namespace testing;

namespace
{

struct SentPacket
{
    std::string interface_name;
    IPv4Address destination;
    OspfPacket packet;
};

InterfaceOptions pointToPoint()
{
    InterfaceOptions options;
    options.network_type = NetworkType::POINT_TO_POINT;
    return options;
}

bool logContains(const std::vector<std::string> &log, const std::string &needle, size_t from, size_t *found)
{
    for (size_t i = from; i < log.size(); ++i)
    {
        if (log[i].find(needle) != std::string::npos)
        {
            *found = i;
            return true;
        }
    }
    return false;
}

} // namespace

// Engine 1.1.1.1 một mình; packet của neighbor 2.2.2.2 được đưa vào bằng tay
class OspfEngineTest : public ::testing::Test
{
protected:
    Sim::VirtualClock clock;
    Sim::TimerScheduler scheduler{clock};
    std::unique_ptr<OspfEngine> engine;
    std::vector<SentPacket> sent;

    IPv4Address rid{1, 1, 1, 1};
    IPv4Address peer_rid{2, 2, 2, 2};
    IPv4Address own_ip{10, 0, 12, 1};
    IPv4Address peer_ip{10, 0, 12, 2};
    SubnetMask mask30 = SubnetMask::fromPrefixLength(30);

    void SetUp() override
    {
        engine = std::make_unique<OspfEngine>(scheduler, rid);
        engine->setSendCallback([this](const std::string &iface, const IPv4Address &dst, const OspfPacket &packet)
        {
            sent.push_back({iface, dst, packet});
        });
    }

    void TearDown() override
    {
        engine.reset();
    }

    void activateP2p()
    {
        ASSERT_TRUE(engine->activateInterface("Gi0/0", own_ip, mask30, IPv4Address::any(), pointToPoint()));
    }

    OspfPacket fromPeer(OspfBody body)
    {
        OspfPacket packet;
        packet.router_id = peer_rid;
        packet.area_id = IPv4Address::any();
        packet.body = std::move(body);
        return packet;
    }

    OspfHello peerHello(bool list_us)
    {
        OspfHello hello;
        hello.network_mask = mask30;
        if (list_us)
            hello.neighbors.push_back(rid);
        return hello;
    }

    OspfDatabaseDescription dd(uint8_t flags, uint32_t seq)
    {
        OspfDatabaseDescription d;
        d.flags = flags;
        d.sequence_number = seq;
        return d;
    }

    void deliver(const OspfBody &body)
    {
        engine->processPacket("Gi0/0", peer_ip, fromPeer(body));
    }

    const OspfNeighbor *peer()
    {
        return engine->getNeighbor("Gi0/0", peer_rid);
    }

    size_t countSent(OspfPacketType type)
    {
        size_t n = 0;
        for (const auto &s : sent)
            if (s.packet.type() == type)
                ++n;
        return n;
    }

    const OspfDatabaseDescription *lastDD()
    {
        for (auto it = sent.rbegin(); it != sent.rend(); ++it)
            if (const auto *d = it->packet.as<OspfDatabaseDescription>())
                return d;
        return nullptr;
    }

    // Neighbor 2.2.2.2 là master (router ID cao hơn)
    void bringToExchange()
    {
        activateP2p();
        deliver(peerHello(true));
        ASSERT_EQ(peer()->state, NeighborState::EX_START);
        deliver(dd(DDFlags::INIT | DDFlags::MORE | DDFlags::MASTER, 100));
        ASSERT_EQ(peer()->state, NeighborState::EXCHANGE);
    }

    void bringToFull()
    {
        bringToExchange();
        deliver(dd(DDFlags::MASTER, 101));
        ASSERT_EQ(peer()->state, NeighborState::FULL);
    }

    Lsa peerRouterLsa()
    {
        Lsa lsa;
        lsa.header.ls_type = LsaType::ROUTER;
        lsa.header.link_state_id = peer_rid;
        lsa.header.advertising_router = peer_rid;
        lsa.header.sequence_number = OspfConstants::INITIAL_SEQUENCE_NUMBER;
        RouterLsaBody body;
        body.links.push_back({rid, peer_ip, RouterLinkType::POINT_TO_POINT, 10});
        body.links.push_back({IPv4Address(10, 0, 12, 0), IPv4Address(255, 255, 255, 252), RouterLinkType::STUB, 10});
        body.links.push_back({IPv4Address(10, 0, 2, 0), IPv4Address(255, 255, 255, 0), RouterLinkType::STUB, 10});
        lsa.body = body;
        return finalizeLsa(lsa);
    }
};

// ==================== Configuration tests ====================
TEST_F(OspfEngineTest, NetworkStatementMatching)
{
    engine->addNetwork(IPv4Address(10, 0, 0, 0), WildcardMask::fromString("0.0.255.255"), IPv4Address::any());
    engine->addNetwork(IPv4Address(0, 0, 0, 0), WildcardMask::any(), IPv4Address(0, 0, 0, 1));

    EXPECT_EQ(engine->matchNetwork(IPv4Address(10, 0, 12, 1)), IPv4Address::any());
    EXPECT_EQ(engine->matchNetwork(IPv4Address(192, 168, 1, 1)), IPv4Address(0, 0, 0, 1));
    EXPECT_EQ(engine->getNetworks().size(), 2u);
}

TEST_F(OspfEngineTest, ActivationSendsHelloAndOriginatesRouterLsa)
{
    activateP2p();

    ASSERT_EQ(countSent(OspfPacketType::HELLO), 1u);
    EXPECT_EQ(sent[0].destination, IPv4Address(224, 0, 0, 5));
    EXPECT_EQ(engine->getInterface("Gi0/0")->state, InterfaceState::POINT_TO_POINT);

    const LinkStateDatabase *lsdb = engine->getLsdb();
    ASSERT_NE(lsdb, nullptr);
    auto own = lsdb->lookup(LsaKey{LsaType::ROUTER, rid, rid}, clock.nowMs());
    ASSERT_TRUE(own.has_value());
    EXPECT_EQ(own->header.sequence_number, OspfConstants::INITIAL_SEQUENCE_NUMBER);
    EXPECT_TRUE(verifyLsaChecksum(*own));
}

TEST_F(OspfEngineTest, ActivationRejectsDuplicatesAndZeroTimers)
{
    activateP2p();
    EXPECT_FALSE(engine->activateInterface("Gi0/0", own_ip, mask30, IPv4Address::any()));

    InterfaceOptions bad;
    bad.hello_interval = 0;
    EXPECT_FALSE(engine->activateInterface("Gi0/1", IPv4Address(10, 0, 1, 1), SubnetMask::fromPrefixLength(24),
                                           IPv4Address::any(), bad));
}

TEST_F(OspfEngineTest, HellosRepeatEveryInterval)
{
    activateP2p();
    scheduler.advance(30000);
    EXPECT_EQ(countSent(OspfPacketType::HELLO), 4u);
    EXPECT_EQ(engine->getStatistics().hellos_sent, 4u);
}

// ==================== Hello tests ====================
TEST_F(OspfEngineTest, OneWayHelloCreatesInitNeighbor)
{
    activateP2p();
    deliver(peerHello(false));

    ASSERT_NE(peer(), nullptr);
    EXPECT_EQ(peer()->state, NeighborState::INIT);
    EXPECT_EQ(peer()->ip_address, peer_ip);

    // Hello trả lời ngay khi phát hiện neighbor mới, có liệt kê neighbor
    const OspfHello *reply = sent.back().packet.as<OspfHello>();
    ASSERT_NE(reply, nullptr);
    EXPECT_THAT(reply->neighbors, ElementsAre(peer_rid));
}

TEST_F(OspfEngineTest, MismatchedHelloIgnored)
{
    activateP2p();

    OspfHello hello = peerHello(true);
    hello.hello_interval = 5;
    deliver(hello);
    EXPECT_EQ(peer(), nullptr);

    OspfPacket other_area = fromPeer(peerHello(true));
    other_area.area_id = IPv4Address(0, 0, 0, 1);
    engine->processPacket("Gi0/0", peer_ip, other_area);
    EXPECT_EQ(peer(), nullptr);
    EXPECT_EQ(engine->getStatistics().hello_mismatches, 2u);
}

TEST_F(OspfEngineTest, OwnRouterIdIgnored)
{
    activateP2p();
    OspfPacket echo = fromPeer(peerHello(true));
    echo.router_id = rid;
    engine->processPacket("Gi0/0", peer_ip, echo);
    EXPECT_TRUE(engine->getInterface("Gi0/0")->neighbors.empty());
}

TEST_F(OspfEngineTest, MaskNotCheckedOnPointToPoint)
{
    activateP2p();
    OspfHello hello = peerHello(true);
    hello.network_mask = SubnetMask::fromPrefixLength(24);
    deliver(hello);
    ASSERT_NE(peer(), nullptr);
}

// ==================== Adjacency tests ====================
TEST_F(OspfEngineTest, TwoWayHelloStartsExStart)
{
    activateP2p();
    deliver(peerHello(true));

    ASSERT_EQ(peer()->state, NeighborState::EX_START);
    const OspfDatabaseDescription *first = lastDD();
    ASSERT_NE(first, nullptr);
    EXPECT_TRUE(first->hasFlag(DDFlags::INIT));
    EXPECT_TRUE(first->hasFlag(DDFlags::MORE));
    EXPECT_TRUE(first->hasFlag(DDFlags::MASTER));
    EXPECT_TRUE(first->lsa_headers.empty());
}

TEST_F(OspfEngineTest, ExStartRetransmitsEveryInterval)
{
    activateP2p();
    deliver(peerHello(true));
    ASSERT_EQ(countSent(OspfPacketType::DATABASE_DESCRIPTION), 1u);

    scheduler.advance(4999);
    EXPECT_EQ(countSent(OspfPacketType::DATABASE_DESCRIPTION), 1u);
    scheduler.advance(1);
    EXPECT_EQ(countSent(OspfPacketType::DATABASE_DESCRIPTION), 2u);
    scheduler.advance(5000);
    EXPECT_EQ(countSent(OspfPacketType::DATABASE_DESCRIPTION), 3u);
    EXPECT_EQ(engine->getStatistics().retransmissions, 2u);
}

TEST_F(OspfEngineTest, LowerRouterIdBecomesSlave)
{
    bringToExchange();

    EXPECT_FALSE(peer()->is_master);
    const OspfDatabaseDescription *reply = lastDD();
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(reply->flags, 0);
    EXPECT_EQ(reply->sequence_number, 100u);
    ASSERT_EQ(reply->lsa_headers.size(), 1u);
    EXPECT_EQ(reply->lsa_headers[0].advertising_router, rid);
}

TEST_F(OspfEngineTest, ExchangeCompletesToFull)
{
    bringToFull();

    const auto &log = engine->getEventLog();
    size_t at = 0;
    EXPECT_TRUE(logContains(log, "Down -> Init", 0, &at));
    EXPECT_TRUE(logContains(log, "Init -> ExStart", at, &at));
    EXPECT_TRUE(logContains(log, "ExStart -> Exchange", at, &at));
    EXPECT_TRUE(logContains(log, "-> Full", at, &at));
    EXPECT_THAT(log.back(), HasSubstr("OSPF: Neighbor 2.2.2.2 (Gi0/0)"));
}

TEST_F(OspfEngineTest, EventLogCanBeCleared)
{
    bringToFull();
    ASSERT_FALSE(engine->getEventLog().empty());

    engine->clearEventLog();
    EXPECT_TRUE(engine->getEventLog().empty());
}

TEST_F(OspfEngineTest, NoDdRetransmitAfterFull)
{
    bringToFull();
    size_t before = countSent(OspfPacketType::DATABASE_DESCRIPTION);

    scheduler.advance(20000);
    EXPECT_EQ(countSent(OspfPacketType::DATABASE_DESCRIPTION), before);
}

TEST_F(OspfEngineTest, FullAdjacencyAdvertisedInRouterLsa)
{
    bringToFull();

    auto own = engine->getLsdb()->lookup(LsaKey{LsaType::ROUTER, rid, rid}, clock.nowMs());
    ASSERT_TRUE(own.has_value());
    EXPECT_GT(own->header.sequence_number, OspfConstants::INITIAL_SEQUENCE_NUMBER);

    const auto &links = std::get<RouterLsaBody>(own->body).links;
    auto p2p = std::find_if(links.begin(), links.end(), [](const RouterLink &link)
    {
        return link.type == RouterLinkType::POINT_TO_POINT;
    });
    ASSERT_NE(p2p, links.end());
    EXPECT_EQ(p2p->link_id, peer_rid);
    EXPECT_EQ(p2p->link_data, own_ip);

    // LSA mới được flood tới neighbor
    EXPECT_GE(countSent(OspfPacketType::LINK_STATE_UPDATE), 1u);
}

TEST_F(OspfEngineTest, DuplicateDdRepeatsLastReply)
{
    bringToFull();
    size_t before = countSent(OspfPacketType::DATABASE_DESCRIPTION);

    deliver(dd(DDFlags::MASTER, 101));
    EXPECT_EQ(peer()->state, NeighborState::FULL);
    EXPECT_EQ(countSent(OspfPacketType::DATABASE_DESCRIPTION), before + 1);
    EXPECT_EQ(lastDD()->sequence_number, 101u);
}

// ==================== Error event tests ====================
TEST_F(OspfEngineTest, WrongSequenceRestartsExStart)
{
    bringToExchange();

    deliver(dd(DDFlags::MASTER, 150));

    EXPECT_EQ(peer()->state, NeighborState::EX_START);
    EXPECT_THAT(engine->getEventLog().back(), HasSubstr("Exchange -> ExStart (SeqNumberMismatch)"));
    const OspfDatabaseDescription *restart = lastDD();
    ASSERT_NE(restart, nullptr);
    EXPECT_TRUE(restart->hasFlag(DDFlags::INIT));
    EXPECT_EQ(restart->sequence_number, 101u);
}

TEST_F(OspfEngineTest, MasterFlagMismatchRestartsExStart)
{
    bringToExchange();

    // Master không bao giờ gửi DD thiếu bit MS
    deliver(dd(0, 101));
    EXPECT_EQ(peer()->state, NeighborState::EX_START);
}

TEST_F(OspfEngineTest, UnknownLsaRequestIsBadLsReq)
{
    bringToFull();

    OspfLinkStateRequest request;
    request.requests.push_back(LsaKey{LsaType::ROUTER, IPv4Address(9, 9, 9, 9), IPv4Address(9, 9, 9, 9)});
    deliver(request);

    EXPECT_EQ(peer()->state, NeighborState::EX_START);
    EXPECT_THAT(engine->getEventLog().back(), HasSubstr("Full -> ExStart (BadLSReq)"));
}

TEST_F(OspfEngineTest, KnownLsaRequestAnswered)
{
    bringToFull();
    size_t before = countSent(OspfPacketType::LINK_STATE_UPDATE);

    OspfLinkStateRequest request;
    request.requests.push_back(LsaKey{LsaType::ROUTER, rid, rid});
    deliver(request);

    EXPECT_EQ(peer()->state, NeighborState::FULL);
    ASSERT_EQ(countSent(OspfPacketType::LINK_STATE_UPDATE), before + 1);
    const OspfLinkStateUpdate *update = sent.back().packet.as<OspfLinkStateUpdate>();
    ASSERT_NE(update, nullptr);
    ASSERT_EQ(update->lsas.size(), 1u);
    EXPECT_EQ(update->lsas[0].header.advertising_router, rid);
    EXPECT_GE(update->lsas[0].header.ls_age, 1);
}

// ==================== Flooding / SPF tests ====================
TEST_F(OspfEngineTest, UpdateInstalledAcknowledgedAndRouted)
{
    std::vector<L3::Route> installed;
    engine->setRouteCallback([&](const std::vector<L3::Route> &routes) { installed = routes; });
    bringToFull();

    OspfLinkStateUpdate update;
    update.lsas.push_back(peerRouterLsa());
    deliver(update);

    EXPECT_TRUE(engine->getLsdb()->contains(LsaKey{LsaType::ROUTER, peer_rid, peer_rid}));
    EXPECT_EQ(countSent(OspfPacketType::LINK_STATE_ACK), 1u);

    ASSERT_EQ(installed.size(), 1u);
    EXPECT_EQ(installed[0].network, IPv4Address(10, 0, 2, 0));
    EXPECT_EQ(installed[0].metric, 20u);
    EXPECT_EQ(installed[0].next_hop, peer_ip);
    EXPECT_EQ(installed[0].interface_name, "Gi0/0");
    EXPECT_EQ(engine->getRoutes().size(), 1u);
}

TEST_F(OspfEngineTest, CorruptLsaDropped)
{
    bringToFull();

    Lsa lsa = peerRouterLsa();
    lsa.header.checksum ^= 0x5555;
    OspfLinkStateUpdate update;
    update.lsas.push_back(lsa);
    deliver(update);

    EXPECT_EQ(engine->getStatistics().bad_lsa_checksums, 1u);
    EXPECT_FALSE(engine->getLsdb()->contains(lsa.header.key()));
}

TEST_F(OspfEngineTest, UnackedFloodRetransmitted)
{
    bringToFull();
    const auto *nbr = peer();
    ASSERT_FALSE(nbr->retransmission_list.empty());
    uint64_t before = engine->getStatistics().retransmissions;

    scheduler.advance(5000);
    EXPECT_GT(engine->getStatistics().retransmissions, before);

    OspfLinkStateAck ack;
    for (const auto &pair : peer()->retransmission_list)
        ack.lsa_headers.push_back(pair.second.header);
    deliver(ack);
    EXPECT_TRUE(peer()->retransmission_list.empty());
}

// ==================== Sequence wrap tests ====================
TEST_F(OspfEngineTest, SequenceWrapFlushesBeforeRestart)
{
    bringToFull();
    const LsaKey own_key{LsaType::ROUTER, rid, rid};

    // Instance cũ của chính mình trong domain đã dùng hết sequence number
    auto own = engine->getLsdb()->lookup(own_key, clock.nowMs());
    ASSERT_TRUE(own.has_value());
    Lsa stale = *own;
    stale.header.sequence_number = OspfConstants::MAX_SEQUENCE_NUMBER;
    stale.header.ls_age = 1;
    OspfLinkStateUpdate update;
    update.lsas.push_back(finalizeLsa(stale));
    deliver(update);

    auto flushed = engine->getLsdb()->lookupHeader(own_key, clock.nowMs());
    ASSERT_TRUE(flushed.has_value());
    EXPECT_EQ(flushed->sequence_number, OspfConstants::MAX_SEQUENCE_NUMBER);
    EXPECT_EQ(flushed->ls_age, OspfConstants::MAX_AGE);
    ASSERT_EQ(peer()->retransmission_list.count(own_key), 1u);

    OspfLinkStateAck ack;
    ack.lsa_headers.push_back(peer()->retransmission_list.at(own_key).header);
    deliver(ack);

    auto restarted = engine->getLsdb()->lookupHeader(own_key, clock.nowMs());
    ASSERT_TRUE(restarted.has_value());
    EXPECT_EQ(restarted->sequence_number, OspfConstants::INITIAL_SEQUENCE_NUMBER);
    EXPECT_LT(restarted->ls_age, OspfConstants::MAX_AGE);

    const OspfLinkStateUpdate *last = sent.back().packet.as<OspfLinkStateUpdate>();
    ASSERT_NE(last, nullptr);
    ASSERT_EQ(last->lsas.size(), 1u);
    EXPECT_EQ(last->lsas[0].header.sequence_number, OspfConstants::INITIAL_SEQUENCE_NUMBER);
}

TEST_F(OspfEngineTest, FlushedMaxSequenceLsaReplacedByInitial)
{
    bringToFull();
    Lsa wrapped = peerRouterLsa();
    wrapped.header.sequence_number = OspfConstants::MAX_SEQUENCE_NUMBER;
    wrapped = finalizeLsa(wrapped);

    OspfLinkStateUpdate install;
    install.lsas.push_back(wrapped);
    deliver(install);
    ASSERT_TRUE(engine->getLsdb()->contains(wrapped.header.key()));

    // Không còn neighbor nào chờ ack: instance MaxAge bị gỡ ngay
    wrapped.header.ls_age = OspfConstants::MAX_AGE;
    OspfLinkStateUpdate flush;
    flush.lsas.push_back(wrapped);
    deliver(flush);
    EXPECT_FALSE(engine->getLsdb()->contains(wrapped.header.key()));

    OspfLinkStateUpdate restart;
    restart.lsas.push_back(peerRouterLsa());
    deliver(restart);
    auto header = engine->getLsdb()->lookupHeader(wrapped.header.key(), clock.nowMs());
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->sequence_number, OspfConstants::INITIAL_SEQUENCE_NUMBER);
}

// ==================== Inactivity tests ====================
TEST_F(OspfEngineTest, SilentNeighborRemovedAfterDeadInterval)
{
    activateP2p();
    deliver(peerHello(false));
    ASSERT_NE(peer(), nullptr);

    scheduler.advance(39999);
    ASSERT_NE(peer(), nullptr);
    scheduler.advance(1);
    EXPECT_EQ(peer(), nullptr);
    EXPECT_THAT(engine->getEventLog().back(), HasSubstr("Init -> Down (InactivityTimer)"));

    // Không có timer nào tạo lại neighbor
    scheduler.advance(120000);
    EXPECT_EQ(peer(), nullptr);
}

TEST_F(OspfEngineTest, HelloRestartsInactivityTimer)
{
    activateP2p();
    deliver(peerHello(false));
    scheduler.advance(30000);
    deliver(peerHello(false));

    scheduler.advance(30000);
    EXPECT_NE(peer(), nullptr);
    scheduler.advance(10000);
    EXPECT_EQ(peer(), nullptr);
}

TEST_F(OspfEngineTest, DeactivateKillsNeighbors)
{
    bringToFull();
    ASSERT_TRUE(engine->deactivateInterface("Gi0/0"));

    EXPECT_EQ(engine->getInterface("Gi0/0"), nullptr);
    EXPECT_THAT(engine->getEventLog().back(), HasSubstr("Full -> Down (KillNbr)"));
    EXPECT_FALSE(engine->deactivateInterface("Gi0/0"));
}

// ==================== NBMA tests ====================
TEST_F(OspfEngineTest, NbmaNeighborStartsInAttempt)
{
    InterfaceOptions nbma;
    nbma.network_type = NetworkType::NBMA;
    ASSERT_TRUE(engine->activateInterface("Se0/0", IPv4Address(10, 0, 0, 1), SubnetMask::fromPrefixLength(24),
                                          IPv4Address::any(), nbma));
    sent.clear();

    ASSERT_TRUE(engine->addNBMANeighbor("Se0/0", IPv4Address(10, 0, 0, 2)));
    EXPECT_FALSE(engine->addNBMANeighbor("Se0/0", IPv4Address(10, 0, 0, 2)));

    const OspfNeighbor *nbr = engine->getNeighbor("Se0/0", IPv4Address(10, 0, 0, 2));
    ASSERT_NE(nbr, nullptr);
    EXPECT_EQ(nbr->state, NeighborState::ATTEMPT);
    EXPECT_TRUE(nbr->configured);

    // Hello unicast tới neighbor cấu hình
    ASSERT_EQ(countSent(OspfPacketType::HELLO), 1u);
    EXPECT_EQ(sent.back().destination, IPv4Address(10, 0, 0, 2));
}

TEST_F(OspfEngineTest, NbmaNeighborStaysConfiguredAfterTimeout)
{
    InterfaceOptions nbma;
    nbma.network_type = NetworkType::NBMA;
    engine->activateInterface("Se0/0", IPv4Address(10, 0, 0, 1), SubnetMask::fromPrefixLength(24),
                              IPv4Address::any(), nbma);
    engine->addNBMANeighbor("Se0/0", IPv4Address(10, 0, 0, 2));

    scheduler.advance(40000);
    const OspfNeighbor *nbr = engine->getNeighbor("Se0/0", IPv4Address(10, 0, 0, 2));
    ASSERT_NE(nbr, nullptr);
    EXPECT_EQ(nbr->state, NeighborState::DOWN);
}

TEST_F(OspfEngineTest, NbmaRequiresNbmaInterface)
{
    activateP2p();
    EXPECT_FALSE(engine->addNBMANeighbor("Gi0/0", peer_ip));
    EXPECT_FALSE(engine->addNBMANeighbor("Gi0/9", peer_ip));
}

// ==================== Broadcast interface tests ====================
TEST_F(OspfEngineTest, BroadcastInterfaceWaitsThenElectsItself)
{
    ASSERT_TRUE(engine->activateInterface("Gi0/1", IPv4Address(10, 0, 0, 1), SubnetMask::fromPrefixLength(24),
                                          IPv4Address::any()));
    EXPECT_EQ(engine->getInterface("Gi0/1")->state, InterfaceState::WAITING);

    scheduler.advance(40000);
    const OspfInterface *iface = engine->getInterface("Gi0/1");
    EXPECT_EQ(iface->state, InterfaceState::DR);
    EXPECT_EQ(iface->designated_router, IPv4Address(10, 0, 0, 1));
    EXPECT_TRUE(iface->backup_designated_router.isUnspecified());
}

TEST_F(OspfEngineTest, PriorityZeroNeverWaits)
{
    InterfaceOptions options;
    options.priority = 0;
    engine->activateInterface("Gi0/1", IPv4Address(10, 0, 0, 1), SubnetMask::fromPrefixLength(24),
                              IPv4Address::any(), options);
    EXPECT_EQ(engine->getInterface("Gi0/1")->state, InterfaceState::DR_OTHER);
}

TEST_F(OspfEngineTest, ShutdownStopsEverything)
{
    activateP2p();
    deliver(peerHello(true));
    engine->shutdown();
    sent.clear();

    scheduler.advance(60000);
    EXPECT_TRUE(sent.empty());
    EXPECT_TRUE(engine->getInterfaceNames().empty());
    EXPECT_EQ(scheduler.pendingCount(), 0u);
}

// ==================== Wired engine tests ====================

// Nhiều engine trên một segment; packet chuyển đồng bộ theo đích (multicast hoặc IP interface)
class OspfSegmentTest : public ::testing::Test
{
protected:
    struct Member
    {
        std::unique_ptr<OspfEngine> engine;
        std::string iface;
        IPv4Address ip;
    };

    Sim::VirtualClock clock;
    Sim::TimerScheduler scheduler{clock};
    std::vector<std::unique_ptr<Member>> members;
    bool link_up = true;

    void TearDown() override
    {
        members.clear();
    }

    OspfEngine &add(const IPv4Address &rid, const std::string &iface, const IPv4Address &ip,
                    const SubnetMask &mask, const InterfaceOptions &options)
    {
        auto member = std::make_unique<Member>();
        member->engine = std::make_unique<OspfEngine>(scheduler, rid);
        member->iface = iface;
        member->ip = ip;
        Member *self = member.get();
        member->engine->setSendCallback([this, self](const std::string &, const IPv4Address &dst,
                                                     const OspfPacket &packet)
        {
            if (!link_up)
                return;
            for (auto &other : members)
            {
                if (other.get() == self)
                    continue;
                if (dst.isMulticast() || dst == other->ip)
                    other->engine->processPacket(other->iface, self->ip, packet);
            }
        });
        members.push_back(std::move(member));
        EXPECT_TRUE(self->engine->activateInterface(iface, ip, mask, IPv4Address::any(), options));
        return *self->engine;
    }
};

TEST_F(OspfSegmentTest, PointToPointPairReachesFull)
{
    OspfEngine &a = add(IPv4Address(1, 1, 1, 1), "Gi0/0", IPv4Address(10, 0, 12, 1),
                        SubnetMask::fromPrefixLength(30), pointToPoint());
    OspfEngine &b = add(IPv4Address(2, 2, 2, 2), "Gi0/0", IPv4Address(10, 0, 12, 2),
                        SubnetMask::fromPrefixLength(30), pointToPoint());

    const OspfNeighbor *ab = a.getNeighbor("Gi0/0", IPv4Address(2, 2, 2, 2));
    const OspfNeighbor *ba = b.getNeighbor("Gi0/0", IPv4Address(1, 1, 1, 1));
    ASSERT_TRUE(ab && ba);
    EXPECT_EQ(ab->state, NeighborState::FULL);
    EXPECT_EQ(ba->state, NeighborState::FULL);
    EXPECT_FALSE(ab->is_master);
    EXPECT_TRUE(ba->is_master);

    EXPECT_EQ(a.getLsdb()->size(), 2u);
    EXPECT_EQ(b.getLsdb()->size(), 2u);

    size_t at = 0;
    EXPECT_TRUE(logContains(a.getEventLog(), "Down -> Init", 0, &at));
    EXPECT_TRUE(logContains(a.getEventLog(), "Init -> ExStart", at, &at));
    EXPECT_TRUE(logContains(a.getEventLog(), "ExStart -> Exchange", at, &at));
    EXPECT_TRUE(logContains(a.getEventLog(), "-> Full", at, &at));
}

TEST_F(OspfSegmentTest, AdjacencyDropsWhenLinkGoesSilent)
{
    OspfEngine &a = add(IPv4Address(1, 1, 1, 1), "Gi0/0", IPv4Address(10, 0, 12, 1),
                        SubnetMask::fromPrefixLength(30), pointToPoint());
    add(IPv4Address(2, 2, 2, 2), "Gi0/0", IPv4Address(10, 0, 12, 2), SubnetMask::fromPrefixLength(30),
        pointToPoint());
    ASSERT_EQ(a.getNeighbor("Gi0/0", IPv4Address(2, 2, 2, 2))->state, NeighborState::FULL);

    scheduler.advance(35000);
    link_up = false;
    scheduler.advance(45000);

    EXPECT_EQ(a.getNeighbor("Gi0/0", IPv4Address(2, 2, 2, 2)), nullptr);
    EXPECT_THAT(a.getEventLog().back(), HasSubstr("Full -> Down (InactivityTimer)"));
}

TEST_F(OspfSegmentTest, BroadcastSegmentElectsHighestRouterId)
{
    SubnetMask mask24 = SubnetMask::fromPrefixLength(24);
    OspfEngine &r1 = add(IPv4Address(1, 1, 1, 1), "Gi0/0", IPv4Address(10, 0, 0, 1), mask24, InterfaceOptions());
    OspfEngine &r2 = add(IPv4Address(2, 2, 2, 2), "Gi0/0", IPv4Address(10, 0, 0, 2), mask24, InterfaceOptions());
    OspfEngine &r3 = add(IPv4Address(3, 3, 3, 3), "Gi0/0", IPv4Address(10, 0, 0, 3), mask24, InterfaceOptions());

    // Trước khi wait timer hết hạn chỉ có 2-Way
    EXPECT_EQ(r1.getNeighbor("Gi0/0", IPv4Address(2, 2, 2, 2))->state, NeighborState::TWO_WAY);

    scheduler.advance(120000);

    EXPECT_EQ(r3.getInterface("Gi0/0")->state, InterfaceState::DR);
    EXPECT_EQ(r2.getInterface("Gi0/0")->state, InterfaceState::BACKUP);
    EXPECT_EQ(r1.getInterface("Gi0/0")->state, InterfaceState::DR_OTHER);
    EXPECT_EQ(r1.getInterface("Gi0/0")->designated_router, IPv4Address(10, 0, 0, 3));

    EXPECT_EQ(r1.getNeighbor("Gi0/0", IPv4Address(3, 3, 3, 3))->state, NeighborState::FULL);
    EXPECT_TRUE(r3.getLsdb()->contains(LsaKey{LsaType::NETWORK, IPv4Address(10, 0, 0, 3), IPv4Address(3, 3, 3, 3)}));
}
