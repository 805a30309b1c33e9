// tests/unit/test_acl_engine.cpp
#include <gtest/gtest.h>
#include "../../src/core/acl/acl_engine.hpp"
#include "../../src/core/acl/acl_parser.hpp"
#include "../../src/core/packet/packet_builder.hpp"

using namespace NetSim::Common;
using namespace NetSim::Core::Acl;
using namespace NetSim::Core::Packet;

class AclEngineTest : public ::testing::Test
{
protected:
    AclEngine engine;

    void addLine(const std::string &line)
    {
        auto parsed = AclParser::parseAccessListCommand(line);
        ASSERT_TRUE(parsed.has_value()) << line;
        ASSERT_TRUE(engine.addNumberedEntry(parsed->first, parsed->second).has_value()) << line;
    }

    IPv4Packet tcpPacket(const IPv4Address &src, const IPv4Address &dst, uint16_t dport,
                         uint8_t flags = TcpFlags::SYN)
    {
        return PacketBuilder::createIPv4Packet(src, dst, IpProtocol::TCP, 64,
                                               PacketBuilder::createTcpSegment(40000, dport, flags));
    }
};

// ==================== Numbering tests ====================
TEST_F(AclEngineTest, TypeForNumber)
{
    EXPECT_EQ(AclEngine::typeForNumber(1), AclType::STANDARD);
    EXPECT_EQ(AclEngine::typeForNumber(99), AclType::STANDARD);
    EXPECT_EQ(AclEngine::typeForNumber(1300), AclType::STANDARD);
    EXPECT_EQ(AclEngine::typeForNumber(100), AclType::EXTENDED);
    EXPECT_EQ(AclEngine::typeForNumber(2699), AclType::EXTENDED);
    EXPECT_FALSE(AclEngine::typeForNumber(0).has_value());
    EXPECT_FALSE(AclEngine::typeForNumber(200).has_value());
}

TEST_F(AclEngineTest, SequenceNumbersAutoAssigned)
{
    AclEntry entry;
    EXPECT_EQ(engine.addNumberedEntry(10, entry), 10u);
    EXPECT_EQ(engine.addNumberedEntry(10, entry), 20u);

    entry.sequence = 15;
    EXPECT_EQ(engine.addNumberedEntry(10, entry), 15u);
    EXPECT_FALSE(engine.addNumberedEntry(10, entry).has_value());

    const AccessList *acl = engine.getACL("10");
    ASSERT_NE(acl, nullptr);
    ASSERT_EQ(acl->entries.size(), 3u);
    EXPECT_EQ(acl->entries[1].sequence, 15u);
}

TEST_F(AclEngineTest, StandardRejectsExtendedFields)
{
    AclEntry entry;
    entry.protocol = IpProtocol::TCP;
    EXPECT_FALSE(engine.addNumberedEntry(10, entry).has_value());
    EXPECT_FALSE(engine.addNumberedEntry(500, AclEntry{}).has_value());
}

TEST_F(AclEngineTest, PortsRequireTcpOrUdp)
{
    AclEntry entry;
    entry.protocol = IpProtocol::ICMP;
    entry.destination_port = PortMatch{PortOperator::EQ, 80, 0};
    EXPECT_FALSE(engine.addNumberedEntry(101, entry).has_value());

    entry.protocol = IpProtocol::UDP;
    entry.established = true;
    EXPECT_FALSE(engine.addNumberedEntry(101, entry).has_value());
}

// ==================== Evaluation tests ====================
TEST_F(AclEngineTest, FirstMatchWins)
{
    addLine("access-list 10 deny host 10.0.0.5");
    addLine("access-list 10 permit 10.0.0.0 0.0.0.255");

    EXPECT_EQ(engine.checkPacket("10", IPv4Address(10, 0, 0, 5)), AclAction::DENY);
    EXPECT_EQ(engine.checkPacket("10", IPv4Address(10, 0, 0, 6)), AclAction::PERMIT);

    const AccessList *acl = engine.getACL("10");
    EXPECT_EQ(acl->entries[0].hit_count, 1u);
    EXPECT_EQ(acl->entries[1].hit_count, 1u);
}

TEST_F(AclEngineTest, ImplicitDenyNotCounted)
{
    addLine("access-list 10 permit 10.0.0.0 0.0.0.255");

    EXPECT_EQ(engine.checkPacket("10", IPv4Address(192, 168, 1, 1)), AclAction::DENY);
    EXPECT_EQ(engine.getACL("10")->entries[0].hit_count, 0u);
    EXPECT_EQ(engine.getStatistics().implicit_denies, 1u);
}

TEST_F(AclEngineTest, EmptyAclDeniesAll)
{
    ASSERT_TRUE(engine.createACL("BLOCK", AclType::STANDARD, true));
    EXPECT_EQ(engine.checkPacket("BLOCK", IPv4Address(1, 1, 1, 1)), AclAction::DENY);
}

TEST_F(AclEngineTest, UnknownAclPermits)
{
    EXPECT_EQ(engine.checkPacket("77", IPv4Address(1, 2, 3, 4)), AclAction::PERMIT);
    EXPECT_EQ(engine.getStatistics().permits, 0u);
}

TEST_F(AclEngineTest, ExtendedMatchesProtocolAndPort)
{
    addLine("access-list 101 deny tcp any host 10.0.2.10 eq www");
    addLine("access-list 101 permit ip any any");

    IPv4Address src(10, 0, 1, 10);
    IPv4Address server(10, 0, 2, 10);

    EXPECT_EQ(engine.checkPacket("101", tcpPacket(src, server, 80)), AclAction::DENY);
    EXPECT_EQ(engine.checkPacket("101", tcpPacket(src, server, 443)), AclAction::PERMIT);

    IPv4Packet udp = PacketBuilder::createIPv4Packet(src, server, IpProtocol::UDP, 64,
                                                     PacketBuilder::createUdpDatagram(40000, 80));
    EXPECT_EQ(engine.checkPacket("101", udp), AclAction::PERMIT);
}

TEST_F(AclEngineTest, PortOperators)
{
    addLine("access-list 110 permit tcp any any range 20 23");
    addLine("access-list 110 permit tcp any any gt 1023");

    IPv4Address a(1, 1, 1, 1);
    IPv4Address b(2, 2, 2, 2);
    EXPECT_EQ(engine.checkPacket("110", tcpPacket(a, b, 22)), AclAction::PERMIT);
    EXPECT_EQ(engine.checkPacket("110", tcpPacket(a, b, 8080)), AclAction::PERMIT);
    EXPECT_EQ(engine.checkPacket("110", tcpPacket(a, b, 80)), AclAction::DENY);
}

TEST_F(AclEngineTest, EstablishedNeedsAckOrRst)
{
    addLine("access-list 120 permit tcp any any established");

    IPv4Address a(1, 1, 1, 1);
    IPv4Address b(2, 2, 2, 2);
    EXPECT_EQ(engine.checkPacket("120", tcpPacket(a, b, 80, TcpFlags::SYN)), AclAction::DENY);
    EXPECT_EQ(engine.checkPacket("120", tcpPacket(a, b, 80, TcpFlags::ACK)), AclAction::PERMIT);
    EXPECT_EQ(engine.checkPacket("120", tcpPacket(a, b, 80, TcpFlags::RST)), AclAction::PERMIT);
}

TEST_F(AclEngineTest, AbsentFieldsNotCompared)
{
    addLine("access-list 130 deny udp any any eq domain");
    addLine("access-list 130 permit ip any any");

    // Không có port: điều kiện port bỏ qua nên entry đầu khớp
    EXPECT_EQ(engine.checkPacket("130", IPv4Address(1, 1, 1, 1), IPv4Address(8, 8, 8, 8),
                                 IpProtocol::UDP),
              AclAction::DENY);
    EXPECT_EQ(engine.checkPacket("130", IPv4Address(1, 1, 1, 1), IPv4Address(8, 8, 8, 8),
                                 IpProtocol::UDP, 5000, 123),
              AclAction::PERMIT);
}

// ==================== Binding tests ====================
TEST_F(AclEngineTest, InterfaceBinding)
{
    addLine("access-list 10 deny any");
    IPv4Packet pkt = tcpPacket(IPv4Address(1, 1, 1, 1), IPv4Address(2, 2, 2, 2), 80);

    EXPECT_EQ(engine.checkInterface("Gi0/0", Direction::IN, pkt), AclAction::PERMIT);

    ASSERT_TRUE(engine.bindToInterface("Gi0/0", "10", Direction::IN));
    EXPECT_EQ(engine.checkInterface("Gi0/0", Direction::IN, pkt), AclAction::DENY);
    EXPECT_EQ(engine.checkInterface("Gi0/0", Direction::OUT, pkt), AclAction::PERMIT);
    EXPECT_EQ(engine.getBoundACL("Gi0/0", Direction::IN), std::string("10"));

    EXPECT_TRUE(engine.unbindFromInterface("Gi0/0", Direction::IN));
    EXPECT_EQ(engine.checkInterface("Gi0/0", Direction::IN, pkt), AclAction::PERMIT);
}

TEST_F(AclEngineTest, BindingToDeletedAclPermits)
{
    addLine("access-list 10 deny any");
    engine.bindToInterface("Gi0/1", "10", Direction::OUT);
    IPv4Packet pkt = tcpPacket(IPv4Address(1, 1, 1, 1), IPv4Address(2, 2, 2, 2), 80);

    ASSERT_TRUE(engine.deleteACL("10"));
    EXPECT_TRUE(engine.getBoundACL("Gi0/1", Direction::OUT).has_value());
    EXPECT_EQ(engine.checkInterface("Gi0/1", Direction::OUT, pkt), AclAction::PERMIT);
}

// ==================== Counter tests ====================
TEST_F(AclEngineTest, MatchesSourceDoesNotCount)
{
    addLine("access-list 1 permit 10.0.1.0 0.0.0.255");

    EXPECT_TRUE(engine.matchesSource("1", IPv4Address(10, 0, 1, 50)));
    EXPECT_FALSE(engine.matchesSource("1", IPv4Address(10, 0, 2, 50)));
    EXPECT_FALSE(engine.matchesSource("99", IPv4Address(10, 0, 1, 50)));
    EXPECT_EQ(engine.getACL("1")->entries[0].hit_count, 0u);
}

TEST_F(AclEngineTest, ClearCounters)
{
    addLine("access-list 10 permit any");
    engine.checkPacket("10", IPv4Address(1, 1, 1, 1));
    engine.checkPacket("10", IPv4Address(1, 1, 1, 2));
    EXPECT_EQ(engine.getStatistics().total_hits, 2u);

    EXPECT_TRUE(engine.clearCounters("10"));
    EXPECT_EQ(engine.getStatistics().total_hits, 0u);
    EXPECT_FALSE(engine.clearCounters("11"));
}

TEST_F(AclEngineTest, ClearAllCounters)
{
    addLine("access-list 10 permit any");
    addLine("access-list 20 deny any");
    engine.checkPacket("10", IPv4Address(1, 1, 1, 1));
    engine.checkPacket("20", IPv4Address(1, 1, 1, 1));

    engine.clearAllCounters();
    for (const auto &acl : engine.getAllACLs())
    {
        for (const auto &entry : acl.entries)
            EXPECT_EQ(entry.hit_count, 0u);
    }
    EXPECT_EQ(engine.getAllACLs().size(), 2u);
    EXPECT_EQ(engine.getStatistics().total_hits, 0u);
}

TEST_F(AclEngineTest, RemoveEntry)
{
    addLine("access-list 10 deny any");
    EXPECT_TRUE(engine.removeEntry("10", 10));
    EXPECT_FALSE(engine.removeEntry("10", 10));
    EXPECT_EQ(engine.checkPacket("10", IPv4Address(1, 1, 1, 1)), AclAction::DENY);
    EXPECT_EQ(engine.getStatistics().implicit_denies, 1u);
}
