// src/main.cpp
// Demo: hai router OSPF, một switch, hai host

#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "core/l2/switch.hpp"
#include "core/l3/host.hpp"
#include "core/l3/router.hpp"
#include "core/sim/simulation_context.hpp"

using namespace NetSim;
using namespace NetSim::Core;
using Common::IPv4Address;
using Common::SubnetMask;
using Common::WildcardMask;

// ==================== SETUP LOGGER ====================

bool setupLogger(const Common::ConfigManager &config)
{
    Common::LoggerSettings settings;
    settings.level = Common::stringToLogLevel(NETSIM_CONFIG_GET_STRING(config, Common::ConfigKeys::SYSTEM_LOG_LEVEL, "info"));
    settings.log_file = NETSIM_CONFIG_GET_STRING(config, Common::ConfigKeys::SYSTEM_LOG_FILE, "");
    settings.max_file_size = static_cast<size_t>(
        NETSIM_CONFIG_GET_INT(config, Common::ConfigKeys::SYSTEM_LOG_MAX_SIZE, 10 * 1024 * 1024));

    if (!NETSIM_LOG_MANAGER.configure(settings))
    {
        std::cerr << "Logger initialization failed" << std::endl;
        return false;
    }

    spdlog::set_default_logger(NETSIM_GET_LOGGER("Demo"));
    spdlog::info("✓ Logger initialized (level {})", spdlog::level::to_string_view(settings.level));
    return true;
}

// ==================== PRINT HELPERS ====================

void printRoutes(const L3::Router &router)
{
    spdlog::info("📋 {} routing table:", router.getName());
    for (const auto &route : router.getRoutingTable().getRoutes())
    {
        spdlog::info("    {}", route.toString());
    }
}

void printNeighbors(const L3::Router &router)
{
    const Ospf::OspfEngine *ospf = router.ospf();
    if (ospf == nullptr)
    {
        return;
    }

    for (const auto &name : ospf->getInterfaceNames())
    {
        const Ospf::OspfInterface *iface = ospf->getInterface(name);
        for (const auto &pair : iface->neighbors)
        {
            spdlog::info("🤝 {} {}: neighbor {} ({}) {}", router.getName(), name, pair.second.router_id.toString(),
                         pair.second.ip_address.toString(), Ospf::neighborStateToString(pair.second.state));
        }
    }
}

bool waitForEchoReply(const L3::Host &host, const IPv4Address &from)
{
    for (const auto &packet : host.getReceivedPackets())
    {
        const auto *icmp = packet.payloadAs<Packet::IcmpMessage>();
        if (icmp != nullptr && icmp->type == Packet::IcmpType::ECHO_REPLY && packet.source() == from)
        {
            return true;
        }
    }
    return false;
}

// ==================== MAIN FUNCTION ====================

int main(int argc, char *argv[])
{
    Sim::SimulationContext context;

    if (argc > 1 && !context.config().loadFromFile(argv[1]))
    {
        std::cerr << "Cannot load config file " << argv[1] << std::endl;
        return 1;
    }

    if (!setupLogger(context.config()))
    {
        return 1;
    }

    spdlog::info("╔═══════════════════════════════════════════════════════╗");
    spdlog::info("║   🌐 NetSim - Network Simulation Demo                 ║");
    spdlog::info("║   🔀 Switch + 📡 Router + 🗺️  OSPF                      ║");
    spdlog::info("╚═══════════════════════════════════════════════════════╝");

    if (NETSIM_CONFIG_GET_BOOL(context.config(), Common::ConfigKeys::CAPTURE_ENABLED, false))
    {
        std::string file = NETSIM_CONFIG_GET_STRING(context.config(), Common::ConfigKeys::CAPTURE_FILE, "netsim.pcap");
        if (!context.enableCapture(file))
        {
            spdlog::error("❌ Failed to open capture file {}", file);
            return 1;
        }
        spdlog::info("💾 Capturing to {}", file);
    }

    // Ghi lại cấu hình hiệu lực (sau khi merge file với default)
    if (argc > 2)
    {
        if (!context.config().saveToFile(argv[2]))
        {
            spdlog::error("❌ Failed to write effective config to {}", argv[2]);
            return 1;
        }
        spdlog::info("📝 Effective config written to {}", argv[2]);
    }

    // ==================== TOPOLOGY ====================
    //
    //  H1 ---- Gi0/0 R1 Gi0/1 ---- Gi0/1 R2 Gi0/0 ---- Fa0/1 SW1 Fa0/2 ---- H2
    //  10.0.1.0/24        10.0.12.0/30 (p2p)        10.0.2.0/24

    auto *r1 = context.createDevice<L3::Router>("R1");
    auto *r2 = context.createDevice<L3::Router>("R2");
    auto *sw1 = context.createDevice<L2::Switch>("SW1");
    auto *h1 = context.createDevice<L3::Host>("H1");
    auto *h2 = context.createDevice<L3::Host>("H2");
    if (!r1 || !r2 || !sw1 || !h1 || !h2)
    {
        spdlog::error("❌ Failed to create devices");
        return 1;
    }

    bool linked = context.connect("H1", "eth0", "R1", "Gi0/0") &&
                  context.connect("R1", "Gi0/1", "R2", "Gi0/1") &&
                  context.connect("R2", "Gi0/0", "SW1", "Fa0/1") &&
                  context.connect("SW1", "Fa0/2", "H2", "eth0");
    if (!linked)
    {
        spdlog::error("❌ Failed to connect devices");
        return 1;
    }

    r1->configureInterface("Gi0/0", IPv4Address(10, 0, 1, 1), SubnetMask::fromPrefixLength(24));
    r1->configureInterface("Gi0/1", IPv4Address(10, 0, 12, 1), SubnetMask::fromPrefixLength(30));
    r2->configureInterface("Gi0/0", IPv4Address(10, 0, 2, 1), SubnetMask::fromPrefixLength(24));
    r2->configureInterface("Gi0/1", IPv4Address(10, 0, 12, 2), SubnetMask::fromPrefixLength(30));

    h1->configure(IPv4Address(10, 0, 1, 10), SubnetMask::fromPrefixLength(24), IPv4Address(10, 0, 1, 1));
    h2->configure(IPv4Address(10, 0, 2, 10), SubnetMask::fromPrefixLength(24), IPv4Address(10, 0, 2, 1));

    // ==================== OSPF ====================

    Ospf::InterfaceOptions p2p;
    p2p.network_type = Ospf::NetworkType::POINT_TO_POINT;
    r1->setOspfInterfaceOptions("Gi0/1", p2p);
    r2->setOspfInterfaceOptions("Gi0/1", p2p);

    r1->enableOspf(IPv4Address(1, 1, 1, 1));
    r1->ospfNetwork(IPv4Address(10, 0, 0, 0), WildcardMask::fromString("0.0.255.255"), IPv4Address::any());
    r2->enableOspf(IPv4Address(2, 2, 2, 2));
    r2->ospfNetwork(IPv4Address(10, 0, 0, 0), WildcardMask::fromString("0.0.255.255"), IPv4Address::any());

    spdlog::info("⏳ Waiting for OSPF convergence...");
    for (int second = 0; second < 60; ++second)
    {
        context.advanceTime(1000);
        if (r1->getRoutingTable().getRoutes(L3::RouteSource::OSPF).size() > 0 &&
            r2->getRoutingTable().getRoutes(L3::RouteSource::OSPF).size() > 0)
        {
            spdlog::info("✓ Converged after {} s", second + 1);
            break;
        }
    }

    printNeighbors(*r1);
    printNeighbors(*r2);
    printRoutes(*r1);
    printRoutes(*r2);

    // ==================== PING ====================

    h1->ping(h2->getIpAddress());
    bool reachable = waitForEchoReply(*h1, h2->getIpAddress());
    spdlog::info("{} H1 -> H2: {}", reachable ? "✓" : "❌", reachable ? "echo reply received" : "no reply");

    h1->clearReceivedPackets();
    h1->ping(h2->getIpAddress(), 1);
    for (const auto &packet : h1->getReceivedPackets())
    {
        const auto *icmp = packet.payloadAs<Packet::IcmpMessage>();
        if (icmp != nullptr && icmp->type == Packet::IcmpType::TIME_EXCEEDED)
        {
            spdlog::info("⏱️  TTL 1: time exceeded from {}", packet.source().toString());
        }
    }

    // ==================== STATISTICS ====================

    const auto &stats = context.getStatistics();
    spdlog::info("╔════════════════════════════════════════════════════╗");
    spdlog::info("║               📊 SIMULATION STATISTICS             ║");
    spdlog::info("╠════════════════════════════════════════════════════╣");
    spdlog::info("║ Virtual time:     {:>32} ║", Common::Utils::formatSimTime(context.nowMs()));
    spdlog::info("║ Frames sent:      {:>32} ║", stats.frames_transmitted);
    spdlog::info("║ Frames delivered: {:>32} ║", stats.frames_delivered);
    spdlog::info("║ R1 forwarded:     {:>32} ║", r1->getStatistics().forwarded);
    spdlog::info("║ R2 forwarded:     {:>32} ║", r2->getStatistics().forwarded);
    spdlog::info("╚════════════════════════════════════════════════════╝");

    if (context.isCapturing())
    {
        spdlog::info("💾 {} frames written to {}", context.capture()->getPacketCount(),
                     context.capture()->getCurrentFile());
        context.disableCapture();
    }

    NETSIM_LOG_MANAGER.flushAll();
    return reachable ? 0 : 2;
}
