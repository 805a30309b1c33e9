// tests/unit/test_common_config_manager.cpp
#include <gtest/gtest.h>
#include "../../src/common/config_manager.hpp"
#include <filesystem>
#include <fstream>

using namespace NetSim::Common;

// ==================== Test Fixture ====================
class ConfigManagerTest : public ::testing::Test
{
protected:
    std::unique_ptr<ConfigManager> config;
    std::string test_config_file;

    void SetUp() override
    {
        config = std::make_unique<ConfigManager>();
        test_config_file = "test_netsim_config.json";
        cleanupTestFiles();
    }

    void TearDown() override
    {
        cleanupTestFiles();
    }

    void cleanupTestFiles()
    {
        if (std::filesystem::exists(test_config_file))
        {
            std::filesystem::remove(test_config_file);
        }
    }
};

// ==================== Defaults ====================
TEST_F(ConfigManagerTest, DefaultsArePresent)
{
    EXPECT_EQ(config->getInt(ConfigKeys::ROUTER_DEFAULT_TTL), 255);
    EXPECT_EQ(config->getInt(ConfigKeys::ROUTER_ARP_TIMEOUT), 14400);
    EXPECT_EQ(config->getInt(ConfigKeys::NAT_TRANSLATION_TIMEOUT), 86400);
    EXPECT_EQ(config->getInt(ConfigKeys::NAT_PAT_PORT_MIN), 1024);
    EXPECT_EQ(config->getInt(ConfigKeys::NAT_PAT_PORT_MAX), 65535);
    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_HELLO_INTERVAL), 10);
    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_DEAD_INTERVAL), 40);
    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_RETRANSMIT_INTERVAL), 5);
    EXPECT_EQ(config->getInt(ConfigKeys::SWITCH_MAC_AGING_TIME), 300);
    EXPECT_EQ(config->getString(ConfigKeys::SYSTEM_LOG_LEVEL), "info");
    EXPECT_FALSE(config->getBool(ConfigKeys::CAPTURE_ENABLED, true));
    EXPECT_EQ(config->getString(ConfigKeys::CAPTURE_FILE), "netsim.pcap");
    EXPECT_EQ(config->getInt(ConfigKeys::SIM_MAX_DELIVERY_DEPTH), 64);
}

TEST_F(ConfigManagerTest, InstancesAreIndependent)
{
    ConfigManager other;
    config->setInt(ConfigKeys::OSPF_HELLO_INTERVAL, 1);

    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_HELLO_INTERVAL), 1);
    EXPECT_EQ(other.getInt(ConfigKeys::OSPF_HELLO_INTERVAL), 10);
}

// ==================== Basic set/get ====================
TEST_F(ConfigManagerTest, SetAndGetTypedValues)
{
    EXPECT_TRUE(config->setString("test.string", "value"));
    EXPECT_TRUE(config->setInt("test.int", 42));
    EXPECT_TRUE(config->setBool("test.bool", true));

    EXPECT_EQ(config->getString("test.string"), "value");
    EXPECT_EQ(config->getInt("test.int"), 42);
    EXPECT_TRUE(config->getBool("test.bool"));
}

TEST_F(ConfigManagerTest, MissingOrMismatchedKeyReturnsDefault)
{
    config->setString("test.string", "value");

    EXPECT_EQ(config->getInt("missing.key", 7), 7);
    EXPECT_EQ(config->getInt("test.string", 9), 9);
    EXPECT_FALSE(config->getBool("test.string", false));
    EXPECT_EQ(config->getString("missing.key", "fallback"), "fallback");
}

TEST_F(ConfigManagerTest, DoubleReadAsInt)
{
    config->setDouble("test.double", 3.9);
    EXPECT_EQ(config->getInt("test.double"), 3);
    EXPECT_FALSE(config->getBool("test.double"));
}

TEST_F(ConfigManagerTest, InvalidKeysRejected)
{
    EXPECT_FALSE(config->setInt("", 1));
    EXPECT_FALSE(config->setInt(".leading", 1));
    EXPECT_FALSE(config->setInt("trailing.", 1));
    EXPECT_FALSE(config->setInt("double..dot", 1));
}

// ==================== Validators ====================
TEST_F(ConfigManagerTest, DefaultTtlValidator)
{
    EXPECT_FALSE(config->setInt(ConfigKeys::ROUTER_DEFAULT_TTL, 0));
    EXPECT_FALSE(config->setInt(ConfigKeys::ROUTER_DEFAULT_TTL, 256));
    EXPECT_EQ(config->getInt(ConfigKeys::ROUTER_DEFAULT_TTL), 255);

    EXPECT_TRUE(config->setInt(ConfigKeys::ROUTER_DEFAULT_TTL, 64));
    EXPECT_EQ(config->getInt(ConfigKeys::ROUTER_DEFAULT_TTL), 64);
}

TEST_F(ConfigManagerTest, PatPortValidator)
{
    EXPECT_FALSE(config->setInt(ConfigKeys::NAT_PAT_PORT_MIN, 0));
    EXPECT_FALSE(config->setInt(ConfigKeys::NAT_PAT_PORT_MAX, 70000));
    EXPECT_EQ(config->getInt(ConfigKeys::NAT_PAT_PORT_MAX), 65535);
    EXPECT_TRUE(config->setInt(ConfigKeys::NAT_PAT_PORT_MIN, 40000));
}

// ==================== JSON ====================
TEST_F(ConfigManagerTest, LoadNestedJson)
{
    std::string json = R"({
        "ospf": { "hello_interval": 5, "dead_interval": 20 },
        "nat": { "pat_port_min": 2000 },
        "capture": { "enabled": true, "file": "out.pcap" },
        "switch": { "mac_aging_time": 30.0 }
    })";

    ASSERT_TRUE(config->loadFromJson(json));
    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_HELLO_INTERVAL), 5);
    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_DEAD_INTERVAL), 20);
    EXPECT_EQ(config->getInt(ConfigKeys::NAT_PAT_PORT_MIN), 2000);
    EXPECT_TRUE(config->getBool(ConfigKeys::CAPTURE_ENABLED));
    EXPECT_EQ(config->getString(ConfigKeys::CAPTURE_FILE), "out.pcap");
    EXPECT_EQ(config->getInt(ConfigKeys::SWITCH_MAC_AGING_TIME), 30);
}

TEST_F(ConfigManagerTest, LoadJsonWithComments)
{
    std::string json = R"({
        // hello nhanh hơn cho lab
        "ospf": { "hello_interval": 2 }
    })";

    ASSERT_TRUE(config->loadFromJson(json));
    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_HELLO_INTERVAL), 2);
}

TEST_F(ConfigManagerTest, InvalidJsonRejected)
{
    EXPECT_FALSE(config->loadFromJson("{ not json"));
    EXPECT_FALSE(config->loadFromJson("[1, 2, 3]"));
    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_HELLO_INTERVAL), 10);
}

TEST_F(ConfigManagerTest, ArrayValueRejected)
{
    EXPECT_FALSE(config->loadFromJson(R"({"lab": {"routers": ["R1", "R2"]}, "ospf": {"hello_interval": 4}})"));
    EXPECT_EQ(config->getString("lab.routers", "none"), "none");
    EXPECT_EQ(config->getInt(ConfigKeys::OSPF_HELLO_INTERVAL), 4);
}

TEST_F(ConfigManagerTest, RejectedValueFailsLoad)
{
    EXPECT_FALSE(config->loadFromJson(R"({"router": {"default_ttl": 300}})"));
    EXPECT_EQ(config->getInt(ConfigKeys::ROUTER_DEFAULT_TTL), 255);
}

TEST_F(ConfigManagerTest, SaveAndLoadFile)
{
    config->setInt(ConfigKeys::OSPF_HELLO_INTERVAL, 3);
    config->setString("lab.name", "two-routers");
    ASSERT_TRUE(config->saveToFile(test_config_file));

    ConfigManager loaded;
    ASSERT_TRUE(loaded.loadFromFile(test_config_file));
    EXPECT_EQ(loaded.getInt(ConfigKeys::OSPF_HELLO_INTERVAL), 3);
    EXPECT_EQ(loaded.getString("lab.name"), "two-routers");
}

TEST_F(ConfigManagerTest, LoadMissingFileFails)
{
    EXPECT_FALSE(config->loadFromFile("/nonexistent/netsim/config.json"));
}

// ==================== Change callbacks ====================
TEST_F(ConfigManagerTest, ChangeCallbackInvoked)
{
    int calls = 0;
    int last_value = 0;
    uint64_t id = config->registerChangeCallback(
        ConfigKeys::OSPF_HELLO_INTERVAL,
        [&](const std::string &key, const std::any &old_value, const std::any &new_value)
        {
            ++calls;
            EXPECT_EQ(key, ConfigKeys::OSPF_HELLO_INTERVAL);
            EXPECT_EQ(std::any_cast<int>(old_value), 10);
            last_value = std::any_cast<int>(new_value);
        });

    config->setInt(ConfigKeys::OSPF_DEAD_INTERVAL, 30);
    EXPECT_EQ(calls, 0);

    config->setInt(ConfigKeys::OSPF_HELLO_INTERVAL, 1);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(last_value, 1);

    EXPECT_TRUE(config->unregisterChangeCallback(id));
    EXPECT_FALSE(config->unregisterChangeCallback(id));
    config->setInt(ConfigKeys::OSPF_HELLO_INTERVAL, 2);
    EXPECT_EQ(calls, 1);
}

TEST_F(ConfigManagerTest, SeveralCallbacksPerKey)
{
    int first = 0;
    int second = 0;
    config->registerChangeCallback(ConfigKeys::NAT_TRANSLATION_TIMEOUT,
                                   [&](const std::string &, const std::any &, const std::any &) { ++first; });
    config->registerChangeCallback(ConfigKeys::NAT_TRANSLATION_TIMEOUT,
                                   [&](const std::string &, const std::any &, const std::any &) { ++second; });

    config->setInt(ConfigKeys::NAT_TRANSLATION_TIMEOUT, 600);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
}

TEST_F(ConfigManagerTest, RejectedValueNotNotified)
{
    int calls = 0;
    config->registerChangeCallback(ConfigKeys::ROUTER_DEFAULT_TTL,
                                   [&](const std::string &, const std::any &, const std::any &) { ++calls; });

    EXPECT_FALSE(config->setInt(ConfigKeys::ROUTER_DEFAULT_TTL, 0));
    EXPECT_EQ(calls, 0);
}

TEST_F(ConfigManagerTest, ConfigMacros)
{
    EXPECT_EQ(NETSIM_CONFIG_GET_INT(*config, ConfigKeys::ROUTER_DEFAULT_TTL, 1), 255);
    EXPECT_EQ(NETSIM_CONFIG_GET_INT(*config, "missing.key", 17), 17);
    EXPECT_EQ(NETSIM_CONFIG_GET_STRING(*config, ConfigKeys::CAPTURE_FILE, ""), "netsim.pcap");
}
