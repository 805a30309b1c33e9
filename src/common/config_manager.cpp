// src/common/config_manager.cpp
#include "config_manager.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace NetSim
{
    namespace Common
    {
        namespace
        {
            bool parseJsonRecursive(ConfigManager &config, const json &node, const std::string &prefix)
            {
                bool ok = true;
                for (auto it = node.begin(); it != node.end(); ++it)
                {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
                    const json &value = it.value();

                    if (value.is_object())
                    {
                        ok = parseJsonRecursive(config, value, key) && ok;
                    }
                    else if (value.is_string())
                    {
                        ok = config.setString(key, value.get<std::string>()) && ok;
                    }
                    else if (value.is_boolean())
                    {
                        ok = config.setBool(key, value.get<bool>()) && ok;
                    }
                    else if (value.is_number_integer())
                    {
                        ok = config.setInt(key, value.get<int>()) && ok;
                    }
                    else if (value.is_number_float())
                    {
                        ok = config.setDouble(key, value.get<double>()) && ok;
                    }
                    else
                    {
                        NETSIM_GET_LOGGER("Config")->warn("Unsupported value type for config key '{}'", key);
                        ok = false;
                    }
                }
                return ok;
            }
        }

        // ==================== Constructor ====================
        ConfigManager::ConfigManager()
            : next_callback_id_(1)
        {
            initializeDefaults();
        }

        // ==================== Initialization ====================
        void ConfigManager::initializeDefaults()
        {
            // System defaults
            setString(ConfigKeys::SYSTEM_LOG_LEVEL, "info");
            setString(ConfigKeys::SYSTEM_LOG_FILE, "");
            setInt(ConfigKeys::SYSTEM_LOG_MAX_SIZE, 10 * 1024 * 1024);

            // Switch defaults
            setInt(ConfigKeys::SWITCH_MAC_AGING_TIME, 300);
            setInt(ConfigKeys::SWITCH_MAC_TABLE_MAX, 8192);

            // Router defaults
            setInt(ConfigKeys::ROUTER_DEFAULT_TTL, 255);
            setInt(ConfigKeys::ROUTER_ARP_TIMEOUT, 14400);

            // NAT defaults
            setInt(ConfigKeys::NAT_TRANSLATION_TIMEOUT, 86400);
            setInt(ConfigKeys::NAT_PAT_PORT_MIN, 1024);
            setInt(ConfigKeys::NAT_PAT_PORT_MAX, 65535);

            // OSPF defaults
            setInt(ConfigKeys::OSPF_HELLO_INTERVAL, 10);
            setInt(ConfigKeys::OSPF_DEAD_INTERVAL, 40);
            setInt(ConfigKeys::OSPF_RETRANSMIT_INTERVAL, 5);
            setInt(ConfigKeys::OSPF_TRANSMIT_DELAY, 1);

            // Capture defaults
            setBool(ConfigKeys::CAPTURE_ENABLED, false);
            setString(ConfigKeys::CAPTURE_FILE, "netsim.pcap");

            // Simulation defaults
            setInt(ConfigKeys::SIM_MAX_DELIVERY_DEPTH, 64);

            setValidator(ConfigKeys::ROUTER_DEFAULT_TTL, [](const std::any &v)
                         {
                             const int *ttl = std::any_cast<int>(&v);
                             return ttl && *ttl > 0 && *ttl <= 255;
                         });
            auto valid_port = [](const std::any &v)
            {
                const int *port = std::any_cast<int>(&v);
                return port && *port > 0 && *port <= 65535;
            };
            setValidator(ConfigKeys::NAT_PAT_PORT_MIN, valid_port);
            setValidator(ConfigKeys::NAT_PAT_PORT_MAX, valid_port);
        }

        // ==================== File I/O ====================
        bool ConfigManager::loadFromFile(const std::string &config_file)
        {
            std::ifstream file(config_file);
            if (!file.is_open())
            {
                NETSIM_GET_LOGGER("Config")->error("Cannot open config file: {}", config_file);
                return false;
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            return loadFromJson(buffer.str());
        }

        bool ConfigManager::saveToFile(const std::string &config_file) const
        {
            std::ofstream file(config_file);
            if (!file.is_open())
            {
                NETSIM_GET_LOGGER("Config")->error("Cannot create config file: {}", config_file);
                return false;
            }

            file << exportToJson();
            return file.good();
        }

        // ==================== JSON Operations ====================
        bool ConfigManager::loadFromJson(const std::string &json_content)
        {
            try
            {
                // Cho phép comment kiểu // và /* */
                json j = json::parse(json_content, nullptr, true, true);
                if (!j.is_object())
                {
                    NETSIM_GET_LOGGER("Config")->error("Config root must be a JSON object");
                    return false;
                }
                return parseJsonRecursive(*this, j, "");
            }
            catch (const json::parse_error &e)
            {
                NETSIM_GET_LOGGER("Config")->error("JSON parse error: {}", e.what());
                return false;
            }
        }

        std::string ConfigManager::exportToJson() const
        {
            json j = json::object();
            for (const auto &[key, entry] : config_map_)
            {
                json::json_pointer ptr("/" + Utils::join(Utils::split(key, '.'), "/"));
                try
                {
                    switch (entry.type)
                    {
                    case ConfigType::STRING:
                        j[ptr] = std::any_cast<std::string>(entry.value);
                        break;
                    case ConfigType::INTEGER:
                        j[ptr] = std::any_cast<int>(entry.value);
                        break;
                    case ConfigType::DOUBLE:
                        j[ptr] = std::any_cast<double>(entry.value);
                        break;
                    case ConfigType::BOOLEAN:
                        j[ptr] = std::any_cast<bool>(entry.value);
                        break;
                    }
                }
                catch (const json::exception &e)
                {
                    // "a" và "a.b" cùng tồn tại: bỏ qua key xung đột
                    NETSIM_GET_LOGGER("Config")->warn("Skipping config key '{}' on export: {}", key, e.what());
                }
            }
            return j.dump(4);
        }

        // ==================== Set methods ====================
        bool ConfigManager::setString(const std::string &key, const std::string &value)
        {
            return setValue(key, value, ConfigType::STRING);
        }

        bool ConfigManager::setInt(const std::string &key, int value)
        {
            return setValue(key, value, ConfigType::INTEGER);
        }

        bool ConfigManager::setDouble(const std::string &key, double value)
        {
            return setValue(key, value, ConfigType::DOUBLE);
        }

        bool ConfigManager::setBool(const std::string &key, bool value)
        {
            return setValue(key, value, ConfigType::BOOLEAN);
        }

        bool ConfigManager::setValue(const std::string &key, const std::any &value, ConfigType type)
        {
            if (!isValidKey(key))
            {
                NETSIM_GET_LOGGER("Config")->warn("Rejected invalid config key '{}'", key);
                return false;
            }

            std::any old_value;
            auto it = config_map_.find(key);
            if (it != config_map_.end())
            {
                if (it->second.validator && !it->second.validator(value))
                {
                    NETSIM_GET_LOGGER("Config")->warn("Validator rejected value for '{}'", key);
                    return false;
                }
                old_value = it->second.value;
                it->second.value = value;
                it->second.type = type;
            }
            else
            {
                config_map_.emplace(key, ConfigEntry(value, type));
            }

            notifyChange(key, old_value, value);
            return true;
        }

        // ==================== Get methods ====================
        std::string ConfigManager::getString(const std::string &key, const std::string &default_value) const
        {
            auto it = config_map_.find(key);
            if (it == config_map_.end() || it->second.type != ConfigType::STRING)
                return default_value;
            return std::any_cast<std::string>(it->second.value);
        }

        int ConfigManager::getInt(const std::string &key, int default_value) const
        {
            auto it = config_map_.find(key);
            if (it == config_map_.end())
                return default_value;

            if (it->second.type == ConfigType::INTEGER)
                return std::any_cast<int>(it->second.value);
            if (it->second.type == ConfigType::DOUBLE)
                return static_cast<int>(std::any_cast<double>(it->second.value));
            return default_value;
        }

        bool ConfigManager::getBool(const std::string &key, bool default_value) const
        {
            auto it = config_map_.find(key);
            if (it == config_map_.end() || it->second.type != ConfigType::BOOLEAN)
                return default_value;
            return std::any_cast<bool>(it->second.value);
        }

        // ==================== Validation ====================
        void ConfigManager::setValidator(const std::string &key, std::function<bool(const std::any &)> validator)
        {
            auto it = config_map_.find(key);
            if (it != config_map_.end())
            {
                it->second.validator = std::move(validator);
            }
        }

        bool ConfigManager::isValidKey(const std::string &key) const
        {
            if (key.empty() || key.front() == '.' || key.back() == '.')
                return false;
            return key.find("..") == std::string::npos;
        }

        // ==================== Change notifications ====================
        uint64_t ConfigManager::registerChangeCallback(const std::string &key, ConfigChangeCallback callback)
        {
            uint64_t id = next_callback_id_++;
            change_callbacks_.emplace(id, ChangeSubscription{key, std::move(callback)});
            return id;
        }

        bool ConfigManager::unregisterChangeCallback(uint64_t callback_id)
        {
            return change_callbacks_.erase(callback_id) > 0;
        }

        void ConfigManager::notifyChange(const std::string &key, const std::any &old_value, const std::any &new_value)
        {
            // Callback có thể unregister trong lúc được gọi
            std::vector<ConfigChangeCallback> matched;
            for (const auto &pair : change_callbacks_)
            {
                if (pair.second.key == key)
                {
                    matched.push_back(pair.second.callback);
                }
            }
            for (const auto &callback : matched)
            {
                callback(key, old_value, new_value);
            }
        }

    } // namespace Common
} // namespace NetSim
