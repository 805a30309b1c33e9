// src/common/config_manager.hpp
#ifndef NETSIM_CONFIG_MANAGER_HPP
#define NETSIM_CONFIG_MANAGER_HPP

#include "utils.hpp"
#include <string>
#include <unordered_map>
#include <map>
#include <functional>
#include <any>
#include <cstdint>

namespace NetSim
{
    namespace Common
    {
        /**
         * @brief Enum cho các loại cấu hình
         */
        enum class ConfigType
        {
            STRING,
            INTEGER,
            DOUBLE,
            BOOLEAN
        };

        /**
         * @brief Struct chứa thông tin một config entry
         */
        struct ConfigEntry
        {
            std::any value;
            ConfigType type;
            std::function<bool(const std::any &)> validator;

            ConfigEntry() : type(ConfigType::STRING) {}

            ConfigEntry(const std::any &val, ConfigType t)
                : value(val), type(t) {}
        };

        /**
         * @brief Callback function cho config change events
         */
        using ConfigChangeCallback = std::function<void(const std::string &key, const std::any &old_value, const std::any &new_value)>;

        /**
         * @brief Configuration Manager
         *
         * Key dạng dotted ("ospf.hello_interval"). JSON lồng nhau được làm phẳng
         * khi load. Mỗi SimulationContext sở hữu một instance riêng và chỉ dùng
         * trên thread của simulation.
         */
        class ConfigManager
        {
        public:
            ConfigManager();
            ~ConfigManager() = default;

            ConfigManager(const ConfigManager &) = delete;
            ConfigManager &operator=(const ConfigManager &) = delete;

            /**
             * @brief Load cấu hình từ file JSON
             * @param config_file Đường dẫn file cấu hình
             * @return true nếu load thành công
             */
            bool loadFromFile(const std::string &config_file);

            /**
             * @brief Save cấu hình ra file
             * @param config_file Đường dẫn file cấu hình
             * @return true nếu save thành công
             */
            bool saveToFile(const std::string &config_file) const;

            /**
             * @brief Load cấu hình từ JSON string
             * @param json_content Nội dung JSON
             * @return true nếu load thành công
             */
            bool loadFromJson(const std::string &json_content);

            /**
             * @brief Export cấu hình thành JSON string (dạng lồng nhau)
             */
            std::string exportToJson() const;

            // ==================== Set methods ====================
            bool setString(const std::string &key, const std::string &value);
            bool setInt(const std::string &key, int value);
            bool setDouble(const std::string &key, double value);
            bool setBool(const std::string &key, bool value);

            // ==================== Get methods ====================
            std::string getString(const std::string &key, const std::string &default_value = "") const;

            /**
             * @brief Get giá trị integer (chấp nhận cả giá trị double đã lưu)
             */
            int getInt(const std::string &key, int default_value = 0) const;

            bool getBool(const std::string &key, bool default_value = false) const;

            // ==================== Change notifications ====================
            /**
             * @brief Đăng ký callback khi giá trị của key thay đổi
             * @return ID dùng cho unregisterChangeCallback
             */
            uint64_t registerChangeCallback(const std::string &key, ConfigChangeCallback callback);
            bool unregisterChangeCallback(uint64_t callback_id);

        private:
            struct ChangeSubscription
            {
                std::string key;
                ConfigChangeCallback callback;
            };

            std::unordered_map<std::string, ConfigEntry> config_map_;

            std::map<uint64_t, ChangeSubscription> change_callbacks_;
            uint64_t next_callback_id_;

            void initializeDefaults();
            void setValidator(const std::string &key, std::function<bool(const std::any &)> validator);
            bool setValue(const std::string &key, const std::any &value, ConfigType type);
            void notifyChange(const std::string &key, const std::any &old_value, const std::any &new_value);
            bool isValidKey(const std::string &key) const;
        };

// ==================== Utility macros ====================
#define NETSIM_CONFIG_GET_STRING(cfg, key, default_val) (cfg).getString(key, default_val)
#define NETSIM_CONFIG_GET_INT(cfg, key, default_val) (cfg).getInt(key, default_val)
#define NETSIM_CONFIG_GET_BOOL(cfg, key, default_val) (cfg).getBool(key, default_val)

        // ==================== Predefined config keys ====================
        namespace ConfigKeys
        {
            // System settings
            constexpr const char *SYSTEM_LOG_LEVEL = "system.log_level";
            constexpr const char *SYSTEM_LOG_FILE = "system.log_file";
            constexpr const char *SYSTEM_LOG_MAX_SIZE = "system.log_max_size";

            // Switch settings
            constexpr const char *SWITCH_MAC_AGING_TIME = "switch.mac_aging_time";
            constexpr const char *SWITCH_MAC_TABLE_MAX = "switch.mac_table_max";

            // Router settings
            constexpr const char *ROUTER_DEFAULT_TTL = "router.default_ttl";
            constexpr const char *ROUTER_ARP_TIMEOUT = "router.arp_timeout";

            // NAT settings
            constexpr const char *NAT_TRANSLATION_TIMEOUT = "nat.translation_timeout";
            constexpr const char *NAT_PAT_PORT_MIN = "nat.pat_port_min";
            constexpr const char *NAT_PAT_PORT_MAX = "nat.pat_port_max";

            // OSPF settings
            constexpr const char *OSPF_HELLO_INTERVAL = "ospf.hello_interval";
            constexpr const char *OSPF_DEAD_INTERVAL = "ospf.dead_interval";
            constexpr const char *OSPF_RETRANSMIT_INTERVAL = "ospf.retransmit_interval";
            constexpr const char *OSPF_TRANSMIT_DELAY = "ospf.transmit_delay";

            // Capture settings
            constexpr const char *CAPTURE_ENABLED = "capture.enabled";
            constexpr const char *CAPTURE_FILE = "capture.file";

            // Simulation settings
            constexpr const char *SIM_MAX_DELIVERY_DEPTH = "simulation.max_delivery_depth";
        }

    } // namespace Common
} // namespace NetSim

#endif // NETSIM_CONFIG_MANAGER_HPP
