// src/common/logger.hpp
#ifndef NETSIM_LOGGER_HPP
#define NETSIM_LOGGER_HPP

#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <shared_mutex>

namespace NetSim
{
    namespace Common
    {
        /**
         * @brief Cấu hình chung cho tất cả loggers
         */
        struct LoggerSettings
        {
            spdlog::level::level_enum level = spdlog::level::info;
            std::string log_file;                                   // rỗng = chỉ console
            size_t max_file_size = 10 * 1024 * 1024;
            size_t max_files = 3;
            std::string console_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
            std::string file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v";
        };

        /**
         * @brief Logger Manager - Singleton quản lý các spdlog logger theo component
         *
         * Mỗi component (Switch, Router, OSPF, ...) có một logger riêng, dùng chung
         * một bộ sink (console + file tùy chọn).
         */
        class LoggerManager : public Singleton<LoggerManager>
        {
            friend class Singleton<LoggerManager>;

        public:
            /**
             * @brief Lấy logger theo tên, tạo mới nếu chưa có
             */
            std::shared_ptr<spdlog::logger> getLogger(const std::string &name);

            /**
             * @brief Áp dụng cấu hình mới cho tất cả loggers (tạo lại sinks)
             * @return false nếu không mở được file log
             */
            bool configure(const LoggerSettings &settings);

            /**
             * @brief Set global log level cho tất cả loggers
             */
            void setGlobalLevel(spdlog::level::level_enum level);

            spdlog::level::level_enum getGlobalLevel() const;

            /**
             * @brief Lấy tất cả logger names
             */
            std::vector<std::string> getAllLoggerNames() const;

            /**
             * @brief Flush tất cả loggers
             */
            void flushAll();

        protected:
            LoggerManager();
            ~LoggerManager() override;

        private:
            mutable std::shared_mutex loggers_mutex_;
            std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
            std::vector<spdlog::sink_ptr> sinks_;
            spdlog::level::level_enum global_level_;

            std::shared_ptr<spdlog::logger> createLogger(const std::string &name);
        };

        // ==================== Helper functions ====================

        /**
         * @brief Convert string ("debug", "warn", ...) to spdlog level, mặc định info
         */
        spdlog::level::level_enum stringToLogLevel(const std::string &level_str);

    } // namespace Common
} // namespace NetSim

// ==================== Convenience macros ====================

// Get logger instance
#define NETSIM_GET_LOGGER(name) NetSim::Common::LoggerManager::getInstance().getLogger(name)

// Get manager instance
#define NETSIM_LOG_MANAGER NetSim::Common::LoggerManager::getInstance()

#endif // NETSIM_LOGGER_HPP
