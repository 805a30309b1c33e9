// src/common/logger.cpp
#include "logger.hpp"
#include <iostream>
#include <mutex>

namespace NetSim
{
    namespace Common
    {
        LoggerManager::LoggerManager()
            : global_level_(spdlog::level::info)
        {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(LoggerSettings{}.console_pattern);
            sinks_.push_back(console_sink);
        }

        LoggerManager::~LoggerManager()
        {
            flushAll();
        }

        std::shared_ptr<spdlog::logger> LoggerManager::getLogger(const std::string &name)
        {
            {
                std::shared_lock<std::shared_mutex> lock(loggers_mutex_);
                auto it = loggers_.find(name);
                if (it != loggers_.end())
                {
                    return it->second;
                }
            }

            std::unique_lock<std::shared_mutex> lock(loggers_mutex_);
            auto it = loggers_.find(name);
            if (it != loggers_.end())
            {
                return it->second;
            }

            auto logger = createLogger(name);
            loggers_[name] = logger;
            return logger;
        }

        std::shared_ptr<spdlog::logger> LoggerManager::createLogger(const std::string &name)
        {
            auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
            logger->set_level(global_level_);
            return logger;
        }

        bool LoggerManager::configure(const LoggerSettings &settings)
        {
            std::vector<spdlog::sink_ptr> new_sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(settings.console_pattern);
            new_sinks.push_back(console_sink);

            bool ok = true;
            if (!settings.log_file.empty())
            {
                try
                {
                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        settings.log_file, settings.max_file_size, settings.max_files);
                    file_sink->set_pattern(settings.file_pattern);
                    new_sinks.push_back(file_sink);
                }
                catch (const spdlog::spdlog_ex &ex)
                {
                    std::cerr << "Log file initialization failed: " << ex.what() << std::endl;
                    ok = false;
                }
            }

            std::unique_lock<std::shared_mutex> lock(loggers_mutex_);
            sinks_ = std::move(new_sinks);
            global_level_ = settings.level;

            // Loggers đã phát ra ngoài giữ nguyên shared_ptr, chỉ thay sinks
            for (auto &[name, logger] : loggers_)
            {
                logger->sinks() = sinks_;
                logger->set_level(global_level_);
            }
            return ok;
        }

        void LoggerManager::setGlobalLevel(spdlog::level::level_enum level)
        {
            std::unique_lock<std::shared_mutex> lock(loggers_mutex_);
            global_level_ = level;
            for (auto &[name, logger] : loggers_)
            {
                logger->set_level(level);
            }
        }

        spdlog::level::level_enum LoggerManager::getGlobalLevel() const
        {
            std::shared_lock<std::shared_mutex> lock(loggers_mutex_);
            return global_level_;
        }

        std::vector<std::string> LoggerManager::getAllLoggerNames() const
        {
            std::shared_lock<std::shared_mutex> lock(loggers_mutex_);
            std::vector<std::string> names;
            names.reserve(loggers_.size());
            for (const auto &[name, logger] : loggers_)
            {
                names.push_back(name);
            }
            return names;
        }

        void LoggerManager::flushAll()
        {
            std::shared_lock<std::shared_mutex> lock(loggers_mutex_);
            for (auto &[name, logger] : loggers_)
            {
                logger->flush();
            }
        }

        // ==================== Helper functions ====================

        spdlog::level::level_enum stringToLogLevel(const std::string &level_str)
        {
            std::string lower = Utils::toLowerCase(Utils::trim(level_str));
            if (lower == "trace")
                return spdlog::level::trace;
            if (lower == "debug")
                return spdlog::level::debug;
            if (lower == "warn" || lower == "warning")
                return spdlog::level::warn;
            if (lower == "error")
                return spdlog::level::err;
            if (lower == "critical" || lower == "fatal")
                return spdlog::level::critical;
            if (lower == "off")
                return spdlog::level::off;
            return spdlog::level::info;
        }

    } // namespace Common
} // namespace NetSim
