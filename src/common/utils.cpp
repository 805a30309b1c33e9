// src/common/utils.cpp
#include "utils.hpp"
#include <algorithm>
#include <cctype>

namespace NetSim
{
    namespace Common
    {
        // ==================== String utilities ====================
        std::vector<std::string> Utils::split(const std::string &str, char delimiter)
        {
            std::vector<std::string> tokens;
            std::stringstream ss(str);
            std::string token;

            while (std::getline(ss, token, delimiter))
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::vector<std::string> Utils::tokenize(const std::string &str)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(str);
            std::string token;

            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string Utils::trim(const std::string &str)
        {
            return trim(str, " \t\n\r\f\v");
        }

        std::string Utils::trim(const std::string &str, const std::string &chars)
        {
            size_t start = str.find_first_not_of(chars);
            if (start == std::string::npos)
                return "";

            size_t end = str.find_last_not_of(chars);
            return str.substr(start, end - start + 1);
        }

        std::string Utils::toLowerCase(const std::string &str)
        {
            std::string result = str;
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        bool Utils::startsWith(const std::string &str, const std::string &prefix)
        {
            return str.length() >= prefix.length() &&
                   str.compare(0, prefix.length(), prefix) == 0;
        }

        std::string Utils::join(const std::vector<std::string> &strings, const std::string &delimiter)
        {
            if (strings.empty())
                return "";

            std::stringstream ss;
            for (size_t i = 0; i < strings.size(); ++i)
            {
                if (i > 0)
                    ss << delimiter;
                ss << strings[i];
            }
            return ss.str();
        }

        bool Utils::parseUnsigned(const std::string &str, uint32_t &result)
        {
            if (str.empty() || str.size() > 10)
                return false;

            uint64_t value = 0;
            for (char c : str)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return false;
                value = value * 10 + static_cast<uint64_t>(c - '0');
            }

            if (value > 0xFFFFFFFFULL)
                return false;

            result = static_cast<uint32_t>(value);
            return true;
        }

        // ==================== Formatting ====================
        std::string Utils::formatSimTime(uint64_t time_ms)
        {
            uint64_t total_seconds = time_ms / 1000;
            std::ostringstream oss;
            oss << std::setfill('0')
                << std::setw(2) << (total_seconds / 3600) << ":"
                << std::setw(2) << ((total_seconds / 60) % 60) << ":"
                << std::setw(2) << (total_seconds % 60) << "."
                << std::setw(3) << (time_ms % 1000);
            return oss.str();
        }

        // ==================== ScopeGuard ====================
        ScopeGuard::ScopeGuard(std::function<void()> cleanup_func)
            : cleanup_func_(std::move(cleanup_func)), dismissed_(false)
        {
        }

        ScopeGuard::~ScopeGuard()
        {
            if (!dismissed_ && cleanup_func_)
            {
                cleanup_func_();
            }
        }

        void ScopeGuard::dismiss()
        {
            dismissed_ = true;
        }

    } // namespace Common
} // namespace NetSim
