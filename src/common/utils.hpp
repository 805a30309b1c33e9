// src/common/utils.hpp
#ifndef NETSIM_UTILS_HPP
#define NETSIM_UTILS_HPP

#include <string>
#include <vector>
#include <memory>
#include <sstream>
#include <iomanip>
#include <functional>
#include <cstdint>

namespace NetSim
{
    namespace Common
    {
        /**
         * @brief Lớp tiện ích chung cho hệ thống
         */
        class Utils
        {
        public:
            // ==================== String utilities ====================
            /**
             * @brief Tách chuỗi thành vector bằng delimiter
             * @param str Chuỗi cần tách
             * @param delimiter Ký tự phân cách
             * @return Vector chứa các phần đã tách
             */
            static std::vector<std::string> split(const std::string &str, char delimiter);

            /**
             * @brief Tách chuỗi theo khoảng trắng, bỏ qua token rỗng
             */
            static std::vector<std::string> tokenize(const std::string &str);

            /**
             * @brief Xóa khoảng trắng ở đầu và cuối chuỗi
             */
            static std::string trim(const std::string &str);
            static std::string trim(const std::string &str, const std::string &chars);

            static std::string toLowerCase(const std::string &str);
            static bool startsWith(const std::string &str, const std::string &prefix);
            static std::string join(const std::vector<std::string> &strings, const std::string &delimiter);

            /**
             * @brief Parse số nguyên không dấu, không ném exception
             * @param str Chuỗi cần parse
             * @param result Giá trị kết quả
             * @return true nếu toàn bộ chuỗi là số hợp lệ
             */
            static bool parseUnsigned(const std::string &str, uint32_t &result);

            // ==================== Formatting ====================
            /**
             * @brief Định dạng thời gian mô phỏng (ms) thành "HH:MM:SS.mmm"
             */
            static std::string formatSimTime(uint64_t time_ms);

        private:
            Utils() = default;
        };

        /**
         * @brief Singleton pattern template
         */
        template <typename T>
        class Singleton
        {
        public:
            /**
             * @brief Lấy instance duy nhất
             * @return Reference tới instance
             */
            static T &getInstance()
            {
                static T instance;
                return instance;
            }

        protected:
            Singleton() = default;
            virtual ~Singleton() = default;

        public:
            Singleton(const Singleton &) = delete;
            Singleton &operator=(const Singleton &) = delete;
            Singleton(Singleton &&) = delete;
            Singleton &operator=(Singleton &&) = delete;
        };

        /**
         * @brief Scope guard để thực hiện cleanup tự động
         */
        class ScopeGuard
        {
        public:
            explicit ScopeGuard(std::function<void()> cleanup_func);
            ~ScopeGuard();

            /**
             * @brief Hủy bỏ cleanup (sẽ không thực hiện khi destructor được gọi)
             */
            void dismiss();

        private:
            std::function<void()> cleanup_func_;
            bool dismissed_;
        };

    } // namespace Common
} // namespace NetSim

#endif // NETSIM_UTILS_HPP
