// include/settings/LoginFlowSettings.hpp
#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>

namespace emulator::settings
{

    /**
     * @brief Фиксированные тестовые учётные данные для эмуляции входа
     */
    class LoginFlowSettings
    {
    public:
        LoginFlowSettings()
        {
            email_ = getEnvOrDefault("LOGIN_EMAIL", "test@example.com");
            password_ = getEnvOrDefault("LOGIN_PASSWORD", "password");
            otp_ = getEnvOrDefault("LOGIN_OTP", "123456");
            sessionTtl_ = std::stoll(getEnvOrDefault("LOGIN_SESSION_TTL", "600"));
        }

        LoginFlowSettings(std::string email, std::string password, std::string otp, std::int64_t sessionTtl)
            : email_(std::move(email)), password_(std::move(password)), otp_(std::move(otp)), sessionTtl_(sessionTtl)
        {
        }

        std::string getEmail() const { return email_; }
        std::string getPassword() const { return password_; }
        std::string getOtp() const { return otp_; }

        /**
         * @brief Время жизни незавершённой сессии входа, секунды
         */
        std::int64_t getSessionTtl() const { return sessionTtl_; }

    private:
        std::string email_;
        std::string password_;
        std::string otp_;
        std::int64_t sessionTtl_ = 600;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace emulator::settings
