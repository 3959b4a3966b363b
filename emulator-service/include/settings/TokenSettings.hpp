// include/settings/TokenSettings.hpp
#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>

namespace emulator::settings
{

    /**
     * @brief Время жизни токенов и company_id, который возвращает /oauth/token
     *
     * ACCESS_TOKEN_TTL, REFRESH_TOKEN_TTL задаются в секундах.
     * Нечисловое значение бросает std::invalid_argument при старте.
     */
    class TokenSettings
    {
    public:
        TokenSettings()
        {
            accessTokenTtl_ = std::stoll(getEnvOrDefault("ACCESS_TOKEN_TTL", "3600"));
            refreshTokenTtl_ = std::stoll(getEnvOrDefault("REFRESH_TOKEN_TTL", "2592000"));
            defaultCompanyId_ = std::stoll(getEnvOrDefault("DEFAULT_COMPANY_ID", "1"));
        }

        TokenSettings(std::int64_t accessTokenTtl, std::int64_t refreshTokenTtl, std::int64_t defaultCompanyId = 1)
            : accessTokenTtl_(accessTokenTtl),
              refreshTokenTtl_(refreshTokenTtl),
              defaultCompanyId_(defaultCompanyId) {}

        std::int64_t getAccessTokenTtl() const { return accessTokenTtl_; }
        std::int64_t getRefreshTokenTtl() const { return refreshTokenTtl_; }
        std::int64_t getDefaultCompanyId() const { return defaultCompanyId_; }

    private:
        std::int64_t accessTokenTtl_;
        std::int64_t refreshTokenTtl_;
        std::int64_t defaultCompanyId_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace emulator::settings
