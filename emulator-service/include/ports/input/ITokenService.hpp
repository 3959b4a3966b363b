#pragma once

#include <cstdint>
#include <string>

namespace emulator::ports::input {

/**
 * @brief Ответ token endpoint
 */
struct TokenPair {
    std::string accessToken;
    std::string refreshToken;
    std::int64_t expiresIn;     ///< TTL access token, секунды
    std::int64_t companyId;
};

/**
 * @brief Выпуск и проверка непрозрачных bearer / refresh токенов
 *
 * Истёкший токен удаляется лениво, при первой проверке после истечения.
 */
class ITokenService {
public:
    virtual ~ITokenService() = default;

    virtual std::string issueAccessToken() = 0;
    virtual std::string issueRefreshToken() = 0;

    /**
     * @brief Новая пара access + refresh и фиксированный company_id
     */
    virtual TokenPair issueTokenPair() = 0;

    /**
     * @brief Проверка access token
     * @return false если токена нет или он истёк (истёкший удаляется)
     */
    virtual bool validate(const std::string& token) = 0;

    virtual bool validateRefreshToken(const std::string& token) = 0;

    /**
     * @brief Удаляет токен любого вида. Идемпотентно.
     */
    virtual void revoke(const std::string& token) = 0;
};

} // namespace emulator::ports::input
