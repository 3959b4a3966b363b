#pragma once

#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace emulator::domain {

/**
 * @brief Шаги эмулируемого входа пользователя
 */
enum class AuthorizationStep {
    AWAITING_CREDENTIALS,
    AWAITING_SECOND_FACTOR,
    AWAITING_CONSENT,
    CODE_ISSUED
};

inline std::string toString(AuthorizationStep step) {
    switch (step) {
        case AuthorizationStep::AWAITING_CREDENTIALS:   return "awaiting_credentials";
        case AuthorizationStep::AWAITING_SECOND_FACTOR: return "awaiting_second_factor";
        case AuthorizationStep::AWAITING_CONSENT:       return "awaiting_consent";
        case AuthorizationStep::CODE_ISSUED:            return "code_issued";
    }
    return "unknown";
}

/**
 * @brief Сессия авторизации (живёт только в памяти процесса)
 */
struct AuthorizationSession {
    std::string sessionId;
    std::string clientId;
    std::string redirectUri;
    std::string state;
    AuthorizationStep step = AuthorizationStep::AWAITING_CREDENTIALS;
    std::optional<std::string> authorizationCode;
    Timestamp createdAt;
};

} // namespace emulator::domain
