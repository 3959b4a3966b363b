#pragma once

#include "domain/AuthorizationSession.hpp"
#include <optional>
#include <string>

namespace emulator::ports::input {

/**
 * @brief Итог шага авторизации
 */
enum class FlowOutcome {
    OK,
    INVALID_CREDENTIALS,    ///< Неверный логин/пароль или код
    UNKNOWN_SESSION,
    WRONG_STEP              ///< Шаг вызван не в своём состоянии
};

struct FlowResult {
    FlowOutcome outcome;
    std::optional<domain::AuthorizationSession> session;  ///< Состояние после шага
    std::string message;

    bool success() const { return outcome == FlowOutcome::OK; }
};

/**
 * @brief Эмуляция входа человека: логин/пароль → одноразовый код → согласие
 *
 * AWAITING_CREDENTIALS → AWAITING_SECOND_FACTOR → AWAITING_CONSENT → CODE_ISSUED.
 * Ошибка на любом шаге оставляет сессию в текущем состоянии.
 */
class IAuthorizationFlowService {
public:
    virtual ~IAuthorizationFlowService() = default;

    virtual domain::AuthorizationSession startSession(
        const std::string& clientId,
        const std::string& redirectUri,
        const std::string& state
    ) = 0;

    virtual FlowResult submitCredentials(
        const std::string& sessionId,
        const std::string& email,
        const std::string& password
    ) = 0;

    virtual FlowResult submitSecondFactor(const std::string& sessionId, const std::string& otp) = 0;

    /**
     * @brief Последний шаг: выпускает authorization code
     *
     * Код возвращается в FlowResult::session, сама сессия после этого удаляется.
     */
    virtual FlowResult confirmConsent(const std::string& sessionId) = 0;

    virtual std::optional<domain::AuthorizationSession> findSession(const std::string& sessionId) = 0;
};

} // namespace emulator::ports::input
