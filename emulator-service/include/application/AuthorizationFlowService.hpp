#pragma once

#include "ports/input/IAuthorizationFlowService.hpp"
#include "settings/LoginFlowSettings.hpp"
#include "utils/TokenGenerator.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <iostream>

namespace emulator::application {

/**
 * @brief Машина состояний эмулируемого входа
 *
 * Сессии живут в памяти процесса и не переживают рестарт.
 * Переходы выполняются атомарно через ThreadSafeMap::update.
 * Сессия удаляется после выдачи кода; брошенные сессии старше
 * LoginFlowSettings::getSessionTtl() удаляются при старте новой.
 */
class AuthorizationFlowService : public ports::input::IAuthorizationFlowService {
public:
    explicit AuthorizationFlowService(std::shared_ptr<settings::LoginFlowSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[AuthorizationFlowService] Created" << std::endl;
    }

    domain::AuthorizationSession startSession(
        const std::string& clientId,
        const std::string& redirectUri,
        const std::string& state
    ) override {
        evictExpired();

        auto session = std::make_shared<domain::AuthorizationSession>();
        session->sessionId = utils::TokenGenerator::generateHex(16);
        session->clientId = clientId;
        session->redirectUri = redirectUri;
        session->state = state;
        session->step = domain::AuthorizationStep::AWAITING_CREDENTIALS;

        sessions_.insert(session->sessionId, session);
        std::cout << "[AuthorizationFlowService] Session started for client '" << clientId << "'" << std::endl;
        return *session;
    }

    ports::input::FlowResult submitCredentials(
        const std::string& sessionId,
        const std::string& email,
        const std::string& password
    ) override {
        bool valid = email == settings_->getEmail() && password == settings_->getPassword();
        return advance(sessionId,
                       domain::AuthorizationStep::AWAITING_CREDENTIALS,
                       domain::AuthorizationStep::AWAITING_SECOND_FACTOR,
                       valid, "Invalid email or password");
    }

    ports::input::FlowResult submitSecondFactor(const std::string& sessionId, const std::string& otp) override {
        return advance(sessionId,
                       domain::AuthorizationStep::AWAITING_SECOND_FACTOR,
                       domain::AuthorizationStep::AWAITING_CONSENT,
                       otp == settings_->getOtp(), "Invalid verification code");
    }

    ports::input::FlowResult confirmConsent(const std::string& sessionId) override {
        return advance(sessionId,
                       domain::AuthorizationStep::AWAITING_CONSENT,
                       domain::AuthorizationStep::CODE_ISSUED,
                       true, "");
    }

    std::optional<domain::AuthorizationSession> findSession(const std::string& sessionId) override {
        auto session = sessions_.find(sessionId);
        if (!session) {
            return std::nullopt;
        }
        return *session;
    }

private:
    std::shared_ptr<settings::LoginFlowSettings> settings_;
    ThreadSafeMap<std::string, domain::AuthorizationSession> sessions_;

    void evictExpired() {
        auto cutoff = domain::Timestamp::now().addSeconds(-settings_->getSessionTtl());
        size_t removed = sessions_.eraseIf([&cutoff](const domain::AuthorizationSession& s) {
            return s.createdAt < cutoff;
        });
        if (removed > 0) {
            std::cout << "[AuthorizationFlowService] Evicted " << removed << " abandoned session(s)" << std::endl;
        }
    }

    ports::input::FlowResult advance(
        const std::string& sessionId,
        domain::AuthorizationStep expected,
        domain::AuthorizationStep next,
        bool inputValid,
        const std::string& invalidMessage
    ) {
        using ports::input::FlowOutcome;

        FlowOutcome outcome = FlowOutcome::UNKNOWN_SESSION;
        sessions_.update(sessionId, [&](domain::AuthorizationSession& s) {
            if (s.step != expected) {
                outcome = FlowOutcome::WRONG_STEP;
                return false;
            }
            if (!inputValid) {
                outcome = FlowOutcome::INVALID_CREDENTIALS;
                return false;
            }
            s.step = next;
            if (next == domain::AuthorizationStep::CODE_ISSUED) {
                s.authorizationCode = "AUTH_CODE_" + utils::TokenGenerator::generateHex(8);
            }
            outcome = FlowOutcome::OK;
            return true;
        });

        ports::input::FlowResult result{outcome, findSession(sessionId), ""};
        switch (outcome) {
            case FlowOutcome::OK:
                std::cout << "[AuthorizationFlowService] Session -> " << domain::toString(next) << std::endl;
                if (next == domain::AuthorizationStep::CODE_ISSUED) {
                    sessions_.erase(sessionId);
                }
                break;
            case FlowOutcome::INVALID_CREDENTIALS:
                result.message = invalidMessage;
                break;
            case FlowOutcome::UNKNOWN_SESSION:
                result.message = "Unknown or expired login session";
                break;
            case FlowOutcome::WRONG_STEP:
                result.message = "Login step submitted out of order";
                break;
        }
        return result;
    }
};

} // namespace emulator::application
