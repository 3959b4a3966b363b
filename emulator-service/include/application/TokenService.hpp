#pragma once

#include "ports/input/ITokenService.hpp"
#include "ports/output/IKeyValueStore.hpp"
#include "ports/output/Collections.hpp"
#include "settings/TokenSettings.hpp"
#include "domain/enums/TokenKind.hpp"
#include "domain/Timestamp.hpp"
#include "utils/TokenGenerator.hpp"
#include <memory>
#include <iostream>

namespace emulator::application {

/**
 * @brief Сервис токенов
 *
 * Токены хранятся в строковых коллекциях access_tokens / refresh_tokens:
 * ключ: сам токен, значение: {"expires_at": <unix seconds>}.
 * Фонового удаления истёкших токенов нет.
 */
class TokenService : public ports::input::ITokenService {
public:
    TokenService(
        std::shared_ptr<ports::output::IKeyValueStore> store,
        std::shared_ptr<settings::TokenSettings> settings
    ) : store_(std::move(store))
      , settings_(std::move(settings))
    {
        std::cout << "[TokenService] Created (access TTL " << settings_->getAccessTokenTtl()
                  << "s, refresh TTL " << settings_->getRefreshTokenTtl() << "s)" << std::endl;
    }

    std::string issueAccessToken() override {
        return issue(domain::TokenKind::ACCESS, settings_->getAccessTokenTtl());
    }

    std::string issueRefreshToken() override {
        return issue(domain::TokenKind::REFRESH, settings_->getRefreshTokenTtl());
    }

    ports::input::TokenPair issueTokenPair() override {
        ports::input::TokenPair pair;
        pair.accessToken = issueAccessToken();
        pair.refreshToken = issueRefreshToken();
        pair.expiresIn = settings_->getAccessTokenTtl();
        pair.companyId = settings_->getDefaultCompanyId();
        return pair;
    }

    bool validate(const std::string& token) override {
        return check(domain::TokenKind::ACCESS, token);
    }

    bool validateRefreshToken(const std::string& token) override {
        return check(domain::TokenKind::REFRESH, token);
    }

    void revoke(const std::string& token) override {
        if (token.empty()) {
            return;
        }
        store_->transaction([&]() {
            removeIfPresent(domain::TokenKind::ACCESS, token);
            removeIfPresent(domain::TokenKind::REFRESH, token);
        });
    }

private:
    std::shared_ptr<ports::output::IKeyValueStore> store_;
    std::shared_ptr<settings::TokenSettings> settings_;

    static const char* collectionFor(domain::TokenKind kind) {
        return kind == domain::TokenKind::ACCESS
            ? ports::output::collections::ACCESS_TOKENS
            : ports::output::collections::REFRESH_TOKENS;
    }

    std::string issue(domain::TokenKind kind, std::int64_t ttlSeconds) {
        std::string token = utils::TokenGenerator::generate();
        auto expiresAt = domain::Timestamp::now().addSeconds(ttlSeconds);

        store_->putString(collectionFor(kind), token, {{"expires_at", expiresAt.toUnixSeconds()}});

        std::cout << "[TokenService] Issued " << domain::toString(kind)
                  << " token, expires " << expiresAt.toString() << std::endl;
        return token;
    }

    bool check(domain::TokenKind kind, const std::string& token) {
        if (token.empty()) {
            return false;
        }

        bool valid = false;
        store_->transaction([&]() {
            nlohmann::json record;
            try {
                record = store_->getString(collectionFor(kind), token);
            } catch (const ports::output::RecordNotFound&) {
                return;
            }

            auto expiresAt = domain::Timestamp::fromUnixSeconds(
                record.value("expires_at", static_cast<std::int64_t>(0)));
            if (expiresAt < domain::Timestamp::now()) {
                store_->removeString(collectionFor(kind), token);
                std::cout << "[TokenService] Expired " << domain::toString(kind) << " token removed" << std::endl;
                return;
            }
            valid = true;
        });
        return valid;
    }

    void removeIfPresent(domain::TokenKind kind, const std::string& token) {
        try {
            store_->removeString(collectionFor(kind), token);
        } catch (const ports::output::RecordNotFound&) {
            // уже удалён
        }
    }
};

} // namespace emulator::application
