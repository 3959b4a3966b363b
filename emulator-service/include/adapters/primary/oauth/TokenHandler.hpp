// include/adapters/primary/oauth/TokenHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiResponses.hpp"
#include "ports/input/ITokenService.hpp"
#include "utils/FormUrlEncoded.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::primary::oauth
{

    /**
     * @brief POST /oauth/token
     *
     * Принимает любой grant_type (authorization_code, refresh_token,
     * client_credentials, ...) и всегда выдаёт новую пару токенов.
     * Для refresh_token предъявленный refresh token отзывается.
     */
    class TokenHandler : public IHttpHandler
    {
    public:
        explicit TokenHandler(std::shared_ptr<ports::input::ITokenService> tokenService)
            : tokenService_(std::move(tokenService))
        {
            std::cout << "[TokenHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                ApiResponses::sendMethodNotAllowed(res);
                return;
            }

            try
            {
                auto form = utils::FormUrlEncoded::parse(req.getBody());
                std::string grantType = valueOf(req, form, "grant_type");
                if (grantType.empty())
                {
                    ApiResponses::sendError(res, 400, "invalid_request", "Missing grant_type");
                    return;
                }

                if (grantType == "refresh_token")
                {
                    std::string presented = valueOf(req, form, "refresh_token");
                    if (tokenService_->validateRefreshToken(presented))
                    {
                        tokenService_->revoke(presented);
                    }
                }

                auto pair = tokenService_->issueTokenPair();

                nlohmann::json response;
                response["access_token"] = pair.accessToken;
                response["refresh_token"] = pair.refreshToken;
                response["token_type"] = "Bearer";
                response["expires_in"] = pair.expiresIn;
                response["company_id"] = pair.companyId;

                res.setHeader("Cache-Control", "no-store");
                ApiResponses::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[TokenHandler] Error: " << e.what() << std::endl;
                ApiResponses::sendServerError(res, "Failed to issue tokens");
            }
        }

    private:
        std::shared_ptr<ports::input::ITokenService> tokenService_;

        /**
         * @brief Поле формы, а если его нет, одноимённый query-параметр
         */
        static std::string valueOf(IRequest &req, const std::map<std::string, std::string> &form, const std::string &name)
        {
            auto it = form.find(name);
            if (it != form.end() && !it->second.empty())
                return it->second;
            return req.getQueryParam(name).value_or("");
        }
    };

} // namespace emulator::adapters::primary::oauth
