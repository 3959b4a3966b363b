// include/adapters/primary/oauth/RevokeTokenHandler.hpp
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
     * @brief POST /oauth/revoke: отзыв access или refresh токена (form: token)
     *
     * Всегда 200, даже если токен неизвестен или не передан (RFC 7009).
     */
    class RevokeTokenHandler : public IHttpHandler
    {
    public:
        explicit RevokeTokenHandler(std::shared_ptr<ports::input::ITokenService> tokenService)
            : tokenService_(std::move(tokenService)) {}

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
                auto it = form.find("token");
                if (it != form.end() && !it->second.empty())
                {
                    tokenService_->revoke(it->second);
                }
                ApiResponses::sendJson(res, 200, nlohmann::json::object());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[RevokeTokenHandler] Error: " << e.what() << std::endl;
                ApiResponses::sendServerError(res, "Failed to revoke token");
            }
        }

    private:
        std::shared_ptr<ports::input::ITokenService> tokenService_;
    };

} // namespace emulator::adapters::primary::oauth
