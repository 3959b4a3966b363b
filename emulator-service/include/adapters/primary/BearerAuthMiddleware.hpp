// include/adapters/primary/BearerAuthMiddleware.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiResponses.hpp"
#include "ports/input/ITokenService.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::primary
{

    /**
     * @brief Проверка "Authorization: Bearer <token>" для /api/1/*
     *
     * Токен валиден → статус 0 (продолжить цепочку), иначе 401.
     */
    class BearerAuthMiddleware : public IHttpHandler
    {
    public:
        explicit BearerAuthMiddleware(std::shared_ptr<ports::input::ITokenService> tokenService)
            : tokenService_(std::move(tokenService))
        {
            std::cout << "[BearerAuthMiddleware] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            auto header = req.getHeader("Authorization");
            if (!header || header->empty())
            {
                ApiResponses::sendError(res, 401, "unauthorized", "Missing Authorization header");
                return;
            }

            const std::string prefix = "Bearer ";
            if (header->size() <= prefix.size() || header->compare(0, prefix.size(), prefix) != 0)
            {
                ApiResponses::sendError(res, 401, "unauthorized", "Invalid Authorization header format");
                return;
            }

            std::string token = header->substr(prefix.size());
            if (!tokenService_->validate(token))
            {
                ApiResponses::sendError(res, 401, "unauthorized", "Invalid or expired token");
                return;
            }

            res.setStatus(0); // для middleware
        }

    private:
        std::shared_ptr<ports::input::ITokenService> tokenService_;
    };

} // namespace emulator::adapters::primary
