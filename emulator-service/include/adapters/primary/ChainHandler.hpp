// include/adapters/primary/ChainHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiResponses.hpp"
#include <memory>
#include <vector>
#include <iostream>

namespace emulator::adapters::primary
{

    /**
     * @brief Последовательная цепочка middleware + конечный handler.
     *
     * Middleware, пропускающий запрос дальше, оставляет статус 0.
     */
    class ChainHandler : public IHttpHandler
    {
    public:
        template <typename... Handlers>
        explicit ChainHandler(Handlers &&...handlers)
        {
            (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
        }

        void handle(IRequest &req, IResponse &res) override
        {
            res.setStatus(0);
            for (auto &h : handlers_)
            {
                h->handle(req, res);
                if (res.getStatus() != 0)
                    return;
            }

            // цепочка закончилась, а статус всё ещё 0: ни один handler не ответил
            std::cerr << "[ChainHandler] Error: middleware chain finished, but httpStatus is zero." << std::endl;
            ApiResponses::sendServerError(res, "Internal server error");
        }

    private:
        std::vector<std::shared_ptr<IHttpHandler>> handlers_;
    };

} // namespace emulator::adapters::primary
