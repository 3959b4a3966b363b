// include/adapters/primary/api/WalletablesHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiResponses.hpp"
#include "ports/input/IReferenceDataService.hpp"
#include "domain/DomainJson.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::primary::api
{

    /**
     * @brief GET /api/1/walletables?company_id=&type=
     */
    class WalletablesHandler : public IHttpHandler
    {
    public:
        explicit WalletablesHandler(std::shared_ptr<ports::input::IReferenceDataService> referenceData)
            : referenceData_(std::move(referenceData))
        {
            std::cout << "[WalletablesHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                ApiResponses::sendMethodNotAllowed(res);
                return;
            }

            std::optional<std::int64_t> companyId;
            if (!ApiResponses::readOptionalId(req, res, "company_id", companyId))
                return;
            if (!companyId)
            {
                ApiResponses::sendInvalidParameter(res, "company_id is required");
                return;
            }

            nlohmann::json response;
            response["walletables"] = referenceData_->getWalletables(*companyId, req.getQueryParam("type"));
            ApiResponses::sendJson(res, 200, response);
        }

    private:
        std::shared_ptr<ports::input::IReferenceDataService> referenceData_;
    };

} // namespace emulator::adapters::primary::api
