// include/adapters/primary/api/AccountItemsHandler.hpp
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
     * @brief GET /api/1/account_items?company_id= (company_id обязателен)
     */
    class AccountItemsHandler : public IHttpHandler
    {
    public:
        explicit AccountItemsHandler(std::shared_ptr<ports::input::IReferenceDataService> referenceData)
            : referenceData_(std::move(referenceData))
        {
            std::cout << "[AccountItemsHandler] Created" << std::endl;
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
            response["account_items"] = referenceData_->getAccountItems(*companyId);
            ApiResponses::sendJson(res, 200, response);
        }

    private:
        std::shared_ptr<ports::input::IReferenceDataService> referenceData_;
    };

} // namespace emulator::adapters::primary::api
