// include/adapters/primary/api/CompaniesHandler.hpp
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
     * @brief GET /api/1/companies
     */
    class CompaniesHandler : public IHttpHandler
    {
    public:
        explicit CompaniesHandler(std::shared_ptr<ports::input::IReferenceDataService> referenceData)
            : referenceData_(std::move(referenceData))
        {
            std::cout << "[CompaniesHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                ApiResponses::sendMethodNotAllowed(res);
                return;
            }

            nlohmann::json response;
            response["companies"] = referenceData_->getCompanies();
            ApiResponses::sendJson(res, 200, response);
        }

    private:
        std::shared_ptr<ports::input::IReferenceDataService> referenceData_;
    };

} // namespace emulator::adapters::primary::api
