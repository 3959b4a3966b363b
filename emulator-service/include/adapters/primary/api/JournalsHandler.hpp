// include/adapters/primary/api/JournalsHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiResponses.hpp"
#include "ports/input/IJournalService.hpp"
#include "domain/DomainJson.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::primary::api
{

    /**
     * @brief HTTP Handler ручных проводок
     *
     * Endpoints:
     * - GET  /api/1/journals?company_id=  → список
     * - POST /api/1/journals              → создать
     * - GET  /api/1/journals/{id}         → по id
     */
    class JournalsHandler : public IHttpHandler
    {
    public:
        explicit JournalsHandler(std::shared_ptr<ports::input::IJournalService> service)
            : service_(std::move(service))
        {
            std::cout << "[JournalsHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string method = req.getMethod();
            auto idParam = req.getPathParam(0);

            try
            {
                if (!idParam)
                {
                    if (method == "GET")
                        handleList(req, res);
                    else if (method == "POST")
                        handleCreate(req, res);
                    else
                        ApiResponses::sendMethodNotAllowed(res);
                    return;
                }

                if (method != "GET")
                {
                    ApiResponses::sendMethodNotAllowed(res);
                    return;
                }

                auto id = ApiResponses::parseInt64(*idParam);
                if (!id)
                {
                    ApiResponses::sendInvalidParameter(res, "Invalid journal ID");
                    return;
                }

                auto journal = service_->getById(*id);
                if (!journal)
                {
                    ApiResponses::sendNotFound(res, "Journal not found");
                    return;
                }

                nlohmann::json response;
                response["journal"] = *journal;
                ApiResponses::sendJson(res, 200, response);
            }
            catch (const nlohmann::json::exception &)
            {
                ApiResponses::sendError(res, 400, "invalid_request", "Failed to parse request body");
            }
            catch (const std::invalid_argument &e)
            {
                ApiResponses::sendInvalidParameter(res, e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[JournalsHandler] Error: " << e.what() << std::endl;
                ApiResponses::sendServerError(res, "Failed to process journal request");
            }
        }

    private:
        std::shared_ptr<ports::input::IJournalService> service_;

        void handleList(IRequest &req, IResponse &res)
        {
            std::optional<std::int64_t> companyId;
            if (!ApiResponses::readOptionalId(req, res, "company_id", companyId))
                return;

            nlohmann::json response;
            response["journals"] = service_->list(companyId);
            ApiResponses::sendJson(res, 200, response);
        }

        void handleCreate(IRequest &req, IResponse &res)
        {
            auto body = nlohmann::json::parse(req.getBody());

            domain::Journal draft;
            draft.companyId = body.value("company_id", static_cast<std::int64_t>(0));
            draft.issueDate = body.value("issue_date", "");

            if (draft.companyId == 0)
            {
                ApiResponses::sendInvalidParameter(res, "Missing company_id");
                return;
            }
            if (draft.issueDate.empty())
            {
                ApiResponses::sendInvalidParameter(res, "Missing issue_date");
                return;
            }
            if (!body.contains("details") || !body["details"].is_array() || body["details"].empty())
            {
                ApiResponses::sendInvalidParameter(res, "Missing details");
                return;
            }

            for (const auto &d : body["details"])
            {
                domain::JournalDetail detail;
                detail.entryType = domain::entryTypeFromString(d.value("entry_type", ""));
                detail.accountItemId = d.value("account_item_id", static_cast<std::int64_t>(0));
                detail.taxCode = d.value("tax_code", 0);
                detail.partnerId = domain::detail::getOptional<std::int64_t>(d, "partner_id");
                detail.amount = d.value("amount", static_cast<std::int64_t>(0));
                detail.vat = d.value("vat", static_cast<std::int64_t>(0));
                detail.description = domain::detail::getOptional<std::string>(d, "description");
                draft.details.push_back(detail);
            }

            auto created = service_->create(draft);

            nlohmann::json response;
            response["journal"] = created;
            ApiResponses::sendJson(res, 201, response);
        }
    };

} // namespace emulator::adapters::primary::api
