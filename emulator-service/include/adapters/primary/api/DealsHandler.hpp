// include/adapters/primary/api/DealsHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiResponses.hpp"
#include "ports/input/IDealService.hpp"
#include "domain/DomainJson.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::primary::api
{

    /**
     * @brief HTTP Handler сделок
     *
     * Endpoints:
     * - GET    /api/1/deals?company_id=  → список
     * - POST   /api/1/deals              → создать (оплаты закрывают строки выписки)
     * - GET    /api/1/deals/{id}         → по id
     * - PUT    /api/1/deals/{id}         → частичное обновление
     * - DELETE /api/1/deals/{id}         → удалить (закрытые строки выписки не откатываются)
     */
    class DealsHandler : public IHttpHandler
    {
    public:
        explicit DealsHandler(std::shared_ptr<ports::input::IDealService> service)
            : service_(std::move(service))
        {
            std::cout << "[DealsHandler] Created" << std::endl;
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

                auto id = ApiResponses::parseInt64(*idParam);
                if (!id)
                {
                    ApiResponses::sendInvalidParameter(res, "Invalid deal ID");
                    return;
                }

                if (method == "GET")
                    handleGet(res, *id);
                else if (method == "PUT")
                    handleUpdate(req, res, *id);
                else if (method == "DELETE")
                    handleDelete(res, *id);
                else
                    ApiResponses::sendMethodNotAllowed(res);
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
                std::cerr << "[DealsHandler] Error: " << e.what() << std::endl;
                ApiResponses::sendServerError(res, "Failed to process deal request");
            }
        }

    private:
        std::shared_ptr<ports::input::IDealService> service_;

        void handleList(IRequest &req, IResponse &res)
        {
            std::optional<std::int64_t> companyId;
            if (!ApiResponses::readOptionalId(req, res, "company_id", companyId))
                return;

            nlohmann::json response;
            response["deals"] = service_->list(companyId);
            ApiResponses::sendJson(res, 200, response);
        }

        void handleCreate(IRequest &req, IResponse &res)
        {
            auto body = nlohmann::json::parse(req.getBody());

            domain::DealDraft draft;
            draft.companyId = body.value("company_id", static_cast<std::int64_t>(0));
            draft.issueDate = body.value("issue_date", "");
            draft.dueDate = domain::detail::getOptional<std::string>(body, "due_date");
            draft.refNumber = domain::detail::getOptional<std::string>(body, "ref_number");
            draft.partnerId = domain::detail::getOptional<std::int64_t>(body, "partner_id");
            std::string type = body.value("type", "");

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
            if (type.empty())
            {
                ApiResponses::sendInvalidParameter(res, "Missing type");
                return;
            }
            draft.type = domain::transactionSideFromString(type);

            if (!body.contains("details") || !body["details"].is_array() || body["details"].empty())
            {
                ApiResponses::sendInvalidParameter(res, "Missing details");
                return;
            }
            draft.details = parseDetails(body["details"]);

            if (body.contains("payments") && body["payments"].is_array())
            {
                for (const auto &p : body["payments"])
                {
                    domain::DealPayment payment;
                    payment.date = p.value("date", "");
                    payment.amount = p.value("amount", static_cast<std::int64_t>(0));
                    payment.fromWalletableType = p.value("from_walletable_type", "");
                    payment.fromWalletableId = p.value("from_walletable_id", static_cast<std::int64_t>(0));
                    if (payment.date.empty())
                    {
                        ApiResponses::sendInvalidParameter(res, "Missing payment date");
                        return;
                    }
                    draft.payments.push_back(payment);
                }
            }

            auto result = service_->create(draft);

            nlohmann::json response;
            response["deal"] = result.deal;
            ApiResponses::sendJson(res, 201, response);
        }

        void handleGet(IResponse &res, std::int64_t id)
        {
            auto deal = service_->getById(id);
            if (!deal)
            {
                ApiResponses::sendNotFound(res, "Deal not found");
                return;
            }

            nlohmann::json response;
            response["deal"] = *deal;
            ApiResponses::sendJson(res, 200, response);
        }

        void handleUpdate(IRequest &req, IResponse &res, std::int64_t id)
        {
            auto body = nlohmann::json::parse(req.getBody());

            domain::DealUpdate changes;
            changes.issueDate = domain::detail::getOptional<std::string>(body, "issue_date");
            changes.dueDate = domain::detail::getOptional<std::string>(body, "due_date");
            changes.refNumber = domain::detail::getOptional<std::string>(body, "ref_number");
            changes.partnerId = domain::detail::getOptional<std::int64_t>(body, "partner_id");
            if (body.contains("details") && body["details"].is_array() && !body["details"].empty())
            {
                changes.details = parseDetails(body["details"]);
            }

            auto updated = service_->update(id, changes);
            if (!updated)
            {
                ApiResponses::sendNotFound(res, "Deal not found");
                return;
            }

            nlohmann::json response;
            response["deal"] = *updated;
            ApiResponses::sendJson(res, 200, response);
        }

        void handleDelete(IResponse &res, std::int64_t id)
        {
            if (!service_->remove(id))
            {
                ApiResponses::sendNotFound(res, "Deal not found");
                return;
            }
            ApiResponses::sendNoContent(res);
        }

        static std::vector<domain::DealDetailInput> parseDetails(const nlohmann::json &items)
        {
            std::vector<domain::DealDetailInput> details;
            for (const auto &d : items)
            {
                domain::DealDetailInput detail;
                detail.accountItemId = d.value("account_item_id", static_cast<std::int64_t>(0));
                detail.taxCode = d.value("tax_code", 0);
                detail.amount = d.value("amount", static_cast<std::int64_t>(0));
                detail.description = domain::detail::getOptional<std::string>(d, "description");
                detail.itemId = domain::detail::getOptional<std::int64_t>(d, "item_id");
                detail.sectionId = domain::detail::getOptional<std::int64_t>(d, "section_id");
                details.push_back(detail);
            }
            return details;
        }
    };

} // namespace emulator::adapters::primary::api
