// include/adapters/primary/api/WalletTxnsHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiResponses.hpp"
#include "ports/input/IWalletTxnService.hpp"
#include "domain/DomainJson.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::primary::api
{

    /**
     * @brief HTTP Handler строк выписки
     *
     * Endpoints:
     * - GET    /api/1/wallet_txns?company_id=&status=  → список (status: 1|2|unbooked|settled)
     * - POST   /api/1/wallet_txns                      → создать (статус всегда unbooked)
     * - GET    /api/1/wallet_txns/{id}                 → по id
     * - PUT    /api/1/wallet_txns/{id}                 → частичное обновление (status, deal_id, description)
     * - DELETE /api/1/wallet_txns/{id}                 → удалить
     */
    class WalletTxnsHandler : public IHttpHandler
    {
    public:
        explicit WalletTxnsHandler(std::shared_ptr<ports::input::IWalletTxnService> service)
            : service_(std::move(service))
        {
            std::cout << "[WalletTxnsHandler] Created" << std::endl;
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
                    ApiResponses::sendInvalidParameter(res, "Invalid wallet transaction ID");
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
                std::cerr << "[WalletTxnsHandler] Error: " << e.what() << std::endl;
                ApiResponses::sendServerError(res, "Failed to process wallet transaction request");
            }
        }

    private:
        std::shared_ptr<ports::input::IWalletTxnService> service_;

        void handleList(IRequest &req, IResponse &res)
        {
            ports::input::WalletTxnFilter filter;
            if (!ApiResponses::readOptionalId(req, res, "company_id", filter.companyId))
                return;

            auto status = req.getQueryParam("status");
            if (status && !status->empty())
            {
                try
                {
                    filter.status = domain::walletTxnStatusFromString(*status);
                }
                catch (const std::invalid_argument &)
                {
                    ApiResponses::sendInvalidParameter(res, "Invalid status");
                    return;
                }
            }

            nlohmann::json response;
            response["wallet_txns"] = service_->list(filter);
            ApiResponses::sendJson(res, 200, response);
        }

        void handleCreate(IRequest &req, IResponse &res)
        {
            auto body = nlohmann::json::parse(req.getBody());

            domain::WalletTxn draft;
            draft.companyId = body.value("company_id", static_cast<std::int64_t>(0));
            draft.date = body.value("date", "");
            draft.amount = body.value("amount", static_cast<std::int64_t>(0));
            draft.balance = domain::detail::getOptional<std::int64_t>(body, "balance");
            draft.walletableType = body.value("walletable_type", "");
            draft.walletableId = body.value("walletable_id", static_cast<std::int64_t>(0));
            draft.description = body.value("description", "");

            if (draft.companyId == 0)
            {
                ApiResponses::sendInvalidParameter(res, "Missing company_id");
                return;
            }
            if (draft.date.empty())
            {
                ApiResponses::sendInvalidParameter(res, "Missing date");
                return;
            }
            if (draft.walletableType.empty())
            {
                ApiResponses::sendInvalidParameter(res, "Missing walletable_type");
                return;
            }

            // entry_side не передан: определяется знаком суммы
            std::string entrySide = body.value("entry_side", "");
            draft.entrySide = entrySide.empty()
                                  ? (draft.amount < 0 ? domain::TransactionSide::EXPENSE : domain::TransactionSide::INCOME)
                                  : domain::transactionSideFromString(entrySide);

            auto created = service_->create(draft);

            nlohmann::json response;
            response["wallet_txn"] = created;
            ApiResponses::sendJson(res, 201, response);
        }

        void handleGet(IResponse &res, std::int64_t id)
        {
            auto txn = service_->getById(id);
            if (!txn)
            {
                ApiResponses::sendNotFound(res, "Wallet transaction not found");
                return;
            }

            nlohmann::json response;
            response["wallet_txn"] = *txn;
            ApiResponses::sendJson(res, 200, response);
        }

        void handleUpdate(IRequest &req, IResponse &res, std::int64_t id)
        {
            auto body = nlohmann::json::parse(req.getBody());

            domain::WalletTxnUpdate changes;
            if (body.contains("status") && !body["status"].is_null())
            {
                const auto &status = body["status"];
                changes.status = domain::walletTxnStatusFromString(
                    status.is_string() ? status.get<std::string>() : status.dump());
            }
            changes.dealId = domain::detail::getOptional<std::int64_t>(body, "deal_id");
            changes.description = domain::detail::getOptional<std::string>(body, "description");

            auto updated = service_->update(id, changes);
            if (!updated)
            {
                ApiResponses::sendNotFound(res, "Wallet transaction not found");
                return;
            }

            nlohmann::json response;
            response["wallet_txn"] = *updated;
            ApiResponses::sendJson(res, 200, response);
        }

        void handleDelete(IResponse &res, std::int64_t id)
        {
            if (!service_->remove(id))
            {
                ApiResponses::sendNotFound(res, "Wallet transaction not found");
                return;
            }
            ApiResponses::sendNoContent(res);
        }
    };

} // namespace emulator::adapters::primary::api
