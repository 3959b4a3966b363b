// include/adapters/primary/api/ReceiptsHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ApiResponses.hpp"
#include "ports/input/IReceiptService.hpp"
#include "domain/DomainJson.hpp"
#include "utils/MultipartParser.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::primary::api
{

    /**
     * @brief HTTP Handler файловых чеков
     *
     * Endpoints:
     * - GET    /api/1/receipts?company_id=  → список
     * - POST   /api/1/receipts              → multipart/form-data: company_id, issue_date, description, receipt (файл)
     * - GET    /api/1/receipts/{id}         → по id
     * - DELETE /api/1/receipts/{id}         → удалить запись и файл
     */
    class ReceiptsHandler : public IHttpHandler
    {
    public:
        static constexpr size_t MAX_UPLOAD_BYTES = 10 * 1024 * 1024;

        explicit ReceiptsHandler(std::shared_ptr<ports::input::IReceiptService> service)
            : service_(std::move(service))
        {
            std::cout << "[ReceiptsHandler] Created" << std::endl;
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
                    ApiResponses::sendInvalidParameter(res, "Invalid receipt ID");
                    return;
                }

                if (method == "GET")
                    handleGet(res, *id);
                else if (method == "DELETE")
                    handleDelete(res, *id);
                else
                    ApiResponses::sendMethodNotAllowed(res);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ReceiptsHandler] Error: " << e.what() << std::endl;
                ApiResponses::sendServerError(res, "Failed to process receipt request");
            }
        }

    private:
        std::shared_ptr<ports::input::IReceiptService> service_;

        void handleList(IRequest &req, IResponse &res)
        {
            std::optional<std::int64_t> companyId;
            if (!ApiResponses::readOptionalId(req, res, "company_id", companyId))
                return;

            nlohmann::json response;
            response["receipts"] = service_->list(companyId);
            ApiResponses::sendJson(res, 200, response);
        }

        void handleCreate(IRequest &req, IResponse &res)
        {
            if (req.getBody().size() > MAX_UPLOAD_BYTES)
            {
                ApiResponses::sendError(res, 413, "invalid_request", "Request body too large");
                return;
            }

            std::vector<utils::MultipartPart> parts;
            try
            {
                auto boundary = utils::MultipartParser::boundaryFrom(req.getHeader("Content-Type").value_or(""));
                parts = utils::MultipartParser::parse(req.getBody(), boundary);
            }
            catch (const std::invalid_argument &e)
            {
                ApiResponses::sendError(res, 400, "invalid_request", std::string("Failed to parse multipart form: ") + e.what());
                return;
            }

            domain::ReceiptUpload upload;
            bool hasFile = false;
            std::string companyIdText;
            for (auto &part : parts)
            {
                if (part.name == "company_id")
                    companyIdText = part.data;
                else if (part.name == "issue_date")
                    upload.issueDate = part.data;
                else if (part.name == "description")
                    upload.description = part.data;
                else if (part.name == "receipt" && part.fileName)
                {
                    upload.fileName = *part.fileName;
                    upload.content = std::move(part.data);
                    hasFile = true;
                }
            }

            auto companyId = ApiResponses::parseInt64(companyIdText);
            if (!companyId || *companyId == 0)
            {
                ApiResponses::sendInvalidParameter(res, "Missing or invalid company_id");
                return;
            }
            upload.companyId = *companyId;

            if (upload.issueDate.empty())
            {
                ApiResponses::sendInvalidParameter(res, "Missing issue_date");
                return;
            }
            if (!hasFile)
            {
                ApiResponses::sendInvalidParameter(res, "Missing receipt file");
                return;
            }

            auto receipt = service_->create(upload);

            nlohmann::json response;
            response["receipt"] = receipt;
            ApiResponses::sendJson(res, 201, response);
        }

        void handleGet(IResponse &res, std::int64_t id)
        {
            auto receipt = service_->getById(id);
            if (!receipt)
            {
                ApiResponses::sendNotFound(res, "Receipt not found");
                return;
            }

            nlohmann::json response;
            response["receipt"] = *receipt;
            ApiResponses::sendJson(res, 200, response);
        }

        void handleDelete(IResponse &res, std::int64_t id)
        {
            if (!service_->remove(id))
            {
                ApiResponses::sendNotFound(res, "Receipt not found");
                return;
            }
            ApiResponses::sendNoContent(res);
        }
    };

} // namespace emulator::adapters::primary::api
