// include/adapters/primary/ApiResponses.hpp
#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace emulator::adapters::primary
{

    /**
     * @brief Общие функции HTTP-ответов API
     *
     * Ошибки отдаются в формате {"error": <code>, "error_description": <text>}.
     */
    class ApiResponses
    {
    public:
        static void sendJson(IResponse &res, int status, const nlohmann::json &body)
        {
            res.setResult(status, "application/json", body.dump());
        }

        static void sendError(IResponse &res, int status, const std::string &code, const std::string &description)
        {
            nlohmann::json error;
            error["error"] = code;
            error["error_description"] = description;
            res.setResult(status, "application/json", error.dump());
        }

        static void sendNoContent(IResponse &res)
        {
            res.setStatus(204);
            res.setBody("");
        }

        static void sendInvalidParameter(IResponse &res, const std::string &description)
        {
            sendError(res, 400, "invalid_parameter", description);
        }

        static void sendNotFound(IResponse &res, const std::string &description)
        {
            sendError(res, 404, "not_found", description);
        }

        static void sendMethodNotAllowed(IResponse &res)
        {
            sendError(res, 405, "method_not_allowed", "Method not allowed");
        }

        static void sendServerError(IResponse &res, const std::string &description)
        {
            sendError(res, 500, "server_error", description);
        }

        /**
         * @brief Строгий разбор десятичного int64 ("12", "-3"; не "12a", не "")
         */
        static std::optional<std::int64_t> parseInt64(const std::string &text)
        {
            if (text.empty())
                return std::nullopt;
            try
            {
                size_t pos = 0;
                long long value = std::stoll(text, &pos, 10);
                if (pos != text.size())
                    return std::nullopt;
                return static_cast<std::int64_t>(value);
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }

        /**
         * @brief Необязательный целочисленный query-параметр
         *
         * @return false (и ответ 400 уже записан), если параметр есть, но не число
         */
        static bool readOptionalId(IRequest &req, IResponse &res, const std::string &name,
                                   std::optional<std::int64_t> &out)
        {
            auto raw = req.getQueryParam(name);
            if (!raw || raw->empty())
            {
                out.reset();
                return true;
            }
            out = parseInt64(*raw);
            if (!out)
            {
                sendInvalidParameter(res, "Invalid " + name);
                return false;
            }
            return true;
        }
    };

} // namespace emulator::adapters::primary
