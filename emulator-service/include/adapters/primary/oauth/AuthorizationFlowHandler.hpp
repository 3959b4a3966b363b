// include/adapters/primary/oauth/AuthorizationFlowHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/oauth/LoginPages.hpp"
#include "ports/input/IAuthorizationFlowService.hpp"
#include "utils/FormUrlEncoded.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::primary::oauth
{

    /**
     * @brief HTML-страницы входа
     *
     * Endpoints:
     * - GET  /oauth/authorize          → шаг 1 (email + пароль)
     * - POST /oauth/authorize/login    → шаг 2 (одноразовый код)
     * - POST /oauth/authorize/2fa      → шаг 3 (согласие)
     * - POST /oauth/authorize/confirm  → код авторизации (302 на redirect_uri или страница с кодом)
     */
    class AuthorizationFlowHandler : public IHttpHandler
    {
    public:
        static constexpr const char *OOB_REDIRECT = "urn:ietf:wg:oauth:2.0:oob";

        explicit AuthorizationFlowHandler(std::shared_ptr<ports::input::IAuthorizationFlowService> flow)
            : flow_(std::move(flow))
        {
            std::cout << "[AuthorizationFlowHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string method = req.getMethod();
            std::string path = extractPath(req.getPath());

            if (method == "GET" && path == "/oauth/authorize")
            {
                handleStart(req, res);
            }
            else if (method == "POST" && path == "/oauth/authorize/login")
            {
                auto form = utils::FormUrlEncoded::parse(req.getBody());
                auto result = flow_->submitCredentials(form["session_id"], form["email"], form["password"]);
                if (result.success())
                    sendHtml(res, 200, LoginPages::secondFactor(result.session->sessionId));
                else
                    sendFailure(res, result, [&]()
                                { return LoginPages::credentials(form["session_id"], result.message); });
            }
            else if (method == "POST" && path == "/oauth/authorize/2fa")
            {
                auto form = utils::FormUrlEncoded::parse(req.getBody());
                auto result = flow_->submitSecondFactor(form["session_id"], form["otp"]);
                if (result.success())
                    sendHtml(res, 200, LoginPages::consent(result.session->sessionId, result.session->clientId));
                else
                    sendFailure(res, result, [&]()
                                { return LoginPages::secondFactor(form["session_id"], result.message); });
            }
            else if (method == "POST" && path == "/oauth/authorize/confirm")
            {
                auto form = utils::FormUrlEncoded::parse(req.getBody());
                auto result = flow_->confirmConsent(form["session_id"]);
                if (result.success())
                    sendCode(res, *result.session);
                else
                    sendFailure(res, result, [&]()
                                { return LoginPages::error(result.message); });
            }
            else
            {
                sendHtml(res, 404, LoginPages::error("Not found"));
            }
        }

    private:
        std::shared_ptr<ports::input::IAuthorizationFlowService> flow_;

        void handleStart(IRequest &req, IResponse &res)
        {
            auto session = flow_->startSession(
                req.getQueryParam("client_id").value_or(""),
                req.getQueryParam("redirect_uri").value_or(""),
                req.getQueryParam("state").value_or(""));
            sendHtml(res, 200, LoginPages::credentials(session.sessionId));
        }

        void sendCode(IResponse &res, const domain::AuthorizationSession &session)
        {
            const std::string &code = session.authorizationCode.value_or("");
            if (session.redirectUri.empty() || session.redirectUri == OOB_REDIRECT)
            {
                sendHtml(res, 200, LoginPages::code(code));
                return;
            }

            std::string location = session.redirectUri;
            location += (location.find('?') == std::string::npos) ? "?" : "&";
            location += "code=" + utils::FormUrlEncoded::encode(code);
            if (!session.state.empty())
            {
                location += "&state=" + utils::FormUrlEncoded::encode(session.state);
            }

            res.setHeader("Location", location);
            sendHtml(res, 302, "<a href=\"" + LoginPages::escape(location) + "\">Found</a>");
        }

        template <typename RenderRetry>
        void sendFailure(IResponse &res, const ports::input::FlowResult &result, RenderRetry renderRetry)
        {
            if (result.outcome == ports::input::FlowOutcome::INVALID_CREDENTIALS)
            {
                sendHtml(res, 401, renderRetry());
                return;
            }
            sendHtml(res, 400, LoginPages::error(result.message));
        }

        static void sendHtml(IResponse &res, int status, const std::string &html)
        {
            res.setResult(status, "text/html; charset=utf-8", html);
        }

        static std::string extractPath(const std::string &fullPath)
        {
            size_t pos = fullPath.find('?');
            return pos == std::string::npos ? fullPath : fullPath.substr(0, pos);
        }
    };

} // namespace emulator::adapters::primary::oauth
