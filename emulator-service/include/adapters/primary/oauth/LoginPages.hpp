// include/adapters/primary/oauth/LoginPages.hpp
#pragma once

#include <string>

namespace emulator::adapters::primary::oauth
{

    /**
     * @brief HTML-страницы эмулируемого входа (шаги 1-3 и страница с кодом)
     *
     * Разметка рассчитана на автоматизацию браузера: стабильные id полей
     * и id="auth-code" у выданного кода.
     */
    class LoginPages
    {
    public:
        static std::string credentials(const std::string &sessionId, const std::string &error = "")
        {
            std::string fields =
                "<label for=\"email\">メールアドレス</label>"
                "<input type=\"email\" id=\"email\" name=\"email\" required autofocus>"
                "<label for=\"password\">パスワード</label>"
                "<input type=\"password\" id=\"password\" name=\"password\" required>";
            return stepPage(1, "/oauth/authorize/login", "ログイン", sessionId, fields, error);
        }

        static std::string secondFactor(const std::string &sessionId, const std::string &error = "")
        {
            std::string fields =
                "<label for=\"otp\">確認コード (6桁)</label>"
                "<input type=\"text\" id=\"otp\" name=\"otp\" required autofocus maxlength=\"6\" placeholder=\"123456\">";
            return stepPage(2, "/oauth/authorize/2fa", "認証する", sessionId, fields, error);
        }

        static std::string consent(const std::string &sessionId, const std::string &clientId)
        {
            std::string fields =
                "<p>アプリケーション <strong>" + escape(clientId.empty() ? "unknown client" : clientId) +
                "</strong> があなたの会計データへのアクセスを求めています。</p>";
            return stepPage(3, "/oauth/authorize/confirm", "許可する", sessionId, fields, "");
        }

        static std::string code(const std::string &authorizationCode)
        {
            return layout("認証コード (Emulator)",
                          "<h1>認証が完了しました</h1>"
                          "<p>以下の認証コードをアプリケーションに入力してください。</p>"
                          "<div class=\"code\" id=\"auth-code\">" + escape(authorizationCode) + "</div>");
        }

        static std::string error(const std::string &message)
        {
            return layout("エラー (Emulator)",
                          "<h1>エラー</h1><p class=\"error\" id=\"error\">" + escape(message) + "</p>"
                          "<p><a href=\"/oauth/authorize\">最初からやり直す</a></p>");
        }

        static std::string escape(const std::string &text)
        {
            std::string out;
            out.reserve(text.size());
            for (char c : text)
            {
                switch (c)
                {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                case '\'': out += "&#39;"; break;
                default: out += c;
                }
            }
            return out;
        }

    private:
        static std::string stepPage(int step, const std::string &action, const std::string &button,
                                    const std::string &sessionId, const std::string &fields,
                                    const std::string &error)
        {
            std::string body =
                "<div class=\"step-indicator\">STEP " + std::to_string(step) + " / 3</div>";
            if (!error.empty())
            {
                body += "<p class=\"error\" id=\"error\">" + escape(error) + "</p>";
            }
            body += "<form method=\"POST\" action=\"" + action + "\">" + fields +
                    "<input type=\"hidden\" name=\"session_id\" value=\"" + escape(sessionId) + "\">"
                    "<button type=\"submit\">" + button + "</button></form>";
            return layout("ログイン (Emulator)", body);
        }

        static std::string layout(const std::string &title, const std::string &content)
        {
            return "<!DOCTYPE html><html lang=\"ja\"><head><meta charset=\"UTF-8\">"
                   "<title>" + title + "</title>"
                   "<style>"
                   "body{font-family:sans-serif;background:#f5f5f5;display:flex;justify-content:center;padding-top:60px}"
                   ".card{background:#fff;border-radius:8px;padding:32px;width:400px;box-shadow:0 2px 8px rgba(0,0,0,.1)}"
                   ".emulator-badge{background:#ff9800;color:#fff;padding:4px 8px;border-radius:4px;font-size:12px;display:inline-block}"
                   ".step-indicator{color:#888;font-size:12px;margin:12px 0}"
                   "label{display:block;margin-top:12px}input{width:100%;padding:8px;box-sizing:border-box}"
                   "button{margin-top:20px;width:100%;padding:10px;background:#2864f0;color:#fff;border:0;border-radius:4px}"
                   ".error{color:#d32f2f}.code{font-family:monospace;font-size:20px;background:#eee;padding:12px;word-break:break-all}"
                   "</style></head><body><div class=\"card\">"
                   "<div class=\"emulator-badge\">EMULATOR MODE</div>" +
                   content + "</div></body></html>";
        }
    };

} // namespace emulator::adapters::primary::oauth
