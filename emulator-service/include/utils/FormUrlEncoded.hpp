#pragma once

#include <cctype>
#include <map>
#include <sstream>
#include <iomanip>
#include <string>

namespace emulator::utils {

/**
 * @brief Разбор и сборка application/x-www-form-urlencoded
 */
class FormUrlEncoded {
public:
    /**
     * @brief "a=1&b=x%20y" → {a: "1", b: "x y"}. Повторный ключ перезаписывает значение.
     */
    static std::map<std::string, std::string> parse(const std::string& body) {
        std::map<std::string, std::string> fields;

        size_t start = 0;
        while (start <= body.size()) {
            size_t end = body.find('&', start);
            if (end == std::string::npos) {
                end = body.size();
            }

            std::string pair = body.substr(start, end - start);
            if (!pair.empty()) {
                size_t eq = pair.find('=');
                if (eq == std::string::npos) {
                    fields[decode(pair)] = "";
                } else {
                    fields[decode(pair.substr(0, eq))] = decode(pair.substr(eq + 1));
                }
            }
            start = end + 1;
        }
        return fields;
    }

    static std::string decode(const std::string& value) {
        std::string out;
        out.reserve(value.size());

        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (c == '+') {
                out += ' ';
            } else if (c == '%' && i + 2 < value.size() &&
                       std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                       std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
                out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                out += c;
            }
        }
        return out;
    }

    static std::string encode(const std::string& value) {
        std::ostringstream ss;
        ss << std::hex << std::uppercase << std::setfill('0');

        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                ss << c;
            } else {
                ss << '%' << std::setw(2) << static_cast<int>(c);
            }
        }
        return ss.str();
    }
};

} // namespace emulator::utils
