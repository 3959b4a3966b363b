#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace emulator::utils {

/**
 * @brief Часть multipart/form-data
 */
struct MultipartPart {
    std::string name;
    std::optional<std::string> fileName;   ///< Есть только у файловых частей
    std::string contentType;
    std::string data;
};

/**
 * @brief Разбор тела multipart/form-data (RFC 7578)
 *
 * Тело целиком находится в памяти, потоковый разбор не нужен.
 */
class MultipartParser {
public:
    /**
     * @brief Извлекает boundary из заголовка Content-Type
     * @throws std::invalid_argument если это не multipart/form-data или нет boundary
     */
    static std::string boundaryFrom(const std::string& contentType) {
        std::string lower = toLower(contentType);
        if (lower.find("multipart/form-data") != 0) {
            throw std::invalid_argument("Content-Type is not multipart/form-data");
        }

        size_t semi = contentType.find(';');
        auto params = parseParams(semi == std::string::npos ? "" : contentType.substr(semi + 1));
        auto it = params.find("boundary");
        if (it == params.end() || it->second.empty()) {
            throw std::invalid_argument("multipart boundary is missing");
        }
        return it->second;
    }

    /**
     * @throws std::invalid_argument если тело не соответствует формату
     */
    static std::vector<MultipartPart> parse(const std::string& body, const std::string& boundary) {
        const std::string delimiter = "--" + boundary;
        std::vector<MultipartPart> parts;

        size_t pos = body.find(delimiter);
        if (pos == std::string::npos) {
            throw std::invalid_argument("multipart boundary not found in body");
        }

        while (true) {
            pos += delimiter.size();
            if (body.compare(pos, 2, "--") == 0) {
                break;  // закрывающий разделитель
            }
            if (body.compare(pos, 2, "\r\n") != 0) {
                throw std::invalid_argument("malformed multipart delimiter line");
            }
            pos += 2;

            size_t headersEnd = body.find("\r\n\r\n", pos);
            if (headersEnd == std::string::npos) {
                throw std::invalid_argument("multipart part headers are not terminated");
            }

            MultipartPart part = parseHeaders(body.substr(pos, headersEnd - pos));

            size_t dataStart = headersEnd + 4;
            size_t next = body.find("\r\n" + delimiter, dataStart);
            if (next == std::string::npos) {
                throw std::invalid_argument("multipart part is not terminated");
            }
            part.data = body.substr(dataStart, next - dataStart);
            parts.push_back(std::move(part));

            pos = next + 2;
        }
        return parts;
    }

private:
    static MultipartPart parseHeaders(const std::string& block) {
        MultipartPart part;

        size_t start = 0;
        while (start < block.size()) {
            size_t end = block.find("\r\n", start);
            if (end == std::string::npos) {
                end = block.size();
            }
            std::string line = block.substr(start, end - start);
            start = end + 2;

            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string header = toLower(trim(line.substr(0, colon)));
            std::string value = trim(line.substr(colon + 1));

            if (header == "content-disposition") {
                size_t semi = value.find(';');
                auto params = parseParams(semi == std::string::npos ? "" : value.substr(semi + 1));
                part.name = params["name"];
                auto file = params.find("filename");
                if (file != params.end()) {
                    part.fileName = file->second;
                }
            } else if (header == "content-type") {
                part.contentType = value;
            }
        }

        if (part.name.empty()) {
            throw std::invalid_argument("multipart part without a name");
        }
        return part;
    }

    /**
     * @brief "a=1; b=\"x\"" → {a: "1", b: "x"}, ключи в нижнем регистре
     *
     * ';' внутри кавычек относится к значению.
     */
    static std::map<std::string, std::string> parseParams(const std::string& text) {
        std::map<std::string, std::string> params;

        size_t start = 0;
        while (start < text.size()) {
            size_t end = start;
            bool quoted = false;
            for (; end < text.size(); ++end) {
                if (text[end] == '"') {
                    quoted = !quoted;
                } else if (text[end] == ';' && !quoted) {
                    break;
                }
            }
            std::string item = trim(text.substr(start, end - start));
            start = end + 1;

            size_t eq = item.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            std::string key = toLower(trim(item.substr(0, eq)));
            std::string value = trim(item.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            params[key] = value;
        }
        return params;
    }

    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t");
        if (b == std::string::npos) {
            return "";
        }
        size_t e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
};

} // namespace emulator::utils
