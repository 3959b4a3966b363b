#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace emulator::utils {

/**
 * @brief Генератор непрозрачных токенов
 *
 * Байты берутся из std::random_device (на Linux это /dev/urandom).
 */
class TokenGenerator {
public:
    /**
     * @brief Токен из 32 случайных байт в base64url без padding (43 символа)
     */
    static std::string generate() {
        return base64UrlEncode(randomBytes(32));
    }

    /**
     * @brief Короткий hex-идентификатор (временные файлы, id сессий)
     *
     * @param bytes Количество случайных байт (длина строки = 2 * bytes)
     */
    static std::string generateHex(size_t bytes) {
        std::string raw = randomBytes(bytes);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (unsigned char c : raw) {
            ss << std::setw(2) << static_cast<int>(c);
        }
        return ss.str();
    }

    static std::string base64UrlEncode(const std::string& data) {
        static const char* alphabet =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

        std::string out;
        out.reserve((data.size() + 2) / 3 * 4);

        size_t i = 0;
        while (i + 2 < data.size()) {
            uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                         (static_cast<unsigned char>(data[i + 1]) << 8) |
                         static_cast<unsigned char>(data[i + 2]);
            out += alphabet[(n >> 18) & 0x3F];
            out += alphabet[(n >> 12) & 0x3F];
            out += alphabet[(n >> 6) & 0x3F];
            out += alphabet[n & 0x3F];
            i += 3;
        }

        size_t rest = data.size() - i;
        if (rest == 1) {
            uint32_t n = static_cast<unsigned char>(data[i]) << 16;
            out += alphabet[(n >> 18) & 0x3F];
            out += alphabet[(n >> 12) & 0x3F];
        } else if (rest == 2) {
            uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                         (static_cast<unsigned char>(data[i + 1]) << 8);
            out += alphabet[(n >> 18) & 0x3F];
            out += alphabet[(n >> 12) & 0x3F];
            out += alphabet[(n >> 6) & 0x3F];
        }
        return out;
    }

private:
    static std::string randomBytes(size_t count) {
        thread_local std::random_device rd;
        std::uniform_int_distribution<int> dist(0, 255);

        std::string bytes(count, '\0');
        for (auto& b : bytes) {
            b = static_cast<char>(dist(rd));
        }
        return bytes;
    }
};

} // namespace emulator::utils
