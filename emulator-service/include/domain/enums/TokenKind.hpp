#pragma once

#include <string>

namespace emulator::domain {

/**
 * @brief Вид токена. Каждый вид хранится в своей коллекции.
 */
enum class TokenKind {
    ACCESS,
    REFRESH
};

inline std::string toString(TokenKind kind) {
    switch (kind) {
        case TokenKind::ACCESS:  return "access";
        case TokenKind::REFRESH: return "refresh";
    }
    return "unknown";
}

} // namespace emulator::domain
