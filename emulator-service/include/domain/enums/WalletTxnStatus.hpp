#pragma once

#include <string>
#include <stdexcept>

namespace emulator::domain {

/**
 * @brief Статус строки выписки
 *
 * UNBOOKED → SETTLED, обратного перехода нет.
 */
enum class WalletTxnStatus {
    UNBOOKED,   ///< Не сопоставлена со сделкой
    SETTLED     ///< Связана со сделкой
};

inline std::string toString(WalletTxnStatus status) {
    switch (status) {
        case WalletTxnStatus::UNBOOKED: return "unbooked";
        case WalletTxnStatus::SETTLED:  return "settled";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 *
 * Принимает и строковую форму, и числовой код API ("1" / "2").
 * @throws std::invalid_argument если строка не распознана
 */
inline WalletTxnStatus walletTxnStatusFromString(const std::string& str) {
    if (str == "unbooked" || str == "1") return WalletTxnStatus::UNBOOKED;
    if (str == "settled" || str == "2")  return WalletTxnStatus::SETTLED;
    throw std::invalid_argument("Unknown WalletTxnStatus: " + str);
}

} // namespace emulator::domain
