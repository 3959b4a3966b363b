#pragma once

#include "enums/TransactionSide.hpp"
#include "enums/WalletTxnStatus.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace emulator::domain {

/**
 * @brief Строка выписки банка / карты / кошелька, ожидающая разнесения
 */
struct WalletTxn {
    std::int64_t id = 0;
    std::int64_t companyId = 0;
    std::string date;                       ///< YYYY-MM-DD
    std::int64_t amount = 0;                ///< Со знаком: расход отрицательный
    std::optional<std::int64_t> balance;
    TransactionSide entrySide = TransactionSide::EXPENSE;
    std::string walletableType;
    std::int64_t walletableId = 0;
    std::string description;
    WalletTxnStatus status = WalletTxnStatus::UNBOOKED;
    std::optional<std::int64_t> dealId;     ///< Сделка, которая закрыла строку
    Timestamp createdAt;
    Timestamp updatedAt;

    bool isUnbooked() const {
        return status == WalletTxnStatus::UNBOOKED;
    }

    /**
     * @brief Перевести в SETTLED и связать со сделкой
     */
    void settle(std::int64_t settledByDealId) {
        status = WalletTxnStatus::SETTLED;
        dealId = settledByDealId;
        updatedAt = Timestamp::now();
    }
};

/**
 * @brief Частичное обновление строки выписки: применяются только заданные поля
 */
struct WalletTxnUpdate {
    std::optional<WalletTxnStatus> status;
    std::optional<std::int64_t> dealId;
    std::optional<std::string> description;
};

} // namespace emulator::domain
