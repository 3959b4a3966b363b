#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace emulator::domain {

/**
 * @brief Банковский счёт, кредитная карта или наличные (справочник)
 */
struct Walletable {
    std::int64_t id = 0;
    std::string name;
    std::string type;                   ///< bank_account, credit_card, wallet
    std::optional<std::int64_t> bankId; ///< Только для bank_account
    std::int64_t lastBalance = 0;
    std::int64_t walletableBalance = 0;
};

} // namespace emulator::domain
