#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace emulator::domain {

/**
 * @brief Итог сопоставления одной оплаты сделки со строкой выписки
 */
enum class SettlementResult {
    SETTLED,    ///< Найдена ровно одна строка, она переведена в SETTLED
    NO_MATCH,   ///< Кандидатов нет
    AMBIGUOUS   ///< Кандидатов больше одного, ничего не изменено
};

inline std::string toString(SettlementResult result) {
    switch (result) {
        case SettlementResult::SETTLED:   return "settled";
        case SettlementResult::NO_MATCH:  return "no_match";
        case SettlementResult::AMBIGUOUS: return "ambiguous";
    }
    return "unknown";
}

struct SettlementOutcome {
    std::int64_t paymentId = 0;
    SettlementResult result = SettlementResult::NO_MATCH;
    std::optional<std::int64_t> walletTxnId;
    size_t candidates = 0;
};

} // namespace emulator::domain
