#pragma once

#include <string>
#include <stdexcept>

namespace emulator::domain {

/**
 * @brief Доход или расход (тип сделки, сторона строки выписки)
 */
enum class TransactionSide {
    INCOME,
    EXPENSE
};

inline std::string toString(TransactionSide side) {
    switch (side) {
        case TransactionSide::INCOME:  return "income";
        case TransactionSide::EXPENSE: return "expense";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionSide transactionSideFromString(const std::string& str) {
    if (str == "income")  return TransactionSide::INCOME;
    if (str == "expense") return TransactionSide::EXPENSE;
    throw std::invalid_argument("Unknown TransactionSide: " + str);
}

} // namespace emulator::domain
