#pragma once

#include "enums/EntryType.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace emulator::domain {

/**
 * @brief Строка проводки
 */
struct JournalDetail {
    std::int64_t id = 0;
    EntryType entryType = EntryType::DEBIT;
    std::int64_t accountItemId = 0;
    std::string accountItemName;
    int taxCode = 0;
    std::optional<std::int64_t> partnerId;
    std::int64_t amount = 0;
    std::int64_t vat = 0;
    std::optional<std::string> description;
};

/**
 * @brief Ручная проводка по двойной записи
 *
 * Баланс дебета и кредита не проверяется: за него отвечает клиент.
 */
struct Journal {
    std::int64_t id = 0;
    std::int64_t companyId = 0;
    std::string issueDate;
    std::vector<JournalDetail> details;
    Timestamp createdAt;
    Timestamp updatedAt;

    std::int64_t total(EntryType side) const {
        std::int64_t sum = 0;
        for (const auto& detail : details) {
            if (detail.entryType == side) {
                sum += detail.amount;
            }
        }
        return sum;
    }

    bool isBalanced() const {
        return total(EntryType::DEBIT) == total(EntryType::CREDIT);
    }
};

} // namespace emulator::domain
