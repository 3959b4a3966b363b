#pragma once

#include "enums/TransactionSide.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace emulator::domain {

/**
 * @brief Строка сделки: статья, налог, сумма
 */
struct DealDetail {
    std::int64_t id = 0;
    std::int64_t accountItemId = 0;
    std::string accountItemName;
    int taxCode = 0;
    std::int64_t amount = 0;
    std::int64_t vat = 0;
    std::optional<std::string> description;
    std::optional<std::int64_t> itemId;
    std::optional<std::int64_t> sectionId;
};

/**
 * @brief Оплата по сделке (с какого счёта, когда, сколько)
 */
struct DealPayment {
    std::int64_t id = 0;
    std::string date;
    std::int64_t amount = 0;
    std::string fromWalletableType;     ///< Пустой: сопоставление только по дате и сумме
    std::int64_t fromWalletableId = 0;
};

/**
 * @brief Сделка: классифицированный доход или расход
 *
 * Инвариант: amount == Σ(detail.amount + detail.vat).
 */
struct Deal {
    std::int64_t id = 0;
    std::int64_t companyId = 0;
    std::string issueDate;
    std::optional<std::string> dueDate;
    TransactionSide type = TransactionSide::EXPENSE;
    std::vector<DealDetail> details;
    std::vector<DealPayment> payments;
    std::int64_t amount = 0;
    std::optional<std::string> refNumber;
    std::optional<std::int64_t> partnerId;
    Timestamp createdAt;
    Timestamp updatedAt;

    /**
     * @brief НДС строки: 10% (целочисленно) для облагаемых налоговых кодов, иначе 0
     */
    static std::int64_t computeVat(int taxCode, std::int64_t amount) {
        return taxCode != 0 ? amount / 10 : 0;
    }

    void recomputeAmount() {
        amount = 0;
        for (const auto& detail : details) {
            amount += detail.amount + detail.vat;
        }
    }
};

/**
 * @brief Строка сделки во входящем запросе (id и vat вычисляются сервисом)
 */
struct DealDetailInput {
    std::int64_t accountItemId = 0;
    int taxCode = 0;
    std::int64_t amount = 0;
    std::optional<std::string> description;
    std::optional<std::int64_t> itemId;
    std::optional<std::int64_t> sectionId;
};

/**
 * @brief Запрос на создание сделки
 */
struct DealDraft {
    std::int64_t companyId = 0;
    std::string issueDate;
    std::optional<std::string> dueDate;
    TransactionSide type = TransactionSide::EXPENSE;
    std::vector<DealDetailInput> details;
    std::vector<DealPayment> payments;  ///< id назначается сервисом
    std::optional<std::string> refNumber;
    std::optional<std::int64_t> partnerId;
};

/**
 * @brief Частичное обновление сделки
 */
struct DealUpdate {
    std::optional<std::string> issueDate;
    std::optional<std::string> dueDate;
    std::optional<std::vector<DealDetailInput>> details;
    std::optional<std::string> refNumber;
    std::optional<std::int64_t> partnerId;
};

} // namespace emulator::domain
