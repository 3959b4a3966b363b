#pragma once

#include "domain/Deal.hpp"
#include "domain/Settlement.hpp"
#include <optional>
#include <vector>

namespace emulator::ports::input {

/**
 * @brief Результат создания сделки
 */
struct DealCreationResult {
    domain::Deal deal;
    std::vector<domain::SettlementOutcome> settlements;  ///< По одному на оплату
};

/**
 * @brief Сделки (deals)
 */
class IDealService {
public:
    virtual ~IDealService() = default;

    /**
     * @brief Создаёт сделку и закрывает подходящие строки выписки
     *
     * Несовпадение оплаты со строками выписки не является ошибкой.
     */
    virtual DealCreationResult create(const domain::DealDraft& draft) = 0;

    virtual std::optional<domain::Deal> getById(std::int64_t id) = 0;
    virtual std::vector<domain::Deal> list(std::optional<std::int64_t> companyId) = 0;
    virtual std::optional<domain::Deal> update(std::int64_t id, const domain::DealUpdate& changes) = 0;

    /**
     * @brief Удаляет сделку. Закрытые ею строки выписки остаются SETTLED.
     */
    virtual bool remove(std::int64_t id) = 0;
};

} // namespace emulator::ports::input
