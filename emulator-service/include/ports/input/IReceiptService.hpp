#pragma once

#include "domain/Receipt.hpp"
#include <optional>
#include <vector>

namespace emulator::ports::input {

/**
 * @brief Файловые чеки (receipts)
 */
class IReceiptService {
public:
    virtual ~IReceiptService() = default;

    /**
     * @brief Сохраняет файл и создаёт запись
     *
     * Файл получает имя <id>.pdf только после того, как запись создана.
     * При ошибке временный файл удаляется.
     */
    virtual domain::Receipt create(const domain::ReceiptUpload& upload) = 0;

    virtual std::optional<domain::Receipt> getById(std::int64_t id) = 0;
    virtual std::vector<domain::Receipt> list(std::optional<std::int64_t> companyId) = 0;

    /**
     * @brief Удаляет запись и (best effort) файл
     * @return false если записи нет
     */
    virtual bool remove(std::int64_t id) = 0;
};

} // namespace emulator::ports::input
