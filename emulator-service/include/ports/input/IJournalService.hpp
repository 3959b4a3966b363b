#pragma once

#include "domain/Journal.hpp"
#include <optional>
#include <vector>

namespace emulator::ports::input {

/**
 * @brief Ручные проводки (journals)
 */
class IJournalService {
public:
    virtual ~IJournalService() = default;

    /**
     * @brief Создаёт проводку. id строк и названия статей назначаются сервисом.
     */
    virtual domain::Journal create(const domain::Journal& draft) = 0;

    virtual std::optional<domain::Journal> getById(std::int64_t id) = 0;
    virtual std::vector<domain::Journal> list(std::optional<std::int64_t> companyId) = 0;
};

} // namespace emulator::ports::input
