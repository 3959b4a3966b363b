#pragma once

#include <cstdint>
#include <string>

namespace emulator::domain {

/**
 * @brief Компания (справочник, неизменяем)
 */
struct Company {
    std::int64_t id = 0;
    std::string displayName;
    std::string name;       ///< Юридическое наименование
    std::string nameKana;
};

} // namespace emulator::domain
