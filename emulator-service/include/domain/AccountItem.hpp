#pragma once

#include <cstdint>
#include <string>

namespace emulator::domain {

/**
 * @brief Статья плана счетов (справочник)
 */
struct AccountItem {
    std::int64_t id = 0;
    std::string name;
    std::string accountCategory;    ///< asset, liability, equity, income, expense
    int defaultTaxCode = 0;
};

} // namespace emulator::domain
