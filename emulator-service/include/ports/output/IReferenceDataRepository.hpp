// include/ports/output/IReferenceDataRepository.hpp
#pragma once

#include "domain/Company.hpp"
#include "domain/AccountItem.hpp"
#include "domain/Walletable.hpp"
#include <optional>
#include <vector>

namespace emulator::ports::output
{

    /**
     * @brief Неизменяемые справочники: компании, план счетов, кошельки
     */
    class IReferenceDataRepository
    {
    public:
        virtual ~IReferenceDataRepository() = default;

        virtual std::vector<domain::Company> companies() const = 0;
        virtual std::vector<domain::AccountItem> accountItems() const = 0;
        virtual std::vector<domain::Walletable> walletables() const = 0;

        virtual std::optional<domain::AccountItem> findAccountItem(std::int64_t id) const = 0;
    };

} // namespace emulator::ports::output
