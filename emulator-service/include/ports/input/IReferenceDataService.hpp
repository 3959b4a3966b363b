#pragma once

#include "domain/Company.hpp"
#include "domain/AccountItem.hpp"
#include "domain/Walletable.hpp"
#include <optional>
#include <string>
#include <vector>

namespace emulator::ports::input {

/**
 * @brief Чтение справочников (companies, account_items, walletables)
 */
class IReferenceDataService {
public:
    virtual ~IReferenceDataService() = default;

    virtual std::vector<domain::Company> getCompanies() = 0;
    virtual std::vector<domain::AccountItem> getAccountItems(std::int64_t companyId) = 0;

    /**
     * @param type bank_account / credit_card / wallet, std::nullopt: все
     */
    virtual std::vector<domain::Walletable> getWalletables(std::int64_t companyId,
                                                           const std::optional<std::string>& type) = 0;
};

} // namespace emulator::ports::input
