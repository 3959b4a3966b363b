#pragma once

#include "ports/input/IReferenceDataService.hpp"
#include "ports/output/IReferenceDataRepository.hpp"
#include <memory>
#include <iostream>

namespace emulator::application {

/**
 * @brief Справочники одной (эмулируемой) компании.
 *
 * companyId проверяется на уровне HTTP, данные одинаковы для любой компании.
 */
class ReferenceDataService : public ports::input::IReferenceDataService {
public:
    explicit ReferenceDataService(std::shared_ptr<ports::output::IReferenceDataRepository> repository)
        : repository_(std::move(repository))
    {
        std::cout << "[ReferenceDataService] Created" << std::endl;
    }

    std::vector<domain::Company> getCompanies() override {
        return repository_->companies();
    }

    std::vector<domain::AccountItem> getAccountItems(std::int64_t /*companyId*/) override {
        return repository_->accountItems();
    }

    std::vector<domain::Walletable> getWalletables(std::int64_t /*companyId*/,
                                                   const std::optional<std::string>& type) override {
        auto all = repository_->walletables();
        if (!type || type->empty()) {
            return all;
        }

        std::vector<domain::Walletable> filtered;
        for (const auto& w : all) {
            if (w.type == *type) {
                filtered.push_back(w);
            }
        }
        return filtered;
    }

private:
    std::shared_ptr<ports::output::IReferenceDataRepository> repository_;
};

} // namespace emulator::application
