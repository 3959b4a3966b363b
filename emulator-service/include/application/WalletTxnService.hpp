#pragma once

#include "ports/input/IWalletTxnService.hpp"
#include "ports/output/IRecordRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <stdexcept>
#include <iostream>

namespace emulator::application {

class WalletTxnService : public ports::input::IWalletTxnService {
public:
    WalletTxnService(
        std::shared_ptr<ports::output::IRecordRepository<domain::WalletTxn>> repository,
        std::shared_ptr<ports::output::IUnitOfWork> unitOfWork
    ) : repository_(std::move(repository))
      , unitOfWork_(std::move(unitOfWork))
    {
        std::cout << "[WalletTxnService] Created" << std::endl;
    }

    domain::WalletTxn create(const domain::WalletTxn& draft) override {
        domain::WalletTxn txn = draft;
        txn.status = domain::WalletTxnStatus::UNBOOKED;
        txn.dealId.reset();
        txn.createdAt = domain::Timestamp::now();
        txn.updatedAt = txn.createdAt;

        unitOfWork_->execute([&]() {
            txn.id = repository_->nextId();
            repository_->save(txn);
        });

        std::cout << "[WalletTxnService] Created wallet txn " << txn.id
                  << " (" << txn.walletableType << "/" << txn.walletableId
                  << ", " << txn.date << ", " << txn.amount << ")" << std::endl;
        return txn;
    }

    std::optional<domain::WalletTxn> getById(std::int64_t id) override {
        return repository_->findById(id);
    }

    std::vector<domain::WalletTxn> list(const ports::input::WalletTxnFilter& filter) override {
        return repository_->findAll([&filter](const domain::WalletTxn& txn) {
            if (filter.companyId && txn.companyId != *filter.companyId) {
                return false;
            }
            if (filter.status && txn.status != *filter.status) {
                return false;
            }
            return true;
        });
    }

    std::optional<domain::WalletTxn> update(std::int64_t id, const domain::WalletTxnUpdate& changes) override {
        std::optional<domain::WalletTxn> result;

        unitOfWork_->execute([&]() {
            auto txn = repository_->findById(id);
            if (!txn) {
                return;
            }
            if (changes.status) {
                if (*changes.status == domain::WalletTxnStatus::UNBOOKED && !txn->isUnbooked()) {
                    throw std::invalid_argument("Settled wallet transaction cannot return to unbooked");
                }
                txn->status = *changes.status;
            }
            if (changes.dealId) {
                txn->dealId = *changes.dealId;
            }
            if (changes.description) {
                txn->description = *changes.description;
            }
            txn->updatedAt = domain::Timestamp::now();
            repository_->save(*txn);
            result = txn;
        });
        return result;
    }

    bool remove(std::int64_t id) override {
        return repository_->deleteById(id);
    }

private:
    std::shared_ptr<ports::output::IRecordRepository<domain::WalletTxn>> repository_;
    std::shared_ptr<ports::output::IUnitOfWork> unitOfWork_;
};

} // namespace emulator::application
