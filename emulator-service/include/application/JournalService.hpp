#pragma once

#include "ports/input/IJournalService.hpp"
#include "ports/output/IRecordRepository.hpp"
#include "ports/output/IReferenceDataRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <iostream>

namespace emulator::application {

class JournalService : public ports::input::IJournalService {
public:
    JournalService(
        std::shared_ptr<ports::output::IRecordRepository<domain::Journal>> journals,
        std::shared_ptr<ports::output::IReferenceDataRepository> referenceData,
        std::shared_ptr<ports::output::IUnitOfWork> unitOfWork
    ) : journals_(std::move(journals))
      , referenceData_(std::move(referenceData))
      , unitOfWork_(std::move(unitOfWork))
    {
        std::cout << "[JournalService] Created" << std::endl;
    }

    domain::Journal create(const domain::Journal& draft) override {
        domain::Journal journal = draft;
        journal.createdAt = domain::Timestamp::now();
        journal.updatedAt = journal.createdAt;

        for (auto& detail : journal.details) {
            auto item = referenceData_->findAccountItem(detail.accountItemId);
            detail.accountItemName = item ? item->name : "Account Item " + std::to_string(detail.accountItemId);
        }

        unitOfWork_->execute([&]() {
            journal.id = journals_->nextId();
            for (auto& detail : journal.details) {
                detail.id = journals_->nextId();
            }
            journals_->save(journal);
        });

        if (!journal.isBalanced()) {
            std::cout << "[JournalService] Journal " << journal.id << " is not balanced (debit "
                      << journal.total(domain::EntryType::DEBIT) << ", credit "
                      << journal.total(domain::EntryType::CREDIT) << ")" << std::endl;
        }
        return journal;
    }

    std::optional<domain::Journal> getById(std::int64_t id) override {
        return journals_->findById(id);
    }

    std::vector<domain::Journal> list(std::optional<std::int64_t> companyId) override {
        return journals_->findAll([companyId](const domain::Journal& journal) {
            return !companyId || journal.companyId == *companyId;
        });
    }

private:
    std::shared_ptr<ports::output::IRecordRepository<domain::Journal>> journals_;
    std::shared_ptr<ports::output::IReferenceDataRepository> referenceData_;
    std::shared_ptr<ports::output::IUnitOfWork> unitOfWork_;
};

} // namespace emulator::application
