#pragma once

#include "ports/input/IDealService.hpp"
#include "ports/output/IRecordRepository.hpp"
#include "ports/output/IReferenceDataRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/SettlementEngine.hpp"
#include <memory>
#include <iostream>

namespace emulator::application {

/**
 * @brief Сервис сделок
 *
 * id сделки, её строк и оплат берутся из одной последовательности deals.
 * Запись сделки и закрытие строк выписки выполняются в одной транзакции.
 */
class DealService : public ports::input::IDealService {
public:
    DealService(
        std::shared_ptr<ports::output::IRecordRepository<domain::Deal>> deals,
        std::shared_ptr<ports::output::IReferenceDataRepository> referenceData,
        std::shared_ptr<ports::output::IUnitOfWork> unitOfWork,
        std::shared_ptr<SettlementEngine> settlement
    ) : deals_(std::move(deals))
      , referenceData_(std::move(referenceData))
      , unitOfWork_(std::move(unitOfWork))
      , settlement_(std::move(settlement))
    {
        std::cout << "[DealService] Created" << std::endl;
    }

    ports::input::DealCreationResult create(const domain::DealDraft& draft) override {
        ports::input::DealCreationResult result;
        domain::Deal& deal = result.deal;

        deal.companyId = draft.companyId;
        deal.issueDate = draft.issueDate;
        deal.dueDate = draft.dueDate;
        deal.type = draft.type;
        deal.refNumber = draft.refNumber;
        deal.partnerId = draft.partnerId;
        deal.createdAt = domain::Timestamp::now();
        deal.updatedAt = deal.createdAt;

        unitOfWork_->execute([&]() {
            deal.id = deals_->nextId();
            deal.details = buildDetails(draft.details);

            deal.payments = draft.payments;
            for (auto& payment : deal.payments) {
                payment.id = deals_->nextId();
            }

            deal.recomputeAmount();
            deals_->save(deal);

            result.settlements = settlement_->settle(deal);
        });

        std::cout << "[DealService] Created deal " << deal.id << " amount " << deal.amount
                  << " with " << deal.payments.size() << " payment(s)" << std::endl;
        for (const auto& outcome : result.settlements) {
            std::cout << "[DealService]   payment " << outcome.paymentId << ": "
                      << domain::toString(outcome.result) << std::endl;
        }
        return result;
    }

    std::optional<domain::Deal> getById(std::int64_t id) override {
        return deals_->findById(id);
    }

    std::vector<domain::Deal> list(std::optional<std::int64_t> companyId) override {
        return deals_->findAll([companyId](const domain::Deal& deal) {
            return !companyId || deal.companyId == *companyId;
        });
    }

    std::optional<domain::Deal> update(std::int64_t id, const domain::DealUpdate& changes) override {
        std::optional<domain::Deal> result;

        unitOfWork_->execute([&]() {
            auto deal = deals_->findById(id);
            if (!deal) {
                return;
            }
            if (changes.issueDate) {
                deal->issueDate = *changes.issueDate;
            }
            if (changes.dueDate) {
                deal->dueDate = *changes.dueDate;
            }
            if (changes.details) {
                deal->details = buildDetails(*changes.details);
                deal->recomputeAmount();
            }
            if (changes.refNumber) {
                deal->refNumber = *changes.refNumber;
            }
            if (changes.partnerId) {
                deal->partnerId = *changes.partnerId;
            }
            deal->updatedAt = domain::Timestamp::now();
            deals_->save(*deal);
            result = deal;
        });
        return result;
    }

    bool remove(std::int64_t id) override {
        bool removed = deals_->deleteById(id);
        if (removed) {
            std::cout << "[DealService] Deleted deal " << id << std::endl;
        }
        return removed;
    }

private:
    std::shared_ptr<ports::output::IRecordRepository<domain::Deal>> deals_;
    std::shared_ptr<ports::output::IReferenceDataRepository> referenceData_;
    std::shared_ptr<ports::output::IUnitOfWork> unitOfWork_;
    std::shared_ptr<SettlementEngine> settlement_;

    std::vector<domain::DealDetail> buildDetails(const std::vector<domain::DealDetailInput>& inputs) {
        std::vector<domain::DealDetail> details;
        details.reserve(inputs.size());

        for (const auto& input : inputs) {
            domain::DealDetail detail;
            detail.id = deals_->nextId();
            detail.accountItemId = input.accountItemId;
            detail.accountItemName = accountItemName(input.accountItemId);
            detail.taxCode = input.taxCode;
            detail.amount = input.amount;
            detail.vat = domain::Deal::computeVat(input.taxCode, input.amount);
            detail.description = input.description;
            detail.itemId = input.itemId;
            detail.sectionId = input.sectionId;
            details.push_back(std::move(detail));
        }
        return details;
    }

    std::string accountItemName(std::int64_t accountItemId) const {
        auto item = referenceData_->findAccountItem(accountItemId);
        return item ? item->name : "Account Item " + std::to_string(accountItemId);
    }
};

} // namespace emulator::application
