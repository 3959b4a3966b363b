#pragma once

#include "domain/Deal.hpp"
#include "domain/Settlement.hpp"
#include "domain/WalletTxn.hpp"
#include "ports/output/IRecordRepository.hpp"
#include <cstdlib>
#include <memory>
#include <vector>
#include <iostream>

namespace emulator::application {

/**
 * @brief Закрытие строк выписки сделкой
 *
 * Для каждой оплаты ищется неразнесённая строка выписки той же компании
 * с той же датой и той же суммой по модулю. Если в оплате указан кошелёк
 * (тип + id), он тоже должен совпасть. Закрывается строка, только если
 * кандидат ровно один.
 *
 * settle() должен вызываться внутри транзакции хранилища вместе
 * с сохранением сделки.
 */
class SettlementEngine {
public:
    explicit SettlementEngine(std::shared_ptr<ports::output::IRecordRepository<domain::WalletTxn>> walletTxns)
        : walletTxns_(std::move(walletTxns))
    {
        std::cout << "[SettlementEngine] Created" << std::endl;
    }

    std::vector<domain::SettlementOutcome> settle(const domain::Deal& deal) {
        std::vector<domain::SettlementOutcome> outcomes;
        outcomes.reserve(deal.payments.size());

        for (const auto& payment : deal.payments) {
            outcomes.push_back(settlePayment(deal, payment));
        }
        return outcomes;
    }

    static bool matches(const domain::WalletTxn& txn, std::int64_t companyId, const domain::DealPayment& payment) {
        if (!txn.isUnbooked() || txn.companyId != companyId || txn.date != payment.date) {
            return false;
        }
        if (std::llabs(txn.amount) != std::llabs(payment.amount)) {
            return false;
        }
        if (payment.fromWalletableType.empty()) {
            return true;
        }
        return txn.walletableType == payment.fromWalletableType &&
               txn.walletableId == payment.fromWalletableId;
    }

private:
    std::shared_ptr<ports::output::IRecordRepository<domain::WalletTxn>> walletTxns_;

    domain::SettlementOutcome settlePayment(const domain::Deal& deal, const domain::DealPayment& payment) {
        domain::SettlementOutcome outcome;
        outcome.paymentId = payment.id;

        auto candidates = walletTxns_->findAll([&](const domain::WalletTxn& txn) {
            return matches(txn, deal.companyId, payment);
        });
        outcome.candidates = candidates.size();

        if (candidates.empty()) {
            outcome.result = domain::SettlementResult::NO_MATCH;
            std::cout << "[SettlementEngine] Deal " << deal.id << " payment " << payment.id
                      << ": no unbooked wallet txn matches" << std::endl;
            return outcome;
        }
        if (candidates.size() > 1) {
            outcome.result = domain::SettlementResult::AMBIGUOUS;
            std::cout << "[SettlementEngine] Deal " << deal.id << " payment " << payment.id
                      << ": " << candidates.size() << " candidates, nothing settled" << std::endl;
            return outcome;
        }

        // Перечитываем строку в той же транзакции перед записью
        auto txn = walletTxns_->findById(candidates.front().id);
        if (!txn || !matches(*txn, deal.companyId, payment)) {
            outcome.result = domain::SettlementResult::NO_MATCH;
            return outcome;
        }

        txn->settle(deal.id);
        walletTxns_->save(*txn);

        outcome.result = domain::SettlementResult::SETTLED;
        outcome.walletTxnId = txn->id;
        std::cout << "[SettlementEngine] Wallet txn " << txn->id << " settled by deal " << deal.id << std::endl;
        return outcome;
    }
};

} // namespace emulator::application
