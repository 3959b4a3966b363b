// include/adapters/secondary/persistence/InMemoryReferenceDataRepository.hpp
#pragma once

#include "ports/output/IReferenceDataRepository.hpp"
#include <iostream>

namespace emulator::adapters::secondary::persistence
{

    /**
     * @brief Справочники, заполненные при старте и не изменяемые во время работы
     */
    class InMemoryReferenceDataRepository : public ports::output::IReferenceDataRepository
    {
    public:
        InMemoryReferenceDataRepository()
        {
            seedCompanies();
            seedAccountItems();
            seedWalletables();
            std::cout << "[InMemoryReferenceDataRepository] Seeded " << accountItems_.size()
                      << " account items, " << walletables_.size() << " walletables" << std::endl;
        }

        std::vector<domain::Company> companies() const override { return companies_; }
        std::vector<domain::AccountItem> accountItems() const override { return accountItems_; }
        std::vector<domain::Walletable> walletables() const override { return walletables_; }

        std::optional<domain::AccountItem> findAccountItem(std::int64_t id) const override
        {
            for (const auto &item : accountItems_)
            {
                if (item.id == id)
                    return item;
            }
            return std::nullopt;
        }

    private:
        std::vector<domain::Company> companies_;
        std::vector<domain::AccountItem> accountItems_;
        std::vector<domain::Walletable> walletables_;

        void seedCompanies()
        {
            companies_.push_back({1, "Pigeonworks LLC", "合同会社Pigeonworks", "ゴウドウガイシャピジョンワークス"});
        }

        void seedAccountItems()
        {
            accountItems_ = {
                {101, "現金", "asset", 0},
                {102, "普通預金", "asset", 0},
                {103, "売掛金", "asset", 0},

                {201, "買掛金", "liability", 0},
                {202, "未払金", "liability", 0},
                {203, "クレジットカード", "liability", 0},

                {401, "売上高", "income", 21},

                {501, "仕入高", "expense", 136},
                {502, "新聞図書費", "expense", 136},
                {503, "研修費", "expense", 136},
                {504, "消耗品費", "expense", 136},
                {505, "通信費", "expense", 136},
                {506, "支払手数料", "expense", 136},
                {507, "旅費交通費", "expense", 136},
                {508, "接待交際費", "expense", 136},
                {509, "雑費", "expense", 136},
                {510, "広告宣伝費", "expense", 136},
                {511, "地代家賃", "expense", 136},
                {512, "水道光熱費", "expense", 136},
                {513, "保険料", "expense", 136},
                {514, "研究開発費", "expense", 136},
            };
        }

        void seedWalletables()
        {
            walletables_ = {
                {1, "GMOあおぞらネット銀行", "bank_account", 1, 1000000, 1000000},
                {2, "アメリカン・エキスプレス", "credit_card", std::nullopt, -50000, -50000},
                {3, "三井住友カード", "credit_card", std::nullopt, -30000, -30000},
                {4, "現金", "wallet", std::nullopt, 50000, 50000},
            };
        }
    };

} // namespace emulator::adapters::secondary::persistence
