/**
 * @file WalletTxnServiceTest.cpp
 * @brief Unit tests for WalletTxnService
 */

#include <gtest/gtest.h>
#include "application/WalletTxnService.hpp"
#include "helpers/TestStore.hpp"
#include <stdexcept>

using namespace emulator;
using namespace emulator::application;
using domain::WalletTxnStatus;

class WalletTxnServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_shared<WalletTxnService>(
            testStore_.repository<domain::WalletTxn>(), testStore_.unitOfWork);
    }

    domain::WalletTxn create(std::int64_t companyId, std::int64_t amount) {
        domain::WalletTxn draft;
        draft.companyId = companyId;
        draft.date = "2024-02-01";
        draft.amount = amount;
        draft.walletableType = "bank_account";
        draft.walletableId = 1;
        draft.description = "transfer";
        return service_->create(draft);
    }

    tests::TestStore testStore_;
    std::shared_ptr<WalletTxnService> service_;
};

TEST_F(WalletTxnServiceTest, Create_AlwaysUnbooked) {
    domain::WalletTxn draft;
    draft.companyId = 1;
    draft.date = "2024-02-01";
    draft.amount = -500;
    draft.walletableType = "wallet";
    draft.walletableId = 4;
    draft.status = WalletTxnStatus::SETTLED;
    draft.dealId = 77;

    auto created = service_->create(draft);

    EXPECT_GT(created.id, 0);
    EXPECT_EQ(created.status, WalletTxnStatus::UNBOOKED);
    EXPECT_FALSE(created.dealId.has_value());

    auto stored = service_->getById(created.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->amount, -500);
    EXPECT_EQ(stored->walletableType, "wallet");
}

TEST_F(WalletTxnServiceTest, List_FiltersByStatusAndCompany) {
    auto a = create(1, -100);
    create(1, -200);
    create(2, -300);

    domain::WalletTxnUpdate settle;
    settle.status = WalletTxnStatus::SETTLED;
    service_->update(a.id, settle);

    ports::input::WalletTxnFilter unbooked;
    unbooked.companyId = 1;
    unbooked.status = WalletTxnStatus::UNBOOKED;
    auto result = service_->list(unbooked);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].amount, -200);

    ports::input::WalletTxnFilter settled;
    settled.status = WalletTxnStatus::SETTLED;
    ASSERT_EQ(service_->list(settled).size(), 1u);
    EXPECT_EQ(service_->list(settled)[0].id, a.id);

    EXPECT_EQ(service_->list({}).size(), 3u);
}

TEST_F(WalletTxnServiceTest, Update_AppliesOnlyPresentFields) {
    auto txn = create(1, -100);

    domain::WalletTxnUpdate changes;
    changes.description = "renamed";
    auto updated = service_->update(txn.id, changes);

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->description, "renamed");
    EXPECT_EQ(updated->status, WalletTxnStatus::UNBOOKED);
    EXPECT_EQ(updated->amount, -100);
    EXPECT_FALSE(updated->updatedAt < txn.updatedAt);
}

TEST_F(WalletTxnServiceTest, Update_SettledBackToUnbooked_Rejected) {
    auto txn = create(1, -100);
    domain::WalletTxnUpdate settle;
    settle.status = WalletTxnStatus::SETTLED;
    settle.dealId = 42;
    ASSERT_TRUE(service_->update(txn.id, settle).has_value());

    domain::WalletTxnUpdate revert;
    revert.status = WalletTxnStatus::UNBOOKED;
    EXPECT_THROW(service_->update(txn.id, revert), std::invalid_argument);

    auto stored = service_->getById(txn.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, WalletTxnStatus::SETTLED);
    ASSERT_TRUE(stored->dealId.has_value());
    EXPECT_EQ(*stored->dealId, 42);
}

TEST_F(WalletTxnServiceTest, Update_UnbookedToUnbooked_Allowed) {
    auto txn = create(1, -100);
    domain::WalletTxnUpdate changes;
    changes.status = WalletTxnStatus::UNBOOKED;

    auto updated = service_->update(txn.id, changes);

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->status, WalletTxnStatus::UNBOOKED);
}

TEST_F(WalletTxnServiceTest, Update_Missing_ReturnsNullopt) {
    domain::WalletTxnUpdate changes;
    changes.description = "x";

    EXPECT_FALSE(service_->update(404, changes).has_value());
}

TEST_F(WalletTxnServiceTest, Remove_ThenNotFound) {
    auto txn = create(1, -100);

    EXPECT_TRUE(service_->remove(txn.id));
    EXPECT_FALSE(service_->getById(txn.id).has_value());
    EXPECT_FALSE(service_->remove(txn.id));
}
