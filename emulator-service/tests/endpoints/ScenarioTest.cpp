/**
 * @file ScenarioTest.cpp
 * @brief Сквозной сценарий через HTTP handlers на реальном хранилище
 *
 * token → wallet_txn → deal (сопоставление) → удаление сделки
 */

#include <gtest/gtest.h>

#include "adapters/primary/BearerAuthMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/api/DealsHandler.hpp"
#include "adapters/primary/api/JournalsHandler.hpp"
#include "adapters/primary/api/WalletTxnsHandler.hpp"
#include "adapters/primary/oauth/TokenHandler.hpp"
#include "adapters/secondary/persistence/InMemoryReferenceDataRepository.hpp"
#include "application/DealService.hpp"
#include "application/JournalService.hpp"
#include "application/TokenService.hpp"
#include "application/WalletTxnService.hpp"
#include "helpers/TestStore.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace emulator;
using namespace emulator::adapters::primary;

class ScenarioTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto referenceData = std::make_shared<adapters::secondary::persistence::InMemoryReferenceDataRepository>();
        auto walletTxnRepo = testStore_.repository<domain::WalletTxn>();

        auto tokenService = std::make_shared<application::TokenService>(
            testStore_.store, std::make_shared<settings::TokenSettings>(3600, 86400, 1));
        auto walletTxnService = std::make_shared<application::WalletTxnService>(walletTxnRepo, testStore_.unitOfWork);
        auto dealService = std::make_shared<application::DealService>(
            testStore_.repository<domain::Deal>(), referenceData, testStore_.unitOfWork,
            std::make_shared<application::SettlementEngine>(walletTxnRepo));
        auto journalService = std::make_shared<application::JournalService>(
            testStore_.repository<domain::Journal>(), referenceData, testStore_.unitOfWork);

        auto auth = std::make_shared<BearerAuthMiddleware>(tokenService);
        tokenHandler_ = std::make_shared<oauth::TokenHandler>(tokenService);
        walletTxns_ = std::make_shared<ChainHandler>(auth, std::make_shared<api::WalletTxnsHandler>(walletTxnService));
        deals_ = std::make_shared<ChainHandler>(auth, std::make_shared<api::DealsHandler>(dealService));
        journals_ = std::make_shared<ChainHandler>(auth, std::make_shared<api::JournalsHandler>(journalService));
    }

    std::string issueAccessToken()
    {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/oauth/token");
        req.setHeader("Content-Type", "application/x-www-form-urlencoded");
        req.setBody("grant_type=authorization_code&code=AUTH_CODE_test&client_id=app");
        SimpleResponse res;

        tokenHandler_->handle(req, res);

        EXPECT_EQ(res.getStatus(), 200);
        return parseJson(res.getBody())["access_token"].get<std::string>();
    }

    SimpleRequest createRequest(const std::string &method,
                                const std::string &path,
                                const std::string &token,
                                const std::string &body = "",
                                const std::string &pathPattern = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        if (!token.empty())
        {
            req.setHeader("Authorization", "Bearer " + token);
        }
        if (!body.empty())
        {
            req.setBody(body);
        }
        if (!pathPattern.empty())
        {
            req.setPathPattern(pathPattern);
        }
        return req;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    tests::TestStore testStore_;
    std::shared_ptr<IHttpHandler> tokenHandler_;
    std::shared_ptr<IHttpHandler> walletTxns_;
    std::shared_ptr<IHttpHandler> deals_;
    std::shared_ptr<IHttpHandler> journals_;
};

// ============================================================================
// ТЕСТЫ: авторизация
// ============================================================================

TEST_F(ScenarioTest, NoToken_Returns401)
{
    auto req = createRequest("GET", "/api/1/wallet_txns", "");
    SimpleResponse res;

    walletTxns_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(parseJson(res.getBody())["error"], "unauthorized");
}

TEST_F(ScenarioTest, UnknownToken_Returns401)
{
    auto req = createRequest("GET", "/api/1/deals", "not-issued");
    SimpleResponse res;

    deals_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
}

// ============================================================================
// ТЕСТЫ: сопоставление сделки со строкой выписки
// ============================================================================

TEST_F(ScenarioTest, DealSettlesWalletTxn_AndDeleteKeepsItSettled)
{
    std::string token = issueAccessToken();

    // 1. Строка выписки по карте
    nlohmann::json txnBody = {
        {"company_id", 1},
        {"date", "2024-03-10"},
        {"amount", -1100},
        {"walletable_type", "credit_card"},
        {"walletable_id", 2},
        {"description", "AMAZON.CO.JP"}};
    auto createTxn = createRequest("POST", "/api/1/wallet_txns", token, txnBody.dump());
    SimpleResponse createTxnRes;
    walletTxns_->handle(createTxn, createTxnRes);

    ASSERT_EQ(createTxnRes.getStatus(), 201);
    auto txn = parseJson(createTxnRes.getBody())["wallet_txn"];
    std::int64_t txnId = txn["id"].get<std::int64_t>();
    EXPECT_EQ(txn["status"], "unbooked");

    // 2. status=1 и status=unbooked дают одинаковый список
    auto byCode = createRequest("GET", "/api/1/wallet_txns", token);
    byCode.setQueryParam("company_id", "1");
    byCode.setQueryParam("status", "1");
    SimpleResponse byCodeRes;
    walletTxns_->handle(byCode, byCodeRes);

    auto byName = createRequest("GET", "/api/1/wallet_txns", token);
    byName.setQueryParam("company_id", "1");
    byName.setQueryParam("status", "unbooked");
    SimpleResponse byNameRes;
    walletTxns_->handle(byName, byNameRes);

    ASSERT_EQ(byCodeRes.getStatus(), 200);
    ASSERT_EQ(byNameRes.getStatus(), 200);
    EXPECT_EQ(parseJson(byCodeRes.getBody()), parseJson(byNameRes.getBody()));
    EXPECT_EQ(parseJson(byCodeRes.getBody())["wallet_txns"].size(), 1u);

    // 3. Сделка с оплатой той же картой в тот же день
    nlohmann::json dealBody = {
        {"company_id", 1},
        {"issue_date", "2024-03-10"},
        {"type", "expense"},
        {"details", {{{"account_item_id", 504}, {"tax_code", 136}, {"amount", 1000}}}},
        {"payments", {{{"date", "2024-03-10"}, {"amount", 1100}, {"from_walletable_type", "credit_card"}, {"from_walletable_id", 2}}}}};
    auto createDeal = createRequest("POST", "/api/1/deals", token, dealBody.dump());
    SimpleResponse createDealRes;
    deals_->handle(createDeal, createDealRes);

    ASSERT_EQ(createDealRes.getStatus(), 201);
    auto deal = parseJson(createDealRes.getBody())["deal"];
    std::int64_t dealId = deal["id"].get<std::int64_t>();
    EXPECT_EQ(deal["amount"], 1100);
    EXPECT_EQ(deal["details"][0]["account_item_name"], "消耗品費");

    auto getTxn = createRequest("GET", "/api/1/wallet_txns/" + std::to_string(txnId), token, "", "/api/1/wallet_txns/*");
    SimpleResponse getTxnRes;
    walletTxns_->handle(getTxn, getTxnRes);

    ASSERT_EQ(getTxnRes.getStatus(), 200);
    auto settled = parseJson(getTxnRes.getBody())["wallet_txn"];
    EXPECT_EQ(settled["status"], "settled");
    EXPECT_EQ(settled["deal_id"], dealId);

    // 4. Удаление сделки не возвращает строку в unbooked
    auto deleteDeal = createRequest("DELETE", "/api/1/deals/" + std::to_string(dealId), token, "", "/api/1/deals/*");
    SimpleResponse deleteDealRes;
    deals_->handle(deleteDeal, deleteDealRes);
    EXPECT_EQ(deleteDealRes.getStatus(), 204);

    auto getDeal = createRequest("GET", "/api/1/deals/" + std::to_string(dealId), token, "", "/api/1/deals/*");
    SimpleResponse getDealRes;
    deals_->handle(getDeal, getDealRes);
    EXPECT_EQ(getDealRes.getStatus(), 404);

    SimpleResponse afterDeleteRes;
    walletTxns_->handle(getTxn, afterDeleteRes);
    ASSERT_EQ(afterDeleteRes.getStatus(), 200);
    EXPECT_EQ(parseJson(afterDeleteRes.getBody())["wallet_txn"]["status"], "settled");
}

TEST_F(ScenarioTest, DealWithoutMatchingTxn_StillCreated)
{
    std::string token = issueAccessToken();

    nlohmann::json dealBody = {
        {"company_id", 1},
        {"issue_date", "2024-03-11"},
        {"type", "expense"},
        {"details", {{{"account_item_id", 505}, {"tax_code", 136}, {"amount", 3000}}}},
        {"payments", {{{"date", "2024-03-11"}, {"amount", 3300}, {"from_walletable_type", "bank_account"}, {"from_walletable_id", 1}}}}};
    auto req = createRequest("POST", "/api/1/deals", token, dealBody.dump());
    SimpleResponse res;

    deals_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    EXPECT_EQ(parseJson(res.getBody())["deal"]["amount"], 3300);
}

// ============================================================================
// ТЕСТЫ: /api/1/journals
// ============================================================================

TEST_F(ScenarioTest, Journals_CreateAndGet)
{
    std::string token = issueAccessToken();

    nlohmann::json body = {
        {"company_id", 1},
        {"issue_date", "2024-03-31"},
        {"details", {
            {{"entry_type", "debit"}, {"account_item_id", 504}, {"tax_code", 136}, {"amount", 5000}},
            {{"entry_type", "credit"}, {"account_item_id", 101}, {"tax_code", 0}, {"amount", 5000}}}}};
    auto create = createRequest("POST", "/api/1/journals", token, body.dump());
    SimpleResponse createRes;
    journals_->handle(create, createRes);

    ASSERT_EQ(createRes.getStatus(), 201);
    auto journal = parseJson(createRes.getBody())["journal"];
    ASSERT_EQ(journal["details"].size(), 2u);
    EXPECT_EQ(journal["details"][1]["account_item_name"], "現金");

    auto get = createRequest("GET", "/api/1/journals/" + std::to_string(journal["id"].get<std::int64_t>()),
                             token, "", "/api/1/journals/*");
    SimpleResponse getRes;
    journals_->handle(get, getRes);

    EXPECT_EQ(getRes.getStatus(), 200);
    EXPECT_EQ(parseJson(getRes.getBody())["journal"]["issue_date"], "2024-03-31");
}

TEST_F(ScenarioTest, Journals_NotFound_Returns404)
{
    std::string token = issueAccessToken();
    auto req = createRequest("GET", "/api/1/journals/999", token, "", "/api/1/journals/*");
    SimpleResponse res;

    journals_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(ScenarioTest, Journals_DeleteMethod_Returns405)
{
    std::string token = issueAccessToken();
    auto req = createRequest("DELETE", "/api/1/journals/1", token, "", "/api/1/journals/*");
    SimpleResponse res;

    journals_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

TEST_F(ScenarioTest, Journals_MissingDetails_Returns400)
{
    std::string token = issueAccessToken();
    auto req = createRequest("POST", "/api/1/journals", token, R"({"company_id":1,"issue_date":"2024-03-31"})");
    SimpleResponse res;

    journals_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error_description"], "Missing details");
}
