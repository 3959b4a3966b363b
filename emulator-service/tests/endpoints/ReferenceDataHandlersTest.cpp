/**
 * @file ReferenceDataHandlersTest.cpp
 * @brief Тесты справочников: companies, account_items, walletables
 */

#include <gtest/gtest.h>

#include "adapters/primary/api/CompaniesHandler.hpp"
#include "adapters/primary/api/AccountItemsHandler.hpp"
#include "adapters/primary/api/WalletablesHandler.hpp"
#include "adapters/secondary/persistence/InMemoryReferenceDataRepository.hpp"
#include "application/ReferenceDataService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace emulator;
using namespace emulator::adapters::primary::api;

class ReferenceDataHandlersTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        service_ = std::make_shared<application::ReferenceDataService>(
            std::make_shared<adapters::secondary::persistence::InMemoryReferenceDataRepository>());
    }

    SimpleRequest createRequest(const std::string &path, const std::string &companyId = "")
    {
        SimpleRequest req;
        req.setMethod("GET");
        req.setPath(path);
        req.setHeader("Authorization", "Bearer valid-token");
        if (!companyId.empty())
        {
            req.setQueryParam("company_id", companyId);
        }
        return req;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<application::ReferenceDataService> service_;
};

// ============================================================================
// ТЕСТЫ: GET /api/1/companies
// ============================================================================

TEST_F(ReferenceDataHandlersTest, Companies_ReturnsSeededCompany)
{
    CompaniesHandler handler(service_);
    auto req = createRequest("/api/1/companies");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["companies"].size(), 1u);
    EXPECT_EQ(json["companies"][0]["id"], 1);
    EXPECT_TRUE(json["companies"][0].contains("display_name"));
}

// ============================================================================
// ТЕСТЫ: GET /api/1/account_items
// ============================================================================

TEST_F(ReferenceDataHandlersTest, AccountItems_ReturnsCatalog)
{
    AccountItemsHandler handler(service_);
    auto req = createRequest("/api/1/account_items", "1");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto items = parseJson(res.getBody())["account_items"];
    ASSERT_FALSE(items.empty());

    bool hasSupplies = false;
    for (const auto &item : items)
    {
        if (item["id"] == 504)
        {
            hasSupplies = true;
            EXPECT_EQ(item["account_category"], "expense");
            EXPECT_EQ(item["default_tax_code"], 136);
        }
    }
    EXPECT_TRUE(hasSupplies);
}

TEST_F(ReferenceDataHandlersTest, AccountItems_MissingCompany_Returns400)
{
    AccountItemsHandler handler(service_);
    auto req = createRequest("/api/1/account_items");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error_description"], "company_id is required");
}

// ============================================================================
// ТЕСТЫ: GET /api/1/walletables
// ============================================================================

TEST_F(ReferenceDataHandlersTest, Walletables_All)
{
    WalletablesHandler handler(service_);
    auto req = createRequest("/api/1/walletables", "1");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["walletables"].size(), 4u);
}

TEST_F(ReferenceDataHandlersTest, Walletables_FilterByType)
{
    WalletablesHandler handler(service_);
    auto req = createRequest("/api/1/walletables", "1");
    req.setQueryParam("type", "credit_card");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto list = parseJson(res.getBody())["walletables"];
    ASSERT_EQ(list.size(), 2u);
    for (const auto &w : list)
    {
        EXPECT_EQ(w["type"], "credit_card");
    }
}

TEST_F(ReferenceDataHandlersTest, Walletables_PostMethod_Returns405)
{
    WalletablesHandler handler(service_);
    auto req = createRequest("/api/1/walletables", "1");
    req.setMethod("POST");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
