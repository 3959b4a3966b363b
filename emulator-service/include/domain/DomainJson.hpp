#pragma once

#include "Company.hpp"
#include "AccountItem.hpp"
#include "Walletable.hpp"
#include "WalletTxn.hpp"
#include "Deal.hpp"
#include "Journal.hpp"
#include "Receipt.hpp"
#include <nlohmann/json.hpp>

/**
 * @file DomainJson.hpp
 * @brief JSON-представление сущностей.
 *
 * Один и тот же формат используется и в ответах API, и для хранения записей
 * в IKeyValueStore. Необязательные поля отсутствуют в JSON, если не заданы.
 */
namespace emulator::domain {

namespace detail {

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

} // namespace detail

// ----------------------------------------------------------------------------
// Справочники
// ----------------------------------------------------------------------------

inline void to_json(nlohmann::json& j, const Company& c) {
    j = nlohmann::json{
        {"id", c.id},
        {"display_name", c.displayName},
        {"name", c.name},
        {"name_kana", c.nameKana}};
}

inline void to_json(nlohmann::json& j, const AccountItem& a) {
    j = nlohmann::json{
        {"id", a.id},
        {"name", a.name},
        {"account_category", a.accountCategory},
        {"default_tax_code", a.defaultTaxCode}};
}

inline void to_json(nlohmann::json& j, const Walletable& w) {
    j = nlohmann::json{
        {"id", w.id},
        {"name", w.name},
        {"type", w.type},
        {"last_balance", w.lastBalance},
        {"walletable_balance", w.walletableBalance}};
    detail::putOptional(j, "bank_id", w.bankId);
}

// ----------------------------------------------------------------------------
// WalletTxn
// ----------------------------------------------------------------------------

inline void to_json(nlohmann::json& j, const WalletTxn& t) {
    j = nlohmann::json{
        {"id", t.id},
        {"company_id", t.companyId},
        {"date", t.date},
        {"amount", t.amount},
        {"entry_side", toString(t.entrySide)},
        {"walletable_type", t.walletableType},
        {"walletable_id", t.walletableId},
        {"description", t.description},
        {"status", toString(t.status)},
        {"created_at", t.createdAt.toString()},
        {"updated_at", t.updatedAt.toString()}};
    detail::putOptional(j, "balance", t.balance);
    detail::putOptional(j, "deal_id", t.dealId);
}

inline void from_json(const nlohmann::json& j, WalletTxn& t) {
    t.id = j.at("id").get<std::int64_t>();
    t.companyId = j.at("company_id").get<std::int64_t>();
    t.date = j.at("date").get<std::string>();
    t.amount = j.at("amount").get<std::int64_t>();
    t.balance = detail::getOptional<std::int64_t>(j, "balance");
    t.entrySide = transactionSideFromString(j.at("entry_side").get<std::string>());
    t.walletableType = j.at("walletable_type").get<std::string>();
    t.walletableId = j.at("walletable_id").get<std::int64_t>();
    t.description = j.value("description", "");
    t.status = walletTxnStatusFromString(j.at("status").get<std::string>());
    t.dealId = detail::getOptional<std::int64_t>(j, "deal_id");
    t.createdAt = Timestamp::fromString(j.at("created_at").get<std::string>());
    t.updatedAt = Timestamp::fromString(j.at("updated_at").get<std::string>());
}

// ----------------------------------------------------------------------------
// Deal
// ----------------------------------------------------------------------------

inline void to_json(nlohmann::json& j, const DealDetail& d) {
    j = nlohmann::json{
        {"id", d.id},
        {"account_item_id", d.accountItemId},
        {"account_item_name", d.accountItemName},
        {"tax_code", d.taxCode},
        {"amount", d.amount},
        {"vat", d.vat}};
    detail::putOptional(j, "description", d.description);
    detail::putOptional(j, "item_id", d.itemId);
    detail::putOptional(j, "section_id", d.sectionId);
}

inline void from_json(const nlohmann::json& j, DealDetail& d) {
    d.id = j.at("id").get<std::int64_t>();
    d.accountItemId = j.at("account_item_id").get<std::int64_t>();
    d.accountItemName = j.value("account_item_name", "");
    d.taxCode = j.at("tax_code").get<int>();
    d.amount = j.at("amount").get<std::int64_t>();
    d.vat = j.at("vat").get<std::int64_t>();
    d.description = detail::getOptional<std::string>(j, "description");
    d.itemId = detail::getOptional<std::int64_t>(j, "item_id");
    d.sectionId = detail::getOptional<std::int64_t>(j, "section_id");
}

inline void to_json(nlohmann::json& j, const DealPayment& p) {
    j = nlohmann::json{
        {"id", p.id},
        {"date", p.date},
        {"amount", p.amount},
        {"from_walletable_type", p.fromWalletableType},
        {"from_walletable_id", p.fromWalletableId}};
}

inline void from_json(const nlohmann::json& j, DealPayment& p) {
    p.id = j.at("id").get<std::int64_t>();
    p.date = j.at("date").get<std::string>();
    p.amount = j.at("amount").get<std::int64_t>();
    p.fromWalletableType = j.value("from_walletable_type", "");
    p.fromWalletableId = j.value("from_walletable_id", static_cast<std::int64_t>(0));
}

inline void to_json(nlohmann::json& j, const Deal& d) {
    j = nlohmann::json{
        {"id", d.id},
        {"company_id", d.companyId},
        {"issue_date", d.issueDate},
        {"type", toString(d.type)},
        {"details", d.details},
        {"amount", d.amount},
        {"created_at", d.createdAt.toString()},
        {"updated_at", d.updatedAt.toString()}};
    if (!d.payments.empty()) {
        j["payments"] = d.payments;
    }
    detail::putOptional(j, "due_date", d.dueDate);
    detail::putOptional(j, "ref_number", d.refNumber);
    detail::putOptional(j, "partner_id", d.partnerId);
}

inline void from_json(const nlohmann::json& j, Deal& d) {
    d.id = j.at("id").get<std::int64_t>();
    d.companyId = j.at("company_id").get<std::int64_t>();
    d.issueDate = j.at("issue_date").get<std::string>();
    d.dueDate = detail::getOptional<std::string>(j, "due_date");
    d.type = transactionSideFromString(j.at("type").get<std::string>());
    d.details = j.at("details").get<std::vector<DealDetail>>();
    d.payments = j.value("payments", std::vector<DealPayment>{});
    d.amount = j.at("amount").get<std::int64_t>();
    d.refNumber = detail::getOptional<std::string>(j, "ref_number");
    d.partnerId = detail::getOptional<std::int64_t>(j, "partner_id");
    d.createdAt = Timestamp::fromString(j.at("created_at").get<std::string>());
    d.updatedAt = Timestamp::fromString(j.at("updated_at").get<std::string>());
}

// ----------------------------------------------------------------------------
// Journal
// ----------------------------------------------------------------------------

inline void to_json(nlohmann::json& j, const JournalDetail& d) {
    j = nlohmann::json{
        {"id", d.id},
        {"entry_type", toString(d.entryType)},
        {"account_item_id", d.accountItemId},
        {"account_item_name", d.accountItemName},
        {"tax_code", d.taxCode},
        {"amount", d.amount},
        {"vat", d.vat}};
    detail::putOptional(j, "partner_id", d.partnerId);
    detail::putOptional(j, "description", d.description);
}

inline void from_json(const nlohmann::json& j, JournalDetail& d) {
    d.id = j.at("id").get<std::int64_t>();
    d.entryType = entryTypeFromString(j.at("entry_type").get<std::string>());
    d.accountItemId = j.at("account_item_id").get<std::int64_t>();
    d.accountItemName = j.value("account_item_name", "");
    d.taxCode = j.at("tax_code").get<int>();
    d.partnerId = detail::getOptional<std::int64_t>(j, "partner_id");
    d.amount = j.at("amount").get<std::int64_t>();
    d.vat = j.at("vat").get<std::int64_t>();
    d.description = detail::getOptional<std::string>(j, "description");
}

inline void to_json(nlohmann::json& j, const Journal& jr) {
    j = nlohmann::json{
        {"id", jr.id},
        {"company_id", jr.companyId},
        {"issue_date", jr.issueDate},
        {"details", jr.details},
        {"created_at", jr.createdAt.toString()},
        {"updated_at", jr.updatedAt.toString()}};
}

inline void from_json(const nlohmann::json& j, Journal& jr) {
    jr.id = j.at("id").get<std::int64_t>();
    jr.companyId = j.at("company_id").get<std::int64_t>();
    jr.issueDate = j.at("issue_date").get<std::string>();
    jr.details = j.at("details").get<std::vector<JournalDetail>>();
    jr.createdAt = Timestamp::fromString(j.at("created_at").get<std::string>());
    jr.updatedAt = Timestamp::fromString(j.at("updated_at").get<std::string>());
}

// ----------------------------------------------------------------------------
// Receipt
// ----------------------------------------------------------------------------

inline void to_json(nlohmann::json& j, const Receipt& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"company_id", r.companyId},
        {"issue_date", r.issueDate},
        {"description", r.description},
        {"status", r.status},
        {"file_name", r.fileName},
        {"file_path", r.filePath},
        {"created_at", r.createdAt.toString()},
        {"updated_at", r.updatedAt.toString()}};
}

inline void from_json(const nlohmann::json& j, Receipt& r) {
    r.id = j.at("id").get<std::int64_t>();
    r.companyId = j.at("company_id").get<std::int64_t>();
    r.issueDate = j.at("issue_date").get<std::string>();
    r.description = j.value("description", "");
    r.status = j.value("status", "unconfirmed");
    r.fileName = j.value("file_name", "");
    r.filePath = j.value("file_path", "");
    r.createdAt = Timestamp::fromString(j.at("created_at").get<std::string>());
    r.updatedAt = Timestamp::fromString(j.at("updated_at").get<std::string>());
}

} // namespace emulator::domain
