// include/adapters/secondary/persistence/KvRecordRepository.hpp
#pragma once

#include "ports/output/IRecordRepository.hpp"
#include "ports/output/IKeyValueStore.hpp"
#include "ports/output/Collections.hpp"
#include "domain/DomainJson.hpp"
#include <memory>
#include <iostream>

namespace emulator::adapters::secondary::persistence
{

    /**
     * @brief Имя коллекции для типа сущности
     */
    template <typename T>
    struct RecordCollection;

    template <>
    struct RecordCollection<domain::WalletTxn>
    {
        static constexpr const char *name = ports::output::collections::WALLET_TXNS;
    };

    template <>
    struct RecordCollection<domain::Deal>
    {
        static constexpr const char *name = ports::output::collections::DEALS;
    };

    template <>
    struct RecordCollection<domain::Journal>
    {
        static constexpr const char *name = ports::output::collections::JOURNALS;
    };

    template <>
    struct RecordCollection<domain::Receipt>
    {
        static constexpr const char *name = ports::output::collections::RECEIPTS;
    };

    /**
     * @brief IRecordRepository поверх IKeyValueStore.
     *
     * Сущность хранится как JSON (см. DomainJson.hpp) под своим id.
     */
    template <typename T>
    class KvRecordRepository : public ports::output::IRecordRepository<T>
    {
    public:
        using Filter = typename ports::output::IRecordRepository<T>::Filter;

        explicit KvRecordRepository(std::shared_ptr<ports::output::IKeyValueStore> store)
            : store_(std::move(store))
        {
            std::cout << "[KvRecordRepository] Created for '" << RecordCollection<T>::name << "'" << std::endl;
        }

        std::int64_t nextId() override
        {
            return store_->nextId(RecordCollection<T>::name);
        }

        void save(const T &record) override
        {
            store_->put(RecordCollection<T>::name, record.id, nlohmann::json(record));
        }

        std::optional<T> findById(std::int64_t id) override
        {
            try
            {
                return store_->get(RecordCollection<T>::name, id).template get<T>();
            }
            catch (const ports::output::RecordNotFound &)
            {
                return std::nullopt;
            }
        }

        std::vector<T> findAll(const Filter &filter = nullptr) override
        {
            auto rows = store_->scan(RecordCollection<T>::name, [&filter](const nlohmann::json &j)
                                     { return !filter || filter(j.get<T>()); });

            std::vector<T> result;
            result.reserve(rows.size());
            for (const auto &row : rows)
            {
                result.push_back(row.template get<T>());
            }
            return result;
        }

        bool deleteById(std::int64_t id) override
        {
            try
            {
                store_->remove(RecordCollection<T>::name, id);
                return true;
            }
            catch (const ports::output::RecordNotFound &)
            {
                return false;
            }
        }

    private:
        std::shared_ptr<ports::output::IKeyValueStore> store_;
    };

} // namespace emulator::adapters::secondary::persistence
