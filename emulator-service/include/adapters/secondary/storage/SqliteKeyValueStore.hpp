// include/adapters/secondary/storage/SqliteKeyValueStore.hpp
#pragma once

#include "ports/output/IKeyValueStore.hpp"
#include "adapters/secondary/storage/SqliteDatabase.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace emulator::adapters::secondary::storage
{

    /**
     * @brief IKeyValueStore поверх одного файла SQLite.
     *
     * Каждая коллекция хранится в отдельной таблице kv_<name>, счётчики nextId живут
     * в общей таблице sequences и никогда не уменьшаются.
     * Все операции сериализуются рекурсивным мьютексом, поэтому вызовы
     * из work внутри transaction() присоединяются к открытой транзакции
     * (через SAVEPOINT).
     */
    class SqliteKeyValueStore : public ports::output::IKeyValueStore
    {
    public:
        /**
         * @throws ports::output::StorageError если файл нельзя открыть
         */
        explicit SqliteKeyValueStore(const std::string &path);
        ~SqliteKeyValueStore() override;

        void declareCollection(const std::string &collection, ports::output::KeyKind kind) override;
        std::int64_t nextId(const std::string &collection) override;

        void put(const std::string &collection, std::int64_t key, const nlohmann::json &value) override;
        nlohmann::json get(const std::string &collection, std::int64_t key) override;
        void remove(const std::string &collection, std::int64_t key) override;
        std::vector<nlohmann::json> scan(const std::string &collection, const Predicate &predicate) override;

        void putString(const std::string &collection, const std::string &key, const nlohmann::json &value) override;
        nlohmann::json getString(const std::string &collection, const std::string &key) override;
        void removeString(const std::string &collection, const std::string &key) override;

        void transaction(const std::function<void()> &work) override;

    private:
        std::unique_ptr<SqliteDatabase> db_;
        std::map<std::string, ports::output::KeyKind> collections_;
        std::recursive_mutex mutex_;
        int depth_ = 0;

        std::string tableFor(const std::string &collection, ports::output::KeyKind kind) const;
        nlohmann::json parseValue(const std::string &collection, const std::string &key, const std::string &text) const;
    };

} // namespace emulator::adapters::secondary::storage
