#include "adapters/secondary/storage/SqliteKeyValueStore.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace emulator::adapters::secondary::storage
{

    using ports::output::KeyKind;
    using ports::output::RecordNotFound;
    using ports::output::StorageError;
    using ports::output::UnknownCollection;

    namespace
    {
        /**
         * @brief BEGIN IMMEDIATE / SAVEPOINT с откатом в деструкторе, если не было commit()
         */
        class ScopedTransaction
        {
        public:
            ScopedTransaction(SqliteDatabase &db, int depth)
                : db_(db), savepoint_(depth > 0 ? "sp_" + std::to_string(depth) : "")
            {
                db_.exec(savepoint_.empty() ? "BEGIN IMMEDIATE;" : "SAVEPOINT " + savepoint_ + ";");
            }

            ~ScopedTransaction()
            {
                if (finished_)
                    return;
                try
                {
                    if (savepoint_.empty())
                        db_.exec("ROLLBACK;");
                    else
                        db_.exec("ROLLBACK TO " + savepoint_ + "; RELEASE " + savepoint_ + ";");
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[SqliteKeyValueStore] Rollback failed: " << e.what() << std::endl;
                }
            }

            void commit()
            {
                db_.exec(savepoint_.empty() ? "COMMIT;" : "RELEASE " + savepoint_ + ";");
                finished_ = true;
            }

        private:
            SqliteDatabase &db_;
            std::string savepoint_;
            bool finished_ = false;
        };

        struct DepthGuard
        {
            explicit DepthGuard(int &depth) : depth_(depth) { ++depth_; }
            ~DepthGuard() { --depth_; }
            int &depth_;
        };

        bool isValidName(const std::string &name)
        {
            return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c)
                                                { return std::islower(c) || std::isdigit(c) || c == '_'; });
        }
    } // namespace

    SqliteKeyValueStore::SqliteKeyValueStore(const std::string &path)
        : db_(std::make_unique<SqliteDatabase>(path))
    {
        db_->exec("CREATE TABLE IF NOT EXISTS sequences (collection TEXT PRIMARY KEY, value INTEGER NOT NULL);");
        std::cout << "[SqliteKeyValueStore] Created" << std::endl;
    }

    SqliteKeyValueStore::~SqliteKeyValueStore()
    {
        std::cout << "[SqliteKeyValueStore] Closing" << std::endl;
    }

    void SqliteKeyValueStore::declareCollection(const std::string &collection, KeyKind kind)
    {
        if (!isValidName(collection))
        {
            throw StorageError("invalid collection name '" + collection + "'");
        }

        std::lock_guard<std::recursive_mutex> lock(mutex_);

        std::string ddl = kind == KeyKind::Integer
                              ? "CREATE TABLE IF NOT EXISTS kv_" + collection + " (id INTEGER PRIMARY KEY, value TEXT NOT NULL);"
                              : "CREATE TABLE IF NOT EXISTS kv_" + collection + " (key TEXT PRIMARY KEY, value TEXT NOT NULL);";
        db_->exec(ddl);
        collections_[collection] = kind;

        std::cout << "[SqliteKeyValueStore] Collection '" << collection << "' ready" << std::endl;
    }

    std::int64_t SqliteKeyValueStore::nextId(const std::string &collection)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        tableFor(collection, KeyKind::Integer);

        std::int64_t id = 0;
        transaction([&]()
        {
            SqliteStatement upsert(*db_,
                                   "INSERT INTO sequences(collection, value) VALUES(?, 1) "
                                   "ON CONFLICT(collection) DO UPDATE SET value = value + 1;");
            upsert.bind(1, collection);
            upsert.step();

            SqliteStatement select(*db_, "SELECT value FROM sequences WHERE collection = ?;");
            select.bind(1, collection);
            if (!select.step())
            {
                throw StorageError("sequence for '" + collection + "' vanished");
            }
            id = select.columnInt64(0);
        });
        return id;
    }

    void SqliteKeyValueStore::put(const std::string &collection, std::int64_t key, const nlohmann::json &value)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        SqliteStatement stmt(*db_, "INSERT OR REPLACE INTO " + tableFor(collection, KeyKind::Integer) + " (id, value) VALUES(?, ?);");
        stmt.bind(1, key);
        stmt.bind(2, value.dump());
        stmt.step();
    }

    nlohmann::json SqliteKeyValueStore::get(const std::string &collection, std::int64_t key)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        SqliteStatement stmt(*db_, "SELECT value FROM " + tableFor(collection, KeyKind::Integer) + " WHERE id = ?;");
        stmt.bind(1, key);
        if (!stmt.step())
        {
            throw RecordNotFound(collection, std::to_string(key));
        }
        return parseValue(collection, std::to_string(key), stmt.columnText(0));
    }

    void SqliteKeyValueStore::remove(const std::string &collection, std::int64_t key)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        SqliteStatement stmt(*db_, "DELETE FROM " + tableFor(collection, KeyKind::Integer) + " WHERE id = ?;");
        stmt.bind(1, key);
        stmt.step();
        if (sqlite3_changes(db_->handle()) == 0)
        {
            throw RecordNotFound(collection, std::to_string(key));
        }
    }

    std::vector<nlohmann::json> SqliteKeyValueStore::scan(const std::string &collection, const Predicate &predicate)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        auto it = collections_.find(collection);
        if (it == collections_.end())
        {
            throw UnknownCollection(collection);
        }
        std::string keyColumn = it->second == KeyKind::Integer ? "id" : "key";

        SqliteStatement stmt(*db_, "SELECT " + keyColumn + ", value FROM kv_" + collection + " ORDER BY " + keyColumn + ";");

        std::vector<nlohmann::json> result;
        while (stmt.step())
        {
            auto value = parseValue(collection, stmt.columnText(0), stmt.columnText(1));
            if (!predicate || predicate(value))
            {
                result.push_back(std::move(value));
            }
        }
        return result;
    }

    void SqliteKeyValueStore::putString(const std::string &collection, const std::string &key, const nlohmann::json &value)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        SqliteStatement stmt(*db_, "INSERT OR REPLACE INTO " + tableFor(collection, KeyKind::String) + " (key, value) VALUES(?, ?);");
        stmt.bind(1, key);
        stmt.bind(2, value.dump());
        stmt.step();
    }

    nlohmann::json SqliteKeyValueStore::getString(const std::string &collection, const std::string &key)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        SqliteStatement stmt(*db_, "SELECT value FROM " + tableFor(collection, KeyKind::String) + " WHERE key = ?;");
        stmt.bind(1, key);
        if (!stmt.step())
        {
            throw RecordNotFound(collection, key);
        }
        return parseValue(collection, key, stmt.columnText(0));
    }

    void SqliteKeyValueStore::removeString(const std::string &collection, const std::string &key)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        SqliteStatement stmt(*db_, "DELETE FROM " + tableFor(collection, KeyKind::String) + " WHERE key = ?;");
        stmt.bind(1, key);
        stmt.step();
        if (sqlite3_changes(db_->handle()) == 0)
        {
            throw RecordNotFound(collection, key);
        }
    }

    void SqliteKeyValueStore::transaction(const std::function<void()> &work)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        ScopedTransaction tx(*db_, depth_);
        {
            DepthGuard guard(depth_);
            work();
        }
        tx.commit();
    }

    std::string SqliteKeyValueStore::tableFor(const std::string &collection, KeyKind kind) const
    {
        auto it = collections_.find(collection);
        if (it == collections_.end())
        {
            throw UnknownCollection(collection);
        }
        if (it->second != kind)
        {
            throw StorageError("collection '" + collection + "' is declared with another key kind");
        }
        return "kv_" + collection;
    }

    nlohmann::json SqliteKeyValueStore::parseValue(const std::string &collection, const std::string &key,
                                                   const std::string &text) const
    {
        try
        {
            return nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw StorageError("corrupted value '" + key + "' in '" + collection + "': " + e.what());
        }
    }

} // namespace emulator::adapters::secondary::storage
