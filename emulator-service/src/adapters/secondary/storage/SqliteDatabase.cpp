#include "adapters/secondary/storage/SqliteDatabase.hpp"
#include "ports/output/StorageErrors.hpp"

#include <filesystem>
#include <iostream>

namespace emulator::adapters::secondary::storage
{

    namespace
    {
        void throwIf(int rc, sqlite3 *db, const char *what)
        {
            if (rc != SQLITE_OK)
            {
                throw ports::output::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
            }
        }
    } // namespace

    SqliteDatabase::SqliteDatabase(const std::string &path) : path_(path)
    {
        std::filesystem::path parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw ports::output::StorageError("cannot create directory " + parent.string() + ": " + ec.message());
            }
        }

        int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
            if (db_)
                sqlite3_close(db_);
            db_ = nullptr;
            throw ports::output::StorageError("cannot open " + path_ + ": " + msg);
        }

        configure();
        std::cout << "[SqliteDatabase] Opened " << path_ << std::endl;
    }

    SqliteDatabase::~SqliteDatabase()
    {
        if (db_)
        {
            sqlite3_close(db_);
            std::cout << "[SqliteDatabase] Closed " << path_ << std::endl;
        }
    }

    void SqliteDatabase::exec(const std::string &sql)
    {
        char *err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK)
        {
            std::string msg = err ? err : "sqlite exec failed";
            sqlite3_free(err);
            throw ports::output::StorageError(msg);
        }
    }

    void SqliteDatabase::configure()
    {
        // WAL: читатели не блокируются писателем
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        // ждём блокировку вместо немедленного SQLITE_BUSY
        throwIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
    }

    // ------------------------------------------------------------------
    // SqliteStatement
    // ------------------------------------------------------------------

    SqliteStatement::SqliteStatement(SqliteDatabase &db, const std::string &sql) : db_(db)
    {
        throwIf(sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr), db_.handle(), "sqlite prepare");
    }

    SqliteStatement::~SqliteStatement()
    {
        if (stmt_)
            sqlite3_finalize(stmt_);
    }

    void SqliteStatement::bind(int index, std::int64_t value)
    {
        throwIf(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), db_.handle(), "sqlite bind");
    }

    void SqliteStatement::bind(int index, const std::string &value)
    {
        throwIf(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
                db_.handle(), "sqlite bind");
    }

    bool SqliteStatement::step()
    {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)
            return true;
        if (rc == SQLITE_DONE)
            return false;
        throw ports::output::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db_.handle()));
    }

    std::int64_t SqliteStatement::columnInt64(int column) const
    {
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
    }

    std::string SqliteStatement::columnText(int column) const
    {
        const unsigned char *text = sqlite3_column_text(stmt_, column);
        if (!text)
            return "";
        int size = sqlite3_column_bytes(stmt_, column);
        return std::string(reinterpret_cast<const char *>(text), static_cast<size_t>(size));
    }

} // namespace emulator::adapters::secondary::storage
