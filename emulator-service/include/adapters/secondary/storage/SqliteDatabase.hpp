// include/adapters/secondary/storage/SqliteDatabase.hpp
#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <string>

namespace emulator::adapters::secondary::storage
{

    /**
     * @brief RAII-обёртка над sqlite3*.
     *
     * Открывает (или создаёт) файл базы, включает WAL и busy timeout.
     * Ошибки SQLite превращаются в ports::output::StorageError.
     */
    class SqliteDatabase
    {
    public:
        explicit SqliteDatabase(const std::string &path);
        ~SqliteDatabase();

        SqliteDatabase(const SqliteDatabase &) = delete;
        SqliteDatabase &operator=(const SqliteDatabase &) = delete;

        /**
         * @brief Выполняет SQL без результата (pragma, DDL, BEGIN/COMMIT)
         */
        void exec(const std::string &sql);

        sqlite3 *handle() const { return db_; }
        const std::string &path() const { return path_; }

    private:
        sqlite3 *db_ = nullptr;
        std::string path_;

        void configure();
    };

    /**
     * @brief Подготовленный запрос, финализируется в деструкторе
     */
    class SqliteStatement
    {
    public:
        SqliteStatement(SqliteDatabase &db, const std::string &sql);
        ~SqliteStatement();

        SqliteStatement(const SqliteStatement &) = delete;
        SqliteStatement &operator=(const SqliteStatement &) = delete;

        void bind(int index, std::int64_t value);
        void bind(int index, const std::string &value);

        /**
         * @return true если получена строка результата, false если запрос завершён
         */
        bool step();

        std::int64_t columnInt64(int column) const;
        std::string columnText(int column) const;

    private:
        SqliteDatabase &db_;
        sqlite3_stmt *stmt_ = nullptr;
    };

} // namespace emulator::adapters::secondary::storage
