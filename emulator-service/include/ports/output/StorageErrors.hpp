// include/ports/output/StorageErrors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace emulator::ports::output
{

    /**
     * @brief Ошибка встраиваемого хранилища (I/O, SQL, повреждение файла)
     */
    class StorageError : public std::runtime_error
    {
    public:
        explicit StorageError(const std::string &message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Запись с указанным ключом отсутствует в коллекции
     */
    class RecordNotFound : public StorageError
    {
    public:
        RecordNotFound(const std::string &collection, const std::string &key)
            : StorageError("record '" + key + "' not found in collection '" + collection + "'"),
              collection_(collection),
              key_(key) {}

        const std::string &collection() const { return collection_; }
        const std::string &key() const { return key_; }

    private:
        std::string collection_;
        std::string key_;
    };

    /**
     * @brief Обращение к коллекции, которая не была объявлена при старте.
     *
     * Это ошибка конфигурации, а не ошибка запроса.
     */
    class UnknownCollection : public StorageError
    {
    public:
        explicit UnknownCollection(const std::string &collection)
            : StorageError("collection '" + collection + "' is not declared") {}
    };

} // namespace emulator::ports::output
