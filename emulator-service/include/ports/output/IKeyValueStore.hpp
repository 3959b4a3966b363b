// include/ports/output/IKeyValueStore.hpp
#pragma once

#include "ports/output/StorageErrors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace emulator::ports::output
{

    /**
     * @brief Тип ключа коллекции
     */
    enum class KeyKind
    {
        Integer, ///< auto-increment int64 (сущности)
        String   ///< непрозрачная строка (токены)
    };

    /**
     * @brief Встраиваемое key-value хранилище с именованными коллекциями.
     *
     * Значения хранятся как JSON-документы. Все мутирующие операции атомарны
     * относительно конкурентных вызовов. Коллекции объявляются при старте,
     * обращение к необъявленной коллекции бросает UnknownCollection.
     */
    class IKeyValueStore
    {
    public:
        using Predicate = std::function<bool(const nlohmann::json &)>;

        virtual ~IKeyValueStore() = default;

        /**
         * @brief Создаёт коллекцию, если её ещё нет
         */
        virtual void declareCollection(const std::string &collection, KeyKind kind) = 0;

        /**
         * @brief Следующий id коллекции.
         *
         * Строго монотонен, удалённые id повторно не выдаются.
         */
        virtual std::int64_t nextId(const std::string &collection) = 0;

        virtual void put(const std::string &collection, std::int64_t key, const nlohmann::json &value) = 0;

        /**
         * @throws RecordNotFound если ключа нет
         */
        virtual nlohmann::json get(const std::string &collection, std::int64_t key) = 0;

        /**
         * @throws RecordNotFound если ключа нет
         */
        virtual void remove(const std::string &collection, std::int64_t key) = 0;

        /**
         * @brief Значения коллекции, удовлетворяющие предикату, в порядке ключей
         */
        virtual std::vector<nlohmann::json> scan(const std::string &collection, const Predicate &predicate) = 0;

        // Строковые ключи (токены)
        virtual void putString(const std::string &collection, const std::string &key, const nlohmann::json &value) = 0;
        virtual nlohmann::json getString(const std::string &collection, const std::string &key) = 0;
        virtual void removeString(const std::string &collection, const std::string &key) = 0;

        /**
         * @brief Выполняет work в одной сериализуемой транзакции.
         *
         * Вложенные вызовы присоединяются к внешней транзакции.
         * Исключение из work откатывает все изменения и пробрасывается дальше.
         */
        virtual void transaction(const std::function<void()> &work) = 0;
    };

} // namespace emulator::ports::output
