// include/ports/output/IRecordRepository.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace emulator::ports::output
{

    /**
     * @brief Репозиторий сущностей с целочисленным id
     *
     * @tparam T доменная сущность (WalletTxn, Deal, Journal, Receipt)
     */
    template <typename T>
    class IRecordRepository
    {
    public:
        using Filter = std::function<bool(const T &)>;

        virtual ~IRecordRepository() = default;

        /**
         * @brief Следующий id из последовательности коллекции.
         *
         * Используется и для вложенных строк (детали и оплаты сделки).
         */
        virtual std::int64_t nextId() = 0;

        /**
         * @brief Вставка или замена записи с id == record.id
         */
        virtual void save(const T &record) = 0;

        virtual std::optional<T> findById(std::int64_t id) = 0;

        /**
         * @brief Все записи, прошедшие фильтр, по возрастанию id
         */
        virtual std::vector<T> findAll(const Filter &filter = nullptr) = 0;

        /**
         * @return false если записи не было
         */
        virtual bool deleteById(std::int64_t id) = 0;
    };

} // namespace emulator::ports::output
