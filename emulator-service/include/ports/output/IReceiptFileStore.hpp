// include/ports/output/IReceiptFileStore.hpp
#pragma once

#include <cstdint>
#include <string>

namespace emulator::ports::output
{

    /**
     * @brief Файлы чеков на диске: <uploadRoot>/<companyId>/<receiptId>.pdf
     */
    class IReceiptFileStore
    {
    public:
        virtual ~IReceiptFileStore() = default;

        /**
         * @brief Записывает содержимое во временный файл каталога компании
         * @return путь к временному файлу
         */
        virtual std::string writeTemporary(std::int64_t companyId, const std::string &content) = 0;

        /**
         * @brief Переименовывает временный файл в <receiptId>.pdf
         * @return итоговый путь
         */
        virtual std::string promote(const std::string &temporaryPath, std::int64_t companyId, std::int64_t receiptId) = 0;

        /**
         * @brief Удаляет файл, ошибки не пробрасываются
         * @return true если файл удалён
         */
        virtual bool remove(const std::string &path) = 0;
    };

} // namespace emulator::ports::output
