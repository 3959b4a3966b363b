#pragma once

#include "Timestamp.hpp"
#include <cstdint>
#include <string>

namespace emulator::domain {

/**
 * @brief Загруженный файл чека
 *
 * filePath указывает на <uploadRoot>/<companyId>/<id>.pdf
 */
struct Receipt {
    std::int64_t id = 0;
    std::int64_t companyId = 0;
    std::string issueDate;
    std::string description;
    std::string status = "unconfirmed";
    std::string fileName;       ///< Имя файла у клиента
    std::string filePath;
    Timestamp createdAt;
    Timestamp updatedAt;
};

/**
 * @brief Данные multipart-загрузки
 */
struct ReceiptUpload {
    std::int64_t companyId = 0;
    std::string issueDate;
    std::string description;
    std::string fileName;
    std::string content;
};

} // namespace emulator::domain
