// include/settings/StorageSettings.hpp
#pragma once

#include <string>
#include <cstdlib>

namespace emulator::settings
{

    /**
     * @brief Пути к файлу базы и к каталогу загруженных чеков
     *
     * Читает параметры из переменных окружения.
     */
    class StorageSettings
    {
    public:
        StorageSettings()
        {
            dbPath_ = getEnvOrDefault("DB_PATH", "./data/emulator.db");
            uploadDir_ = getEnvOrDefault("UPLOAD_DIR", "./data/receipts");
        }

        StorageSettings(std::string dbPath, std::string uploadDir)
            : dbPath_(std::move(dbPath)), uploadDir_(std::move(uploadDir)) {}

        std::string getDbPath() const { return dbPath_; }
        std::string getUploadDir() const { return uploadDir_; }

    private:
        std::string dbPath_;
        std::string uploadDir_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace emulator::settings
