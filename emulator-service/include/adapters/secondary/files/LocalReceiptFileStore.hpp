// include/adapters/secondary/files/LocalReceiptFileStore.hpp
#pragma once

#include "ports/output/IReceiptFileStore.hpp"
#include "settings/StorageSettings.hpp"
#include "utils/TokenGenerator.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <iostream>

namespace emulator::adapters::secondary::files
{

    /**
     * @brief Файлы чеков в локальной файловой системе (UPLOAD_DIR)
     */
    class LocalReceiptFileStore : public ports::output::IReceiptFileStore
    {
    public:
        explicit LocalReceiptFileStore(std::shared_ptr<settings::StorageSettings> settings)
            : root_(settings->getUploadDir())
        {
            std::cout << "[LocalReceiptFileStore] Upload root: " << root_.string() << std::endl;
        }

        std::string writeTemporary(std::int64_t companyId, const std::string &content) override
        {
            auto dir = companyDir(companyId);
            std::filesystem::create_directories(dir);

            auto path = dir / ("tmp_" + utils::TokenGenerator::generateHex(8));
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                throw std::runtime_error("cannot open " + path.string() + " for writing");
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.close();
            if (!out)
            {
                std::error_code ec;
                std::filesystem::remove(path, ec);
                throw std::runtime_error("cannot write " + path.string());
            }
            return path.string();
        }

        std::string promote(const std::string &temporaryPath, std::int64_t companyId, std::int64_t receiptId) override
        {
            auto target = companyDir(companyId) / (std::to_string(receiptId) + ".pdf");
            std::filesystem::rename(temporaryPath, target);
            return target.string();
        }

        bool remove(const std::string &path) override
        {
            if (path.empty())
                return false;

            std::error_code ec;
            bool removed = std::filesystem::remove(path, ec);
            if (ec)
            {
                std::cerr << "[LocalReceiptFileStore] Failed to remove " << path << ": " << ec.message() << std::endl;
                return false;
            }
            return removed;
        }

    private:
        std::filesystem::path root_;

        std::filesystem::path companyDir(std::int64_t companyId) const
        {
            return root_ / std::to_string(companyId);
        }
    };

} // namespace emulator::adapters::secondary::files
