#pragma once

#include "utils/TokenGenerator.hpp"
#include <filesystem>
#include <system_error>

namespace emulator::tests {

/**
 * @brief Временный каталог, удаляется вместе с содержимым в деструкторе
 */
class TempDirectory {
public:
    TempDirectory()
        : path_(std::filesystem::temp_directory_path() /
                ("emulator-test-" + utils::TokenGenerator::generateHex(8)))
    {
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

private:
    std::filesystem::path path_;
};

} // namespace emulator::tests
