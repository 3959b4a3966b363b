#pragma once

#include "domain/WalletTxn.hpp"
#include <optional>
#include <vector>

namespace emulator::ports::input {

/**
 * @brief Фильтр списка строк выписки
 */
struct WalletTxnFilter {
    std::optional<std::int64_t> companyId;
    std::optional<domain::WalletTxnStatus> status;
};

/**
 * @brief Строки выписки (wallet_txns)
 */
class IWalletTxnService {
public:
    virtual ~IWalletTxnService() = default;

    /**
     * @brief Создаёт строку. id, статус и временные метки назначаются сервисом.
     */
    virtual domain::WalletTxn create(const domain::WalletTxn& draft) = 0;

    virtual std::optional<domain::WalletTxn> getById(std::int64_t id) = 0;
    virtual std::vector<domain::WalletTxn> list(const WalletTxnFilter& filter) = 0;

    /**
     * @return std::nullopt если строки нет
     * @throws std::invalid_argument при попытке вернуть SETTLED в UNBOOKED
     */
    virtual std::optional<domain::WalletTxn> update(std::int64_t id, const domain::WalletTxnUpdate& changes) = 0;

    virtual bool remove(std::int64_t id) = 0;
};

} // namespace emulator::ports::input
