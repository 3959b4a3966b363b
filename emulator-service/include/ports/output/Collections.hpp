// include/ports/output/Collections.hpp
#pragma once

#include "ports/output/IKeyValueStore.hpp"

namespace emulator::ports::output::collections
{

    inline constexpr const char *DEALS = "deals";
    inline constexpr const char *JOURNALS = "journals";
    inline constexpr const char *WALLET_TXNS = "wallet_txns";
    inline constexpr const char *RECEIPTS = "receipts";
    inline constexpr const char *ACCESS_TOKENS = "access_tokens";
    inline constexpr const char *REFRESH_TOKENS = "refresh_tokens";

    /**
     * @brief Объявляет все коллекции эмулятора. Вызывается один раз при старте.
     */
    inline void declareAll(IKeyValueStore &store)
    {
        store.declareCollection(DEALS, KeyKind::Integer);
        store.declareCollection(JOURNALS, KeyKind::Integer);
        store.declareCollection(WALLET_TXNS, KeyKind::Integer);
        store.declareCollection(RECEIPTS, KeyKind::Integer);
        store.declareCollection(ACCESS_TOKENS, KeyKind::String);
        store.declareCollection(REFRESH_TOKENS, KeyKind::String);
    }

} // namespace emulator::ports::output::collections
