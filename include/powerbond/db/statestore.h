// POWERBOND - Exchange State Store
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Persists the exchange state that the engine itself owns: the consumed
// nonce set and the voting power cap. Governance balances and the
// cumulative burned counter belong to the governance ledger.
//
// Layout:
//   'n' || requester(20) || nonce(32)  -> empty value
//   'c'                                -> cap as 32-byte big-endian

#ifndef POWERBOND_DB_STATESTORE_H
#define POWERBOND_DB_STATESTORE_H

#include "powerbond/core/types.h"
#include "powerbond/core/uint256.h"
#include "powerbond/db/database.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace powerbond {
namespace db {

class ExchangeStateStore {
public:
    /// Wrap an already opened database
    explicit ExchangeStateStore(std::unique_ptr<Database> db);

    /**
     * Open (or create) the store under a directory.
     * @throws std::runtime_error if the database cannot be opened
     */
    static std::unique_ptr<ExchangeStateStore> Open(const std::filesystem::path& dir,
                                                    const Options& options = Options());

    ExchangeStateStore(const ExchangeStateStore&) = delete;
    ExchangeStateStore& operator=(const ExchangeStateStore&) = delete;

    // ========================================================================
    // Nonces
    // ========================================================================

    /// Record a consumed nonce (synced write)
    Status WriteNonce(const Address& requester, const Nonce& nonce);

    /// Remove a nonce written by a request that was later discarded
    Status EraseNonce(const Address& requester, const Nonce& nonce);

    bool HasNonce(const Address& requester, const Nonce& nonce) const;

    /**
     * Visit every stored (requester, nonce) pair in key order.
     * @param count Receives the number of pairs visited
     * @return Iterator status, Corruption for a malformed key
     */
    template<typename Func>
    Status ForEachNonce(Func&& func, size_t* count = nullptr) const {
        auto it = db_->NewIterator();
        const std::string start = MakeKey(prefix::NONCE);
        size_t n = 0;
        for (it->Seek(start); it->Valid(); it->Next()) {
            Slice key = it->key();
            if (key.empty() || key[0] != prefix::NONCE) break;
            if (key.size() != NONCE_KEY_SIZE) {
                return Status::Corruption("malformed nonce key");
            }
            const Byte* raw = reinterpret_cast<const Byte*>(key.data()) + 1;
            func(Address(raw, Address::SIZE), Nonce(raw + Address::SIZE, Nonce::SIZE));
            ++n;
        }
        if (count) *count = n;
        return it->status();
    }

    // ========================================================================
    // Cap
    // ========================================================================

    /// Store the cap (synced write)
    Status WriteCap(const Uint256& cap);

    /// Stored cap; nullopt if none was ever written
    /// @throws std::runtime_error if the stored value is corrupt
    std::optional<Uint256> ReadCap() const;

private:
    static constexpr size_t NONCE_KEY_SIZE = 1 + Address::SIZE + Nonce::SIZE;

    static std::string NonceKey(const Address& requester, const Nonce& nonce);

    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace powerbond

#endif // POWERBOND_DB_STATESTORE_H
