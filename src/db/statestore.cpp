// POWERBOND - Exchange State Store Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include "powerbond/db/statestore.h"
#include "powerbond/util/logging.h"

#include <stdexcept>

namespace powerbond {
namespace db {

ExchangeStateStore::ExchangeStateStore(std::unique_ptr<Database> db)
    : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("ExchangeStateStore: null database");
    }
}

std::unique_ptr<ExchangeStateStore> ExchangeStateStore::Open(
    const std::filesystem::path& dir, const Options& options) {
    auto [status, db] = OpenDatabase(dir, options);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to open state store at "
                                         << dir.string() << ": " << status.ToString();
        throw std::runtime_error("cannot open state store: " + status.ToString());
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened state store at " << dir.string();
    return std::make_unique<ExchangeStateStore>(std::move(db));
}

std::string ExchangeStateStore::NonceKey(const Address& requester, const Nonce& nonce) {
    std::string key;
    key.reserve(NONCE_KEY_SIZE);
    key.push_back(prefix::NONCE);
    key.append(reinterpret_cast<const char*>(requester.data()), Address::SIZE);
    key.append(reinterpret_cast<const char*>(nonce.data()), Nonce::SIZE);
    return key;
}

Status ExchangeStateStore::WriteNonce(const Address& requester, const Nonce& nonce) {
    WriteOptions options;
    options.sync = true;
    return db_->Put(options, NonceKey(requester, nonce), Slice(""));
}

Status ExchangeStateStore::EraseNonce(const Address& requester, const Nonce& nonce) {
    WriteOptions options;
    options.sync = true;
    return db_->Delete(options, NonceKey(requester, nonce));
}

bool ExchangeStateStore::HasNonce(const Address& requester, const Nonce& nonce) const {
    return db_->Exists(NonceKey(requester, nonce));
}

Status ExchangeStateStore::WriteCap(const Uint256& cap) {
    auto bytes = cap.ToBigEndian();
    WriteOptions options;
    options.sync = true;
    return db_->Put(options, MakeKey(prefix::CAP),
                    Slice(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

std::optional<Uint256> ExchangeStateStore::ReadCap() const {
    std::string value;
    Status status = db_->Get(MakeKey(prefix::CAP), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw std::runtime_error("cannot read cap: " + status.ToString());
    }
    if (value.size() != 32) {
        throw std::runtime_error("stored cap has " + std::to_string(value.size()) +
                                 " bytes, expected 32");
    }
    return Uint256::FromBigEndian(reinterpret_cast<const Byte*>(value.data()), value.size());
}

} // namespace db
} // namespace powerbond
