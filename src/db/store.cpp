// HYDROSTAKE - Staking State Store
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/db/store.h"
#include "hydrostake/util/logging.h"

#include <set>
#include <stdexcept>

namespace hydrostake {
namespace db {

std::string MakeUserKey(const Address& account) {
    std::string key(1, prefix::USER);
    key.append(reinterpret_cast<const char*>(account.data()), Address::SIZE);
    return key;
}

StakingStore::StakingStore(std::unique_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("StakingStore: database is required");
    }
}

Status StakingStore::CheckVersion() {
    std::string value;
    Status s = db_->Get(std::string(1, prefix::VERSION), &value);
    if (!s.ok()) {
        return s;
    }
    uint8_t version = 0;
    if (!DeserializeFromString(value, version)) {
        return Status::Corruption("unreadable schema version");
    }
    if (version != STORE_SCHEMA_VERSION) {
        return Status::NotSupported("schema version " + std::to_string(version));
    }
    return Status::Ok();
}

bool StakingStore::HasState() {
    return db_->Exists(std::string(1, prefix::GLOBAL));
}

Status StakingStore::WriteSnapshot(const staking::StateSnapshot& snapshot, bool sync) {
    WriteBatch batch;
    batch.Put(std::string(1, prefix::VERSION), SerializeToString(STORE_SCHEMA_VERSION));
    batch.Put(std::string(1, prefix::GLOBAL), SerializeToString(snapshot.global));

    std::set<std::string> written;
    for (const auto& [account, record] : snapshot.users) {
        std::string key = MakeUserKey(account);
        batch.Put(key, SerializeToString(record));
        written.insert(std::move(key));
    }

    const std::string userPrefix(1, prefix::USER);
    auto it = db_->NewIterator();
    for (it->Seek(userPrefix); it->Valid() && it->key().starts_with(userPrefix); it->Next()) {
        std::string key = it->key().ToString();
        if (written.count(key) == 0) {
            batch.Delete(key);
        }
    }
    Status iterStatus = it->status();
    if (!iterStatus.ok()) {
        return iterStatus;
    }

    WriteOptions options;
    options.sync = sync;
    Status s = db_->Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Snapshot write failed: " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Wrote snapshot: " << snapshot.users.size()
                                     << " accounts, " << batch.Count() << " operations";
    return Status::Ok();
}

Status StakingStore::ReadSnapshot(staking::StateSnapshot& snapshot) {
    Status s = CheckVersion();
    if (!s.ok()) {
        return s;
    }

    std::string value;
    s = db_->Get(std::string(1, prefix::GLOBAL), &value);
    if (!s.ok()) {
        return s;
    }

    staking::StateSnapshot loaded;
    if (!DeserializeFromString(value, loaded.global)) {
        return Status::Corruption("unreadable global state");
    }

    const std::string userPrefix(1, prefix::USER);
    auto it = db_->NewIterator();
    for (it->Seek(userPrefix); it->Valid() && it->key().starts_with(userPrefix); it->Next()) {
        Slice key = it->key();
        if (key.size() != 1 + Address::SIZE) {
            return Status::Corruption("malformed user key");
        }
        Address account(reinterpret_cast<const Byte*>(key.data() + 1), Address::SIZE);

        staking::UserRecord record;
        if (!DeserializeFromString(it->value().ToString(), record)) {
            return Status::Corruption("unreadable record for " + account.ToString());
        }
        loaded.users.emplace_back(account, record);
    }
    s = it->status();
    if (!s.ok()) {
        return s;
    }

    snapshot = std::move(loaded);
    LOG_DEBUG(util::LogCategory::DB) << "Read snapshot: " << snapshot.users.size() << " accounts";
    return Status::Ok();
}

Status StakingStore::ReadUser(const Address& account, staking::UserRecord& record) {
    std::string value;
    Status s = db_->Get(MakeUserKey(account), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, record)) {
        return Status::Corruption("unreadable record for " + account.ToString());
    }
    return Status::Ok();
}

} // namespace db
} // namespace hydrostake
