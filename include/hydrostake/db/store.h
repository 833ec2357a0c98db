// HYDROSTAKE - Staking State Store
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Persists engine snapshots to a key-value database. Layout:
//   'V'            -> schema version (uint8)
//   'G'            -> GlobalState
//   'U' + address  -> UserRecord

#ifndef HYDROSTAKE_DB_STORE_H
#define HYDROSTAKE_DB_STORE_H

#include "hydrostake/db/database.h"
#include "hydrostake/staking/types.h"

#include <cstdint>
#include <memory>

namespace hydrostake {
namespace db {

namespace prefix {
    constexpr char VERSION = 'V';
    constexpr char GLOBAL = 'G';
    constexpr char USER = 'U';
}

constexpr uint8_t STORE_SCHEMA_VERSION = 1;

/// Key for a user record: 'U' followed by the 20 address bytes
std::string MakeUserKey(const Address& account);

class StakingStore {
public:
    explicit StakingStore(std::unique_ptr<Database> db);

    StakingStore(const StakingStore&) = delete;
    StakingStore& operator=(const StakingStore&) = delete;

    /**
     * Replace the stored state with snapshot in one atomic batch.
     * Stored users absent from the snapshot are deleted.
     */
    Status WriteSnapshot(const staking::StateSnapshot& snapshot, bool sync = true);

    /// NotFound if nothing was ever written, Corruption on undecodable records
    Status ReadSnapshot(staking::StateSnapshot& snapshot);

    Status ReadUser(const Address& account, staking::UserRecord& record);

    bool HasState();

    Database& GetDatabase() { return *db_; }

private:
    Status CheckVersion();

    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace hydrostake

#endif // HYDROSTAKE_DB_STORE_H
