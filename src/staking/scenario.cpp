// HYDROSTAKE - Deploy-and-Stake Scenario
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/staking/scenario.h"
#include "hydrostake/ledger/memory_ledger.h"
#include "hydrostake/staking/engine.h"
#include "hydrostake/staking/rewards.h"
#include "hydrostake/util/logging.h"

#include <algorithm>
#include <limits>
#include <memory>

namespace hydrostake {
namespace staking {

const Address SCENARIO_DEPLOYER = Address::FromId(0x01);
const Address SCENARIO_HOLDER = Address::FromId(0x02);
const Address SCENARIO_ENGINE = Address::FromId(0xEE);

namespace {

constexpr const char* INITIAL_SUPPLY = "1000000";
constexpr const char* HOLDER_FUNDING = "2000";
constexpr const char* ENGINE_FUNDING = "2000";

/// Turns mock time on for its lifetime unless the caller already had it on
class ScopedMockClock {
public:
    ScopedMockClock() : owned_(!util::IsMockTimeEnabled()) {
        if (owned_) {
            util::EnableMockTime();
        }
    }
    ~ScopedMockClock() {
        if (owned_) {
            util::DisableMockTime();
        }
    }

    ScopedMockClock(const ScopedMockClock&) = delete;
    ScopedMockClock& operator=(const ScopedMockClock&) = delete;

private:
    bool owned_;
};

ScenarioReport Failed(const std::string& error) {
    LOG_ERROR(util::LogCategory::SIM) << error;
    ScenarioReport report;
    report.error = error;
    return report;
}

} // namespace

ScenarioReport RunScenario(const ScenarioConfig& config) {
    if (config.minutes < 0 || config.minutes > MAX_SCENARIO_MINUTES) {
        return Failed("minutes out of range: " + std::to_string(config.minutes));
    }

    ScopedMockClock clock;
    const int64_t start = std::max<int64_t>(util::GetTime(), 0);
    if (config.minutes > (std::numeric_limits<int64_t>::max() - start) / util::SECONDS_PER_MINUTE) {
        return Failed("advancing " + std::to_string(config.minutes) +
                      " minutes would overflow the clock");
    }

    auto hydro = std::make_shared<ledger::MemoryTokenLedger>("HYDRO");
    auto kvs = std::make_shared<ledger::MemoryTokenLedger>("KVS");
    auto nft = std::make_shared<ledger::MemoryNftRegistry>();

    const Uint256 supply = ParseTokenAmount(INITIAL_SUPPLY);
    hydro->Mint(SCENARIO_DEPLOYER, supply);
    kvs->Mint(SCENARIO_DEPLOYER, supply);

    StakingEngine engine(SCENARIO_ENGINE, SCENARIO_DEPLOYER, hydro, kvs, nft, config.params);

    if (!hydro->Transfer(SCENARIO_DEPLOYER, SCENARIO_HOLDER, ParseTokenAmount(HOLDER_FUNDING)) ||
        !kvs->Transfer(SCENARIO_DEPLOYER, SCENARIO_ENGINE, ParseTokenAmount(ENGINE_FUNDING))) {
        return Failed("funding transfers failed");
    }
    uint64_t tokenId = nft->Mint(SCENARIO_HOLDER);
    LOG_INFO(util::LogCategory::SIM) << "Minted gating NFT #" << tokenId
                                     << " to " << SCENARIO_HOLDER.ToString();

    hydro->Approve(SCENARIO_HOLDER, SCENARIO_ENGINE, config.stake);
    StakingResult staked = engine.Stake(SCENARIO_HOLDER, config.stake);
    if (!staked) {
        return Failed("stake failed: " + staked.ToString());
    }

    util::AdvanceMockTime(util::Minutes(config.minutes));

    ScenarioReport report;
    report.success = true;
    report.reward = engine.CheckCurrentRewards(SCENARIO_HOLDER);
    const UserRecord user = engine.GetUser(SCENARIO_HOLDER);
    report.staked = user.amount;
    report.frozenRate = user.ratePerMinute;
    report.currentRate = engine.GetCurrentRate();
    report.apy = engine.GetApy();
    report.totalStaked = engine.GetTotalStaked();
    report.events = engine.GetEventLog().Size();
    report.snapshot = engine.ExportState();

    LOG_INFO(util::LogCategory::SIM) << "Scenario accrued " << FormatTokenAmount(report.reward)
                                     << " KVS over " << config.minutes << " minutes";
    return report;
}

} // namespace staking
} // namespace hydrostake
