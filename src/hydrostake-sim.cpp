// HYDROSTAKE - Staking Simulator
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Deploys in-memory ledgers and an engine, runs one staking position forward
// in mock time and reports the result. Optionally persists the final state.

#include "hydrostake/db/database.h"
#include "hydrostake/db/store.h"
#include "hydrostake/staking/rewards.h"
#include "hydrostake/staking/scenario.h"
#include "hydrostake/util/config.h"
#include "hydrostake/util/logging.h"
#include "hydrostake/util/time.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace hydrostake {

namespace {

constexpr const char* CLIENT_NAME = "hydrostake-sim";
constexpr const char* VERSION = "1.0.0";

namespace defaults {
    constexpr const char* STAKE = "1";
    constexpr int64_t MINUTES = 60;
    constexpr const char* LOG_LEVEL = "info";
    constexpr const char* DB_SUBDIR = "state";
}

struct SimConfig {
    std::string dataDir;
    std::string logLevel{defaults::LOG_LEVEL};
    std::string logFile;
    bool printToConsole{true};
    staking::ScenarioConfig scenario;
};

void PrintHelp() {
    std::cout << "HYDROSTAKE Simulator - " << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: hydrostake-sim [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                  Show this help message\n";
    std::cout << "  -version               Show version information\n";
    std::cout << "  -conf=FILE             Read options and [staking] parameters from FILE\n";
    std::cout << "  -datadir=DIR           Persist the final state under DIR\n";
    std::cout << "  -stake=AMOUNT          Tokens to stake (default: " << defaults::STAKE << ")\n";
    std::cout << "  -minutes=N             Minutes to advance after staking (default: "
              << defaults::MINUTES << ")\n";
    std::cout << "  -loglevel=LEVEL        trace, debug, info, warn, error, off\n";
    std::cout << "  -logfile=FILE          Also log to FILE\n";
    std::cout << "  -printtoconsole=0/1    Log to the console (default: 1)\n";
}

void AllowKeys(util::ConfigManager& config) {
    for (const char* key : {"help", "version",
                            util::ConfigKeys::CONF, util::ConfigKeys::DATADIR,
                            util::ConfigKeys::LOGLEVEL, util::ConfigKeys::LOGFILE,
                            util::ConfigKeys::PRINTTOCONSOLE, util::ConfigKeys::STAKE,
                            util::ConfigKeys::MINUTES}) {
        config.AllowKey(key);
    }
}

/// Returns false with a message on stderr if the configuration is unusable
bool LoadConfig(const util::ConfigManager& config, SimConfig& sim) {
    sim.dataDir = config.GetPath(util::ConfigKeys::DATADIR);
    sim.logLevel = config.GetString(util::ConfigKeys::LOGLEVEL, defaults::LOG_LEVEL);
    sim.logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    sim.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);

    std::string stake = config.GetString(util::ConfigKeys::STAKE, defaults::STAKE);
    try {
        sim.scenario.stake = staking::ParseTokenAmount(stake);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid -stake: " << e.what() << "\n";
        return false;
    }

    sim.scenario.minutes = defaults::MINUTES;
    if (config.HasKey(util::ConfigKeys::MINUTES)) {
        auto minutes = config.TryGetInt(util::ConfigKeys::MINUTES);
        if (!minutes || *minutes < 0 || *minutes > staking::MAX_SCENARIO_MINUTES) {
            std::cerr << "Error: -minutes must be an integer in [0, "
                      << staking::MAX_SCENARIO_MINUTES << "]\n";
            return false;
        }
        sim.scenario.minutes = *minutes;
    }

    util::ConfigParseResult result = staking::LoadStakingParams(config, sim.scenario.params);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }
    return true;
}

void SetupLogging(const SimConfig& sim) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(sim.logLevel);
    logger.SetLevel(level);

    if (sim.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useStderr = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!sim.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = sim.logFile;
        fileConfig.level = util::LogLevel::Debug;
        logger.AddSink(std::make_shared<util::FileSink>(fileConfig));
    }
}

bool Persist(const staking::StateSnapshot& snapshot, const std::string& dataDir) {
    std::filesystem::path dbPath = std::filesystem::path(dataDir) / defaults::DB_SUBDIR;
    auto [status, database] = db::OpenDatabase(dbPath);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::SIM) << "Cannot open " << dbPath.string()
                                          << ": " << status.ToString();
        return false;
    }

    db::StakingStore store(std::move(database));
    if (store.HasState()) {
        LOG_INFO(util::LogCategory::SIM) << "Replacing state stored in " << dbPath.string();
    }

    status = store.WriteSnapshot(snapshot);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::SIM) << "Cannot persist state: " << status.ToString();
        return false;
    }
    LOG_INFO(util::LogCategory::SIM) << "State written to " << dbPath.string();
    return true;
}

int RunSimulation(const SimConfig& sim) {
    const staking::ScenarioReport report = staking::RunScenario(sim.scenario);
    if (!report.success) {
        return 1;
    }

    std::cout << "Staked:          " << staking::FormatTokenAmount(report.staked) << " HYDRO\n";
    std::cout << "Elapsed:         " << util::FormatDuration(util::Minutes(sim.scenario.minutes))
              << "\n";
    std::cout << "Accrued reward:  " << staking::FormatTokenAmount(report.reward) << " KVS\n";
    std::cout << "Frozen rate:     " << report.frozenRate << "\n";
    std::cout << "Current rate:    " << report.currentRate << "\n";
    std::cout << "Current APY:     " << staking::FormatBasisPoints(report.apy) << "\n";
    std::cout << "Total staked:    " << staking::FormatTokenAmount(report.totalStaked)
              << " HYDRO\n";
    std::cout << "Events:          " << report.events << "\n";

    if (!sim.dataDir.empty() && !Persist(report.snapshot, sim.dataDir)) {
        return 1;
    }
    return 0;
}

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    AllowKeys(config);

    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    if (config.GetBool("help", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        std::cout << CLIENT_NAME << " v" << VERSION << "\n";
        return 0;
    }

    if (config.HasKey(util::ConfigKeys::CONF)) {
        parsed = config.ParseFile(config.GetPath(util::ConfigKeys::CONF));
        if (!parsed.success) {
            std::cerr << "Error: " << parsed.ToString() << "\n";
            return 1;
        }
    }

    SimConfig sim;
    if (!LoadConfig(config, sim)) {
        return 1;
    }

    SetupLogging(sim);
    for (const auto& warning : parsed.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }
    for (const auto& unknown : config.Validate("")) {
        LOG_WARN(util::LogCategory::CONFIG) << unknown;
    }

    LOG_INFO(util::LogCategory::SIM) << CLIENT_NAME << " v" << VERSION << " starting";
    int rc = RunSimulation(sim);

    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace

} // namespace hydrostake

int main(int argc, char* argv[]) {
    try {
        return hydrostake::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
