// STAKEFLOW - Staking Simulator
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Replays a scenario script against an in-memory vault under mock time.

#include <stakeflow/sim/scenario.h>
#include <stakeflow/staking/authorization.h>
#include <stakeflow/staking/engine.h>
#include <stakeflow/staking/events.h>
#include <stakeflow/staking/policy.h>
#include <stakeflow/staking/vault.h>
#include <stakeflow/util/config.h>
#include <stakeflow/util/logging.h>
#include <stakeflow/util/time.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace stakeflow {
namespace sim {

namespace {
    const char* const CLIENT_NAME = "STAKEFLOW Simulator";
    const char* const VERSION = "0.1.0";

    /// Default scenario start (2024-01-01T00:00:00Z)
    constexpr int64_t DEFAULT_START_TIME = 1704067200;

    /// Admin used when the configuration names none
    const Address DEFAULT_ADMIN = Address::FromId(0xAD);
}

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: stakeflow-sim [options] <scenario-file>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file path\n";
    std::cout << "  -start=TIME                Scenario start, Unix seconds\n";
    std::cout << "  -strict                    Stop at the first rejected operation\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error\n";
    std::cout << "  -logfile=FILE              Also write the log to FILE\n";
    std::cout << "  -staking.<key>=VALUE       Override a [staking] config key\n";
    std::cout << "\n[staking] keys:\n";
    std::cout << "  rewardrate, minrewardrate, adjustmentperiod, maxapr, targetdays,\n";
    std::cout << "  minimumstake, custody, feerecipient, admin\n";
    std::cout << "\nExample scenario:\n";
    std::cout << "  mint 1 1000\n";
    std::cout << "  mint 9 500\n";
    std::cout << "  fund 9 500\n";
    std::cout << "  stake 1 1000\n";
    std::cout << "  advance 10d\n";
    std::cout << "  exit 1\n";
    std::cout << "  report\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 STAKEFLOW Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();

    util::ConsoleSink::Config console;
    console.useStderr = true;
    console.showTimestamp = false;
    logger.AddSink(std::make_shared<util::ConsoleSink>(console));

    std::string logFile = config.GetString("logfile", "");
    if (!logFile.empty()) {
        logger.AddSink(std::make_shared<util::FileSink>(logFile));
    }

    logger.SetLevel(util::LogLevelFromString(config.GetString("loglevel", "info")));
}

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    std::vector<std::string> positional;

    auto parsed = config.ParseCommandLine(argc, argv, &positional);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }
    if (positional.size() != 1) {
        std::cerr << "Error: expected exactly one scenario file.\n";
        std::cerr << "Use 'stakeflow-sim -help' for usage information.\n";
        return 1;
    }

    std::string confPath = config.GetString("conf", "");
    if (!confPath.empty()) {
        auto fileResult = config.ParseFile(confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.ToString() << "\n";
            return 1;
        }
        for (const auto& warning : fileResult.warnings) {
            std::cerr << "Warning: " << warning << "\n";
        }
    }

    SetupLogging(config);

    staking::StakingPolicy policy;
    auto policyResult = staking::LoadStakingPolicy(config, policy);
    if (!policyResult.success) {
        LOG_ERROR(util::LogCategory::CONFIG) << policyResult.ToString();
        return 1;
    }

    std::vector<Address> admins = policy.admins;
    if (admins.empty()) {
        admins.push_back(DEFAULT_ADMIN);
    }
    Address admin = admins.front();

    std::ifstream scenario(positional.front());
    if (!scenario) {
        LOG_ERROR(util::LogCategory::SIM) << "Cannot open scenario " << positional.front();
        return 1;
    }

    util::ScopedMockTime clock(config.GetInt("start", DEFAULT_START_TIME));

    staking::InMemoryTokenVault vault(policy.custody);
    staking::AllowListAuthorizer authorizer(admins);
    staking::StakingEngine engine(policy, vault, authorizer);
    engine.SetNotificationSink(std::make_shared<staking::LoggingNotificationSink>());

    ScenarioRunner runner(engine, vault, admin, std::cout);
    runner.SetStrict(config.GetBool("strict", false));

    ScenarioResult result = runner.Run(scenario);
    runner.PrintReport();

    std::cout << "\n" << result.steps << " step(s), " << result.rejected << " rejected\n";
    if (!result.success) {
        LOG_ERROR(util::LogCategory::SIM) << positional.front() << ":" << result.errorLine
                                          << ": " << result.error;
        return 2;
    }
    return 0;
}

} // namespace sim
} // namespace stakeflow

int main(int argc, char* argv[]) {
    try {
        int rc = stakeflow::sim::AppMain(argc, argv);
        stakeflow::util::Logger::Instance().Shutdown();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
