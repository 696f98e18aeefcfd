// STAKEFLOW - Scenario Runner Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/sim/scenario.h"
#include "stakeflow/staking/fees.h"
#include "stakeflow/util/logging.h"
#include "stakeflow/util/time.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace stakeflow {
namespace sim {

using staking::OperationResult;

Address ParseAddress(const std::string& token) {
    if (token.size() <= 3 &&
        token.find_first_not_of("0123456789") == std::string::npos && !token.empty()) {
        int id = std::stoi(token);
        if (id > 255) {
            throw std::invalid_argument("Address id out of range: " + token);
        }
        return Address::FromId(static_cast<uint8_t>(id));
    }
    return Address::FromHex(token);
}

namespace {

uint64_t ParseUnsigned(const std::string& token) {
    if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Expected an unsigned integer: '" + token + "'");
    }
    try {
        return std::stoull(token);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Integer out of range: '" + token + "'");
    }
}

ScenarioResult Abort(ScenarioResult result, int lineNum, const std::string& error) {
    result.success = false;
    result.errorLine = lineNum;
    result.error = error;
    LOG_WARN(util::LogCategory::SIM) << "line " << lineNum << ": " << error;
    return result;
}

void RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() != count) {
        throw std::invalid_argument(std::string("usage: ") + usage);
    }
}

} // namespace

// ============================================================================
// ScenarioRunner
// ============================================================================

ScenarioRunner::ScenarioRunner(staking::StakingEngine& engine,
                               staking::InMemoryTokenVault& vault,
                               const Address& admin, std::ostream& out)
    : engine_(engine), vault_(vault), admin_(admin), out_(out) {}

std::vector<std::string> ScenarioRunner::Tokenize(const std::string& line) {
    std::string content = line.substr(0, line.find('#'));
    std::istringstream in(content);
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

ScenarioResult ScenarioRunner::Run(std::istream& in) {
    ScenarioResult result;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        std::vector<std::string> args = Tokenize(line);
        if (args.empty()) {
            continue;
        }

        OperationResult outcome;
        try {
            outcome = Execute(args);
        } catch (const std::invalid_argument& e) {
            return Abort(result, lineNum, e.what());
        } catch (const std::out_of_range& e) {
            return Abort(result, lineNum, e.what());
        }

        ++result.steps;
        out_ << "[" << util::FormatISO8601(util::GetTime()) << "] " << args[0];
        for (size_t i = 1; i < args.size(); ++i) {
            out_ << " " << args[i];
        }
        out_ << " -> " << outcome.ToString() << "\n";

        if (!outcome.IsSuccess()) {
            ++result.rejected;
            if (strict_) {
                result.success = false;
                result.errorLine = lineNum;
                result.error = outcome.ToString();
                return result;
            }
        }
    }
    return result;
}

OperationResult ScenarioRunner::Execute(const std::vector<std::string>& args) {
    const std::string& cmd = args.at(0);

    if (cmd == "mint") {
        RequireArgs(args, 3, "mint <who> <amount>");
        Amount amount = ParseAmount(args[2]);
        vault_.Mint(ParseAddress(args[1]), amount);
        return OperationResult::Success(amount);
    }
    if (cmd == "fund") {
        RequireArgs(args, 3, "fund <who> <amount>");
        return engine_.AddRewards(ParseAddress(args[1]), ParseAmount(args[2]));
    }
    if (cmd == "stake") {
        RequireArgs(args, 3, "stake <who> <amount>");
        return engine_.Stake(ParseAddress(args[1]), ParseAmount(args[2]));
    }
    if (cmd == "withdraw") {
        RequireArgs(args, 3, "withdraw <who> <amount>");
        return engine_.Withdraw(ParseAddress(args[1]), ParseAmount(args[2]));
    }
    if (cmd == "claim") {
        RequireArgs(args, 2, "claim <who>");
        return engine_.Claim(ParseAddress(args[1]));
    }
    if (cmd == "exit") {
        RequireArgs(args, 2, "exit <who>");
        return engine_.Exit(ParseAddress(args[1]));
    }
    if (cmd == "advance") {
        RequireArgs(args, 2, "advance <duration>");
        if (!util::IsMockTimeEnabled()) {
            throw std::invalid_argument("advance requires mock time");
        }
        util::Seconds step = util::ParseDuration(args[1]);
        util::AdvanceMockTime(step);
        return OperationResult::Success(static_cast<Amount>(step.count()));
    }
    if (cmd == "adjust") {
        RequireArgs(args, 1, "adjust");
        return engine_.UpdateRewardRate();
    }
    if (cmd == "setrate") {
        RequireArgs(args, 2, "setrate <units/s>");
        return engine_.SetRewardRate(admin_, ParseUnsigned(args[1]));
    }
    if (cmd == "setminrate") {
        RequireArgs(args, 2, "setminrate <units/s>");
        return engine_.SetMinRewardRate(admin_, ParseUnsigned(args[1]));
    }
    if (cmd == "setperiod") {
        RequireArgs(args, 2, "setperiod <duration>");
        return engine_.SetRateAdjustmentPeriod(admin_, util::ParseDuration(args[1]).count());
    }
    if (cmd == "setmaxapr") {
        RequireArgs(args, 2, "setmaxapr <bp>");
        return engine_.SetMaxAPR(admin_, ParseUnsigned(args[1]));
    }
    if (cmd == "setminstake") {
        RequireArgs(args, 2, "setminstake <amount>");
        return engine_.SetMinimumStake(admin_, ParseAmount(args[1]));
    }
    if (cmd == "settarget") {
        RequireArgs(args, 2, "settarget <days>");
        return engine_.SetTargetSustainabilityDays(admin_, ParseUnsigned(args[1]));
    }
    if (cmd == "report") {
        if (args.size() == 2) {
            PrintAccount(ParseAddress(args[1]));
        } else {
            RequireArgs(args, 1, "report [<who>]");
            PrintReport();
        }
        return OperationResult::Success();
    }

    throw std::invalid_argument("Unknown command: '" + cmd + "'");
}

// ============================================================================
// Reports
// ============================================================================

void ScenarioRunner::PrintReport() const {
    const staking::GlobalState& state = engine_.GetState();
    staking::RateProposal preview = engine_.PreviewAdjustment();

    out_ << "=== Staking state at " << util::FormatISO8601(util::GetTime()) << " ===\n";
    out_ << "  Total staked:        " << FormatAmount(state.totalStaked) << "\n";
    out_ << "  Reward rate:         " << state.rewardRate << " units/s"
         << " (floor " << state.minRewardRate << ")\n";
    out_ << "  Reward per unit:     " << engine_.RewardPerUnit().ToDecimalString() << "\n";
    out_ << "  Estimated APR:       "
         << staking::FeeSchedule::FormatBps(static_cast<BasisPoints>(
                std::min<uint64_t>(engine_.EstimateAPR(),
                                   std::numeric_limits<BasisPoints>::max())))
         << " (max " << staking::FeeSchedule::FormatBps(
                static_cast<BasisPoints>(state.maxAPR)) << ")\n";
    out_ << "  Available rewards:   " << FormatAmount(engine_.AvailableRewards()) << "\n";
    out_ << "  Sustainability:      " << engine_.SustainabilityDays() << " days (target "
         << state.targetSustainabilityDays << ")\n";
    out_ << "  Last adjustment:     "
         << staking::AdjustmentReasonToString(state.lastAdjustmentReason)
         << " (" << state.adjustmentCount << " total)\n";
    out_ << "  Next adjustment:     " << preview.ToString() << "\n";
    out_ << "  Fees collected:      " << FormatAmount(state.totalFeesCollected) << "\n";
    out_ << "  Rewards distributed: " << FormatAmount(state.totalRewardsDistributed) << "\n";
    out_ << "  Rewards funded:      " << FormatAmount(state.totalRewardsFunded) << "\n";
    out_ << "  Custody balance:     " << FormatAmount(vault_.BalanceOf(engine_.Custody()))
         << "\n";
    out_ << "  Ledger consistent:   " << (engine_.CheckConservation() ? "yes" : "NO") << "\n";

    for (const auto& address : engine_.GetLedger().Addresses()) {
        PrintAccount(address);
    }
}

void ScenarioRunner::PrintAccount(const Address& account) const {
    staking::StakeSnapshot info = engine_.GetStakeInfo(account);
    out_ << "  " << info.ToString()
         << " wallet=" << FormatAmount(vault_.BalanceOf(account)) << "\n";
}

} // namespace sim
} // namespace stakeflow
