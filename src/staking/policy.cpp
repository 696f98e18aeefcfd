// STAKEFLOW - Staking Policy Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/policy.h"
#include "stakeflow/util/logging.h"
#include "stakeflow/util/time.h"

#include <sstream>
#include <stdexcept>

namespace stakeflow {
namespace staking {

// ============================================================================
// Range Checks
// ============================================================================

bool IsValidRewardRate(Amount rate, Amount minRewardRate) {
    return rate >= minRewardRate && rate <= MAX_REWARD_RATE;
}

bool IsValidMinRewardRate(Amount value) {
    return value > 0 && value <= MAX_REWARD_RATE;
}

bool IsValidAdjustmentPeriod(int64_t seconds) {
    return seconds >= MIN_ADJUSTMENT_PERIOD && seconds <= MAX_ADJUSTMENT_PERIOD;
}

bool IsValidMaxAPR(uint64_t bps) {
    return bps >= MIN_MAX_APR && bps <= MAX_MAX_APR;
}

bool IsValidMinimumStake(Amount value) {
    return value > 0;
}

bool IsValidTargetDays(uint64_t days) {
    return days >= MIN_TARGET_DAYS && days <= MAX_TARGET_DAYS;
}

// ============================================================================
// StakingPolicy
// ============================================================================

std::optional<std::string> StakingPolicy::Validate() const {
    if (!IsValidMinRewardRate(minRewardRate)) {
        return "minRewardRate out of range";
    }
    if (!IsValidRewardRate(rewardRate, minRewardRate)) {
        return "rewardRate must lie between minRewardRate and MAX_REWARD_RATE";
    }
    if (!IsValidAdjustmentPeriod(rateAdjustmentPeriod)) {
        return "rateAdjustmentPeriod must be between 1 hour and 30 days";
    }
    if (!IsValidMaxAPR(maxAPR)) {
        return "maxAPR out of range";
    }
    if (!IsValidTargetDays(targetSustainabilityDays)) {
        return "targetSustainabilityDays out of range";
    }
    if (!IsValidMinimumStake(minimumStake)) {
        return "minimumStake must be positive";
    }
    if (custody.IsNull()) {
        return "custody address is null";
    }
    if (custody == feeRecipient) {
        return "feeRecipient must differ from custody";
    }
    return std::nullopt;
}

std::string StakingPolicy::ToString() const {
    std::ostringstream ss;
    ss << "StakingPolicy(rate=" << rewardRate
       << ", minRate=" << minRewardRate
       << ", period=" << util::FormatDuration(util::Seconds(rateAdjustmentPeriod))
       << ", maxAPR=" << maxAPR << "bp"
       << ", targetDays=" << targetSustainabilityDays
       << ", minStake=" << FormatAmount(minimumStake)
       << ", custody=" << custody.ToShortString()
       << ", feeRecipient=" << feeRecipient.ToShortString()
       << ", admins=" << admins.size()
       << ")";
    return ss.str();
}

// ============================================================================
// Configuration Loading
// ============================================================================

namespace {

util::ConfigParseResult KeyError(const util::ConfigManager& config,
                                 const std::string& key,
                                 const std::string& what) {
    auto entry = config.GetEntry(key, POLICY_SECTION);
    std::string source = entry ? entry->source : "";
    int line = entry ? entry->lineNumber : 0;
    return util::ConfigParseResult::Error(
        std::string(POLICY_SECTION) + "." + key + ": " + what, source, line);
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::string item;
    std::istringstream in(value);
    while (std::getline(in, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            items.push_back(item.substr(start, end - start + 1));
        }
    }
    return items;
}

} // namespace

util::ConfigParseResult LoadStakingPolicy(const util::ConfigManager& config,
                                          StakingPolicy& policy) {
    StakingPolicy loaded = policy;

    auto readUInt = [&](const char* key, uint64_t& out) -> bool {
        if (!config.HasKey(key, POLICY_SECTION)) {
            return true;
        }
        auto value = config.TryGetUInt(key, POLICY_SECTION);
        if (!value) {
            return false;
        }
        out = *value;
        return true;
    };

    if (!readUInt("rewardrate", loaded.rewardRate)) {
        return KeyError(config, "rewardrate", "expected an unsigned integer");
    }
    if (!readUInt("minrewardrate", loaded.minRewardRate)) {
        return KeyError(config, "minrewardrate", "expected an unsigned integer");
    }
    if (!readUInt("maxapr", loaded.maxAPR)) {
        return KeyError(config, "maxapr", "expected basis points");
    }
    if (!readUInt("targetdays", loaded.targetSustainabilityDays)) {
        return KeyError(config, "targetdays", "expected a number of days");
    }

    try {
        if (auto period = config.TryGetString("adjustmentperiod", POLICY_SECTION)) {
            loaded.rateAdjustmentPeriod = util::ParseDuration(*period).count();
        }
    } catch (const std::invalid_argument& e) {
        return KeyError(config, "adjustmentperiod", e.what());
    }

    try {
        if (auto stake = config.TryGetString("minimumstake", POLICY_SECTION)) {
            loaded.minimumStake = ParseAmount(*stake);
        }
    } catch (const std::invalid_argument& e) {
        return KeyError(config, "minimumstake", e.what());
    }

    const char* addressKey = "custody";
    try {
        if (auto custody = config.TryGetString(addressKey, POLICY_SECTION)) {
            loaded.custody = Address::FromHex(*custody);
        }
        addressKey = "feerecipient";
        if (auto recipient = config.TryGetString(addressKey, POLICY_SECTION)) {
            loaded.feeRecipient = Address::FromHex(*recipient);
        }
        addressKey = "admin";
        if (auto admins = config.TryGetString(addressKey, POLICY_SECTION)) {
            loaded.admins.clear();
            for (const auto& hex : SplitList(*admins)) {
                loaded.admins.push_back(Address::FromHex(hex));
            }
        }
    } catch (const std::invalid_argument& e) {
        return KeyError(config, addressKey, e.what());
    }

    if (auto error = loaded.Validate()) {
        return util::ConfigParseResult::Error(*error, "[" + std::string(POLICY_SECTION) + "]");
    }

    policy = loaded;
    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << policy.ToString();
    return util::ConfigParseResult::Success();
}

} // namespace staking
} // namespace stakeflow
