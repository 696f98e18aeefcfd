// STAKEFLOW - Scenario Runner
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Replays a line-oriented scenario against a staking engine under mock time.
//
// Commands (addresses are a small integer id or 40 hex characters, amounts
// are decimal token amounts, durations use the "7d"/"12h"/"30m" forms):
//   mint <who> <amount>          credit a wallet in the vault
//   fund <who> <amount>          add to the reward pool
//   stake <who> <amount>
//   withdraw <who> <amount>
//   claim <who>
//   exit <who>
//   advance <duration>           move mock time forward
//   adjust                       run the rate controller if due
//   setrate <units/s>            admin commands, issued as the admin address
//   setminrate <units/s>
//   setperiod <duration>
//   setmaxapr <bp>
//   setminstake <amount>
//   settarget <days>
//   report [<who>]
// Blank lines and text after '#' are ignored.

#ifndef STAKEFLOW_SIM_SCENARIO_H
#define STAKEFLOW_SIM_SCENARIO_H

#include <stakeflow/core/types.h>
#include <stakeflow/staking/engine.h>
#include <stakeflow/staking/vault.h>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace stakeflow {
namespace sim {

/// Parse "7" (id) or a 40-character hex address
Address ParseAddress(const std::string& token);

struct ScenarioResult {
    bool success{true};
    size_t steps{0};
    size_t rejected{0};
    int errorLine{0};
    std::string error;
};

class ScenarioRunner {
public:
    ScenarioRunner(staking::StakingEngine& engine, staking::InMemoryTokenVault& vault,
                   const Address& admin, std::ostream& out);

    /// Stop at the first operation the engine rejects
    void SetStrict(bool strict) { strict_ = strict; }

    ScenarioResult Run(std::istream& in);

    /**
     * Execute one command.
     *
     * @return Engine result for staking commands, success for the others
     * @throws std::invalid_argument on an unknown command or bad argument
     */
    staking::OperationResult Execute(const std::vector<std::string>& args);

    /// Global state plus every known account
    void PrintReport() const;

    void PrintAccount(const Address& account) const;

private:
    static std::vector<std::string> Tokenize(const std::string& line);

    staking::StakingEngine& engine_;
    staking::InMemoryTokenVault& vault_;
    Address admin_;
    std::ostream& out_;
    bool strict_{false};
};

} // namespace sim
} // namespace stakeflow

#endif // STAKEFLOW_SIM_SCENARIO_H
