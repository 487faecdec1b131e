// Ratevault - Rewards Distributor Interface

#pragma once

#include <ratevault/types.hpp>

namespace ratevault {

// Pays accrued market rewards to `holder` in the distributor's reward token
class RewardsDistributor {
public:
    virtual ~RewardsDistributor() = default;
    virtual void claim_rewards(const Address& holder) = 0;
};

}  // namespace ratevault
