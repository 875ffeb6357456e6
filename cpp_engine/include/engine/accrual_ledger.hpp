#pragma once

#include <optional>

#include "engine/journal.hpp"
#include "engine/types.hpp"

namespace tollgate::engine {

struct PoolBalances {
    Amount royalty{0};
    Amount liquidity{0};

    Amount total() const { return royalty + liquidity; }
};

// Fee tokens held by the engine and not yet converted.
class AccrualLedger : public Revertible {
  public:
    AccrualLedger() = default;

    void credit(Amount royalty, Amount liquidity);
    Amount drain_royalty();
    Amount drain_liquidity();

    const PoolBalances &balances() const { return pools_; }
    Amount royalty_pool() const { return pools_.royalty; }
    Amount liquidity_pool() const { return pools_.liquidity; }

    void checkpoint() override { saved_ = pools_; }
    void rollback() override;
    void release() override { saved_.reset(); }

  private:
    PoolBalances pools_;
    std::optional<PoolBalances> saved_;
};

}  // namespace tollgate::engine
