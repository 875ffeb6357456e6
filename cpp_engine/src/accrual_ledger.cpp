#include "engine/accrual_ledger.hpp"

#include "engine/amount_math.hpp"

namespace tollgate::engine {

void AccrualLedger::credit(Amount royalty, Amount liquidity) {
    const Amount next_royalty = checked_add(pools_.royalty, royalty);
    const Amount next_liquidity = checked_add(pools_.liquidity, liquidity);
    // the combined pools must stay representable as a single balance
    static_cast<void>(checked_add(next_royalty, next_liquidity));
    pools_.royalty = next_royalty;
    pools_.liquidity = next_liquidity;
}

Amount AccrualLedger::drain_royalty() {
    const Amount amount = pools_.royalty;
    pools_.royalty = 0;
    return amount;
}

Amount AccrualLedger::drain_liquidity() {
    const Amount amount = pools_.liquidity;
    pools_.liquidity = 0;
    return amount;
}

void AccrualLedger::rollback() {
    if (saved_) {
        pools_ = *saved_;
        saved_.reset();
    }
}

}  // namespace tollgate::engine
