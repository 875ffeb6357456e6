#pragma once

#include <cstdint>

#include "engine/types.hpp"

namespace tollgate::engine {

struct Reserves {
    Amount token{0};
    Amount reference{0};
    int64_t updated_s{0};
};

struct DepositReceipt {
    Amount token_used{0};
    Amount reference_used{0};
    Amount shares{0};
};

// The exchange's view of the fee-bearing token: it pulls sellers' tokens with
// transfer_from and pays buyers with transfer, both of which run through the
// fee interceptor.
class TokenPort {
  public:
    virtual ~TokenPort() = default;

    virtual const Address &address() const = 0;
    virtual Amount balance_of(const Address &account) const = 0;
    virtual void transfer(const Address &from, const Address &to, Amount amount) = 0;
    virtual void transfer_from(const Address &spender, const Address &from, const Address &to, Amount amount) = 0;
};

/**
 * Market the engine converts accrued tokens through. Implementations move the
 * reference asset on their own ledger; amounts returned are advisory, callers
 * measure balances themselves.
 */
class Exchange {
  public:
    virtual ~Exchange() = default;

    // Spender the token owner must approve before a swap or deposit.
    virtual const Address &router() const = 0;
    virtual Address create_pair(TokenPort &token) = 0;
    virtual Reserves reserves(const Address &pair) const = 0;
    virtual Amount get_amount_out(Amount amount_in, Amount reserve_in, Amount reserve_out) const = 0;

    virtual Amount swap_tokens_for_reference(const Address &pair, Amount amount_in, Amount min_out,
                                             const Address &from, const Address &to, int64_t deadline) = 0;
    virtual DepositReceipt add_liquidity(const Address &pair, Amount token_amount, Amount reference_amount,
                                         Amount min_token, Amount min_reference, const Address &from,
                                         const Address &to, int64_t deadline) = 0;
};

}  // namespace tollgate::engine
