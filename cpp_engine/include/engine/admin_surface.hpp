#pragma once

#include <cstdint>

#include "engine/authorizer.hpp"
#include "engine/conversion_engine.hpp"
#include "engine/fee_token.hpp"

namespace tollgate::engine {

/**
 * Role-gated mutators for every tunable of a FeeToken. Each call is one
 * request: the role is checked first, and any failure leaves the token as it
 * was.
 */
class AdminSurface {
  public:
    AdminSurface(FeeToken &token, const Authorizer &authorizer) : token_(token), authorizer_(authorizer) {}

    void set_sell_royalty_rate(const Address &caller, uint32_t rate);
    void set_sell_liquidity_rate(const Address &caller, uint32_t rate);
    void set_buy_liquidity_rate(const Address &caller, uint32_t rate);
    void set_sell_rates(const Address &caller, uint32_t royalty, uint32_t liquidity);

    void set_royalty_threshold(const Address &caller, Amount amount);
    void set_liquidity_threshold(const Address &caller, Amount amount);

    void set_fee_exempt(const Address &caller, const Address &account, bool exempt);
    void set_market_pair(const Address &caller, const Address &account, bool market_pair);
    void migrate_canonical_pair(const Address &caller, const Address &next);
    void set_denied(const Address &caller, const Address &account, bool denied);

    void set_fee_recipient(const Address &caller, const Address &recipient);
    void set_liquidity_receiver(const Address &caller, const Address &receiver);
    void set_swap_enabled(const Address &caller, bool enabled);
    void set_swap_slippage(const Address &caller, uint32_t ppt);
    void set_deposit_slippage(const Address &caller, uint32_t ppt);

    ConversionReport manual_convert_royalty(const Address &caller);
    ConversionReport manual_convert_liquidity(const Address &caller);

    void mint(const Address &caller, const Address &to, Amount amount);
    void burn(const Address &caller, const Address &from, Amount amount);

  private:
    void rate_changed(const char *which);

    FeeToken &token_;
    const Authorizer &authorizer_;
};

}  // namespace tollgate::engine
