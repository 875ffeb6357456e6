#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "engine/exchange.hpp"
#include "engine/journal.hpp"
#include "engine/ledger.hpp"

namespace tollgate::engine {

struct ExchangeConfig {
    Address router{"exchange.router"};
    uint32_t fee_numerator{3};  // 0.3% of the input stays in the pool
    uint32_t fee_denominator{1000};
    std::string source{"default"};
};

/**
 * x*y=k market between fee-bearing tokens and the reference asset. Inputs are
 * measured as pair balance minus recorded reserves, so tokens that arrive net
 * of transfer fees are priced on what actually landed.
 */
class ConstantProductExchange : public Exchange, public Revertible {
  public:
    explicit ConstantProductExchange(Ledger &reference, ExchangeConfig cfg = ExchangeConfig{});

    const Address &router() const override { return cfg_.router; }
    Address create_pair(TokenPort &token) override;
    Reserves reserves(const Address &pair) const override;
    Amount get_amount_out(Amount amount_in, Amount reserve_in, Amount reserve_out) const override;

    Amount swap_tokens_for_reference(const Address &pair, Amount amount_in, Amount min_out, const Address &from,
                                     const Address &to, int64_t deadline) override;
    Amount swap_reference_for_tokens(const Address &pair, Amount amount_in, Amount min_out, const Address &from,
                                     const Address &to, int64_t deadline);
    DepositReceipt add_liquidity(const Address &pair, Amount token_amount, Amount reference_amount,
                                 Amount min_token, Amount min_reference, const Address &from, const Address &to,
                                 int64_t deadline) override;

    Amount shares_of(const Address &pair, const Address &holder) const;
    Amount total_shares(const Address &pair) const;
    const ExchangeConfig &config() const { return cfg_; }

    void checkpoint() override { saved_ = pools_; }
    void rollback() override;
    void release() override { saved_.reset(); }

  private:
    struct Pool {
        TokenPort *token{nullptr};
        Reserves reserves;
        std::map<Address, Amount> shares;
        Amount total_shares{0};
    };

    Pool &pool_at(const Address &pair);
    const Pool &pool_at(const Address &pair) const;
    void sync(const Address &pair, Pool &pool);
    static void check_deadline(int64_t deadline);

    Ledger &reference_;
    ExchangeConfig cfg_;
    std::map<Address, Pool> pools_;
    std::optional<std::map<Address, Pool>> saved_;
};

}  // namespace tollgate::engine
