#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "engine/journal.hpp"
#include "engine/types.hpp"

namespace tollgate::engine {

// Rates are numerators over `denominator` (parts-per-thousand by default).
struct FeeConfig {
    uint32_t sell_royalty{0};
    uint32_t buy_liquidity{0};
    uint32_t sell_liquidity{0};
    uint32_t denominator{1000};
    uint32_t max_sell_total{100};  // ceiling on sell_royalty + sell_liquidity
    std::string source{"default"};
};

struct FeeResult {
    TransferKind kind{TransferKind::Wallet};
    Amount royalty_fee{0};
    Amount liquidity_fee{0};

    Amount total() const { return royalty_fee + liquidity_fee; }
};

class FeeSchedule : public Revertible {
  public:
    explicit FeeSchedule(FeeConfig cfg);

    FeeResult compute(TransferKind kind, Amount amount) const;
    const FeeConfig &config() const { return cfg_; }

    // Each setter validates the would-be schedule first; on rejection the
    // current rates are untouched.
    void set_sell_royalty(uint32_t rate);
    void set_sell_liquidity(uint32_t rate);
    void set_buy_liquidity(uint32_t rate);
    void set_sell_rates(uint32_t royalty, uint32_t liquidity);

    static Amount apply_rate(Amount amount, uint32_t rate, uint32_t denominator);

    void checkpoint() override { saved_ = cfg_; }
    void rollback() override;
    void release() override { saved_.reset(); }

  private:
    static void validate(const FeeConfig &cfg);
    void replace(const FeeConfig &next);

    FeeConfig cfg_;
    std::optional<FeeConfig> saved_;
};

}  // namespace tollgate::engine
