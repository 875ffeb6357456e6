#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "engine/accrual_ledger.hpp"
#include "engine/event_bus.hpp"
#include "engine/exchange.hpp"
#include "engine/journal.hpp"
#include "engine/ledger.hpp"
#include "engine/types.hpp"

namespace tollgate::engine {

struct ConversionConfig {
    Amount min_royalty_to_swap{0};
    Amount min_liquidity_to_swap{0};
    bool swap_enabled{true};
    uint32_t swap_slippage{50};       // ppt below the reserve quote still accepted
    uint32_t deposit_slippage{1000};  // ppt; 1000 puts no floor on the deposit
    int64_t deadline_window_s{300};
    Address fee_recipient;
    Address liquidity_receiver;
    std::string source{"default"};
};

struct ConversionReport {
    ConversionOutcome outcome{ConversionOutcome::None};
    Amount tokens_swapped{0};
    Amount reference_received{0};
    Amount tokens_deposited{0};
    Amount reference_deposited{0};
    Amount shares_minted{0};
};

struct ConversionMetrics {
    uint64_t royalty_conversions{0};
    uint64_t liquidity_conversions{0};
    uint64_t manual_conversions{0};
    uint64_t skipped_busy{0};
    Amount royalty_forwarded{0};
    Amount reference_deposited{0};
};

// Holds the conversion state for the lifetime of one conversion and returns
// it to Idle on every exit path.
class ConversionGuard {
  public:
    ConversionGuard(ConversionState &state, ConversionState target);
    ~ConversionGuard();
    ConversionGuard(const ConversionGuard &) = delete;
    ConversionGuard &operator=(const ConversionGuard &) = delete;

  private:
    ConversionState &state_;
};

/**
 * Turns accrued fee tokens into the reference asset. Royalty proceeds are
 * forwarded to the fee recipient; the liquidity pool is split in two, one half
 * swapped and deposited with the other half. Every swap carries a minimum
 * output derived from the pair's reserves.
 */
class ConversionEngine : public Revertible {
  public:
    ConversionEngine(ConversionConfig cfg, Ledger &ledger, Ledger &reference, Exchange &exchange,
                     AccrualLedger &accrual, EventBus &events);

    void bind(const Address &self, const Address &pair);
    void set_pair(const Address &pair) { pair_ = pair; }

    // Called on the sell path. Does nothing while another conversion holds
    // the state or when no pool has reached its threshold.
    ConversionReport maybe_convert();
    ConversionReport convert_royalty(bool manual);
    ConversionReport convert_liquidity(bool manual);

    Amount min_output_for(Amount amount_in) const;

    ConversionState state() const { return state_; }
    bool idle() const { return state_ == ConversionState::Idle; }
    bool royalty_latch() const { return state_ == ConversionState::ConvertingRoyalty; }
    bool liquidity_latch() const { return state_ == ConversionState::ConvertingLiquidity; }
    const ConversionConfig &config() const { return cfg_; }
    const ConversionMetrics &metrics() const { return metrics_; }
    const Address &pair() const { return pair_; }

    void set_royalty_threshold(Amount amount) { cfg_.min_royalty_to_swap = amount; }
    void set_liquidity_threshold(Amount amount) { cfg_.min_liquidity_to_swap = amount; }
    void set_swap_enabled(bool enabled) { cfg_.swap_enabled = enabled; }
    void set_fee_recipient(const Address &recipient);
    void set_liquidity_receiver(const Address &receiver);
    void set_swap_slippage(uint32_t ppt);
    void set_deposit_slippage(uint32_t ppt);

    void checkpoint() override { saved_ = Saved{cfg_, pair_, metrics_}; }
    void rollback() override;
    void release() override { saved_.reset(); }

  private:
    void require_idle(const char *what) const;
    Amount swap_for_reference(Amount amount);
    int64_t deadline() const;

    ConversionConfig cfg_;
    Ledger &ledger_;
    Ledger &reference_;
    Exchange &exchange_;
    AccrualLedger &accrual_;
    EventBus &events_;
    Address self_;
    Address pair_;
    ConversionState state_{ConversionState::Idle};
    ConversionMetrics metrics_;

    struct Saved {
        ConversionConfig cfg;
        Address pair;
        ConversionMetrics metrics;
    };
    std::optional<Saved> saved_;
};

}  // namespace tollgate::engine
