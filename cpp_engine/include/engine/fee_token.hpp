#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "engine/account_registry.hpp"
#include "engine/accrual_ledger.hpp"
#include "engine/conversion_engine.hpp"
#include "engine/event_bus.hpp"
#include "engine/exchange.hpp"
#include "engine/fee_schedule.hpp"
#include "engine/journal.hpp"
#include "engine/ledger.hpp"

namespace tollgate::engine {

struct TokenConfig {
    std::string name{"Tollgate"};
    std::string symbol{"TOLL"};
    Address self{"tollgate.token"};
    std::string source{"default"};
};

struct TransferMetrics {
    uint64_t transfers{0};
    uint64_t sells{0};
    uint64_t buys{0};
    uint64_t wallet{0};
    uint64_t exempt{0};
    Amount royalty_collected{0};
    Amount liquidity_collected{0};
};

struct InvariantReport {
    bool ok{true};
    std::string message;
};

/**
 * Fee-bearing token. Every movement of value goes through transfer(), which
 * classifies it, moves the fee into the engine's custody, lets the conversion
 * engine run on sells, and settles the net amount last. The engine's own
 * balance backs the pools and leaves only through transfer_from by the router.
 */
class FeeToken : public TokenPort, public Revertible {
  public:
    FeeToken(TokenConfig token_cfg, FeeConfig fee_cfg, ConversionConfig conversion_cfg, Ledger &ledger,
             Ledger &reference, Exchange &exchange, Journal &journal, EventBus &events);
    FeeToken(const FeeToken &) = delete;
    FeeToken &operator=(const FeeToken &) = delete;

    const Address &address() const override { return token_cfg_.self; }
    Amount balance_of(const Address &account) const override { return ledger_.balance_of(account); }
    void transfer(const Address &from, const Address &to, Amount amount) override;
    void transfer_from(const Address &spender, const Address &from, const Address &to, Amount amount) override;
    void approve(const Address &owner, const Address &spender, Amount amount);
    Amount allowance(const Address &owner, const Address &spender) const { return ledger_.allowance(owner, spender); }
    Amount total_supply() const { return ledger_.total_supply(); }

    const TokenConfig &config() const { return token_cfg_; }
    const Address &pair() const { return registry_.canonical_pair(); }
    AccountRegistry &registry() { return registry_; }
    const AccountRegistry &registry() const { return registry_; }
    FeeSchedule &schedule() { return schedule_; }
    const FeeSchedule &schedule() const { return schedule_; }
    const AccrualLedger &accrual() const { return accrual_; }
    ConversionEngine &conversion() { return conversion_; }
    const ConversionEngine &conversion() const { return conversion_; }
    Ledger &ledger() { return ledger_; }
    Journal &journal() { return journal_; }
    EventBus &events() { return events_; }
    const TransferMetrics &metrics() const { return metrics_; }

    InvariantReport check_invariants() const;

    void checkpoint() override { saved_ = metrics_; }
    void rollback() override;
    void release() override { saved_.reset(); }

  private:
    void require_movable(const Address &from, const Address &to, Amount amount) const;
    void settle_transfer(const Address &from, const Address &to, Amount amount);

    TokenConfig token_cfg_;
    Ledger &ledger_;
    Journal &journal_;
    EventBus &events_;
    AccountRegistry registry_;
    FeeSchedule schedule_;
    AccrualLedger accrual_;
    ConversionEngine conversion_;
    TransferMetrics metrics_;
    std::optional<TransferMetrics> saved_;
};

}  // namespace tollgate::engine
