#include "engine/fee_token.hpp"

#include <sstream>
#include <utility>

#include "engine/amount_math.hpp"
#include "engine/errors.hpp"
#include "utils/logger.hpp"

namespace tollgate::engine {
namespace {

TokenConfig checked_token_config(TokenConfig cfg) {
    if (cfg.self.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, "token address must not be the zero address");
    }
    return cfg;
}

}  // namespace

FeeToken::FeeToken(TokenConfig token_cfg, FeeConfig fee_cfg, ConversionConfig conversion_cfg, Ledger &ledger,
                   Ledger &reference, Exchange &exchange, Journal &journal, EventBus &events)
    : token_cfg_(checked_token_config(std::move(token_cfg))),
      ledger_(ledger),
      journal_(journal),
      events_(events),
      registry_(exchange.create_pair(*this)),
      schedule_(std::move(fee_cfg)),
      conversion_(std::move(conversion_cfg), ledger, reference, exchange, accrual_, events) {
    conversion_.bind(token_cfg_.self, registry_.canonical_pair());
    registry_.set_fee_exempt(token_cfg_.self, true);

    journal_.track(ledger);
    journal_.track(reference);
    journal_.track(accrual_);
    journal_.track(registry_);
    journal_.track(schedule_);
    journal_.track(conversion_);
    journal_.track(events_);
    journal_.track(*this);

    const FeeConfig &fees = schedule_.config();
    std::stringstream ss;
    ss << token_cfg_.symbol << " engine at " << token_cfg_.self.str() << " pair=" << registry_.canonical_pair().str()
       << " sell_royalty=" << fees.sell_royalty << " sell_liquidity=" << fees.sell_liquidity
       << " buy_liquidity=" << fees.buy_liquidity << "/" << fees.denominator << " fees=" << fees.source;
    utils::info(ss.str());
}

void FeeToken::transfer(const Address &from, const Address &to, Amount amount) {
    // Engine custody leaves only through the allowance it grants the router.
    if (from == token_cfg_.self) {
        throw EngineError(ErrorCode::Unauthorized, "engine custody " + from.str() + " moves only through an allowance");
    }
    Journal::Scope scope(journal_);
    require_movable(from, to, amount);
    settle_transfer(from, to, amount);
    scope.commit();
}

void FeeToken::transfer_from(const Address &spender, const Address &from, const Address &to, Amount amount) {
    Journal::Scope scope(journal_);
    if (spender.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, "spender must not be the zero address");
    }
    // A refused nested call must leave the allowance untouched; nested scopes
    // never roll back on their own.
    require_movable(from, to, amount);
    ledger_.spend_allowance(from, spender, amount);
    settle_transfer(from, to, amount);
    scope.commit();
}

void FeeToken::require_movable(const Address &from, const Address &to, Amount amount) const {
    if (from.is_zero() || to.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, "transfer " + display(from) + " -> " + display(to));
    }
    if (amount == 0) {
        throw EngineError(ErrorCode::ZeroAmount, "transfer amount must be positive");
    }
    if (registry_.is_denied(from) || registry_.is_denied(to)) {
        throw EngineError(ErrorCode::DeniedAccount, "transfer " + from.str() + " -> " + to.str() + " touches a denied account");
    }
    // While a conversion is in flight only the engine's own custody may move.
    if (!conversion_.idle() && from != token_cfg_.self) {
        throw EngineError(ErrorCode::Reentrant, "transfer from " + from.str() + " during " +
                                                    state_name(conversion_.state()));
    }
    const Amount have = ledger_.balance_of(from);
    if (have < amount) {
        throw EngineError(ErrorCode::InsufficientBalance, token_cfg_.symbol + " balance of " + from.str() + " is " +
                                                              std::to_string(have) + ", needs " +
                                                              std::to_string(amount));
    }
    if (from == token_cfg_.self) {
        const Amount backing = accrual_.balances().total();
        if (have < checked_add(amount, backing)) {
            throw EngineError(ErrorCode::InsufficientPool, "moving " + std::to_string(amount) + " of engine custody " +
                                                               std::to_string(have) + " would leave pools of " +
                                                               std::to_string(backing) + " unbacked");
        }
    }
}

void FeeToken::settle_transfer(const Address &from, const Address &to, Amount amount) {
    const TransferKind kind = registry_.classify(from, to);
    const bool exempt = registry_.is_fee_exempt(from) || registry_.is_fee_exempt(to);
    FeeResult fees;
    fees.kind = kind;
    if (!exempt) {
        fees = schedule_.compute(kind, amount);
    }
    const Amount total_fee = fees.total();
    if (total_fee > 0) {
        ledger_.settle(from, token_cfg_.self, total_fee);
        accrual_.credit(fees.royalty_fee, fees.liquidity_fee);
        std::stringstream ss;
        ss << "from=" << from.str() << " kind=" << kind_name(kind) << " royalty=" << fees.royalty_fee
           << " liquidity=" << fees.liquidity_fee << " royalty_pool=" << accrual_.royalty_pool()
           << " liquidity_pool=" << accrual_.liquidity_pool();
        events_.emit(Event::Type::FeesCredited, ss.str());
    }

    if (kind == TransferKind::Sell && conversion_.config().swap_enabled) {
        conversion_.maybe_convert();
    }

    const Amount net = amount - total_fee;
    ledger_.settle(from, to, net);
    events_.emit(Event::Type::Transfer, "from=" + from.str() + " to=" + to.str() + " amount=" + std::to_string(net));

    ++metrics_.transfers;
    if (exempt) {
        ++metrics_.exempt;
    }
    switch (kind) {
        case TransferKind::Sell:
            ++metrics_.sells;
            break;
        case TransferKind::Buy:
            ++metrics_.buys;
            break;
        case TransferKind::Wallet:
            ++metrics_.wallet;
            break;
    }
    metrics_.royalty_collected = checked_add(metrics_.royalty_collected, fees.royalty_fee);
    metrics_.liquidity_collected = checked_add(metrics_.liquidity_collected, fees.liquidity_fee);
}

void FeeToken::approve(const Address &owner, const Address &spender, Amount amount) {
    Journal::Scope scope(journal_);
    if (registry_.is_denied(owner)) {
        throw EngineError(ErrorCode::DeniedAccount, "denied account " + owner.str() + " cannot approve");
    }
    ledger_.approve(owner, spender, amount);
    scope.commit();
}

InvariantReport FeeToken::check_invariants() const {
    InvariantReport report;
    const Amount custody = ledger_.balance_of(token_cfg_.self);
    const PoolBalances &pools = accrual_.balances();
    if (pools.total() > custody) {
        std::stringstream ss;
        ss << "pools " << pools.royalty << "+" << pools.liquidity << " exceed engine balance " << custody;
        report.ok = false;
        report.message = ss.str();
        return report;
    }
    if (!journal_.in_request() && !conversion_.idle()) {
        report.ok = false;
        report.message = std::string("conversion state left at ") + state_name(conversion_.state());
        return report;
    }
    if (!registry_.is_market_pair(registry_.canonical_pair())) {
        report.ok = false;
        report.message = "canonical pair lost its market flag";
    }
    return report;
}

void FeeToken::rollback() {
    if (saved_) {
        metrics_ = *saved_;
        saved_.reset();
    }
}

}  // namespace tollgate::engine
