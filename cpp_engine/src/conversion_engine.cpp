#include "engine/conversion_engine.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "engine/amount_math.hpp"
#include "engine/errors.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"

namespace tollgate::engine {
namespace {

constexpr uint32_t kSlippageDenominator = 1000;

void require_receiver(const Address &address, const char *what) {
    if (address.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, std::string(what) + " must not be the zero address");
    }
}

Amount apply_slippage(Amount amount, uint32_t ppt) {
    return mul_div(amount, kSlippageDenominator - ppt, kSlippageDenominator);
}

}  // namespace

ConversionGuard::ConversionGuard(ConversionState &state, ConversionState target) : state_(state) {
    if (state_ != ConversionState::Idle) {
        throw EngineError(ErrorCode::Reentrant, std::string("conversion already in flight: ") + state_name(state_));
    }
    state_ = target;
}

ConversionGuard::~ConversionGuard() { state_ = ConversionState::Idle; }

ConversionEngine::ConversionEngine(ConversionConfig cfg, Ledger &ledger, Ledger &reference, Exchange &exchange,
                                   AccrualLedger &accrual, EventBus &events)
    : cfg_(std::move(cfg)), ledger_(ledger), reference_(reference), exchange_(exchange), accrual_(accrual),
      events_(events) {
    require_receiver(cfg_.fee_recipient, "fee recipient");
    require_receiver(cfg_.liquidity_receiver, "liquidity receiver");
    if (cfg_.swap_slippage >= kSlippageDenominator) {
        throw EngineError(ErrorCode::InvalidRate, "swap slippage must stay below 1000 ppt");
    }
    if (cfg_.deposit_slippage > kSlippageDenominator) {
        throw EngineError(ErrorCode::InvalidRate, "deposit slippage must not exceed 1000 ppt");
    }
    if (cfg_.deadline_window_s < 0) {
        throw EngineError(ErrorCode::InvalidRate, "deadline window must not be negative");
    }
}

void ConversionEngine::bind(const Address &self, const Address &pair) {
    self_ = self;
    pair_ = pair;
}

ConversionReport ConversionEngine::maybe_convert() {
    if (!idle()) {
        ++metrics_.skipped_busy;
        return ConversionReport{};
    }
    const PoolBalances &pools = accrual_.balances();
    if (pools.royalty > 0 && pools.royalty >= cfg_.min_royalty_to_swap) {
        return convert_royalty(false);
    }
    if (pools.liquidity >= 2 && pools.liquidity >= cfg_.min_liquidity_to_swap) {
        return convert_liquidity(false);
    }
    return ConversionReport{};
}

ConversionReport ConversionEngine::convert_royalty(bool manual) {
    require_idle("royalty conversion");
    if (accrual_.royalty_pool() == 0) {
        throw EngineError(ErrorCode::InsufficientPool, "royalty pool is empty");
    }
    ConversionGuard guard(state_, ConversionState::ConvertingRoyalty);

    ConversionReport report;
    report.outcome = ConversionOutcome::Royalty;
    report.tokens_swapped = accrual_.drain_royalty();
    events_.emit(Event::Type::ConversionStarted, "pool=royalty amount=" + std::to_string(report.tokens_swapped));

    report.reference_received = swap_for_reference(report.tokens_swapped);
    if (report.reference_received > 0) {
        reference_.settle(self_, cfg_.fee_recipient, report.reference_received);
    }

    ++metrics_.royalty_conversions;
    metrics_.royalty_forwarded = checked_add(metrics_.royalty_forwarded, report.reference_received);
    std::stringstream ss;
    ss << "pool=royalty swapped=" << report.tokens_swapped << " received=" << report.reference_received
       << " recipient=" << cfg_.fee_recipient.str();
    events_.emit(Event::Type::ConversionFinished, ss.str());
    if (manual) {
        ++metrics_.manual_conversions;
        events_.emit(Event::Type::ManualConversion, ss.str());
    }
    utils::info("royalty conversion: " + ss.str());
    return report;
}

ConversionReport ConversionEngine::convert_liquidity(bool manual) {
    require_idle("liquidity conversion");
    if (accrual_.liquidity_pool() < 2) {
        throw EngineError(ErrorCode::InsufficientPool,
                          "liquidity pool of " + std::to_string(accrual_.liquidity_pool()) + " cannot be split");
    }
    ConversionGuard guard(state_, ConversionState::ConvertingLiquidity);

    ConversionReport report;
    report.outcome = ConversionOutcome::Liquidity;
    const Amount pool = accrual_.drain_liquidity();
    const Amount half = pool / 2;
    const Amount rest = pool - half;
    events_.emit(Event::Type::ConversionStarted, "pool=liquidity amount=" + std::to_string(pool));

    report.tokens_swapped = half;
    report.reference_received = swap_for_reference(half);

    ledger_.approve(self_, exchange_.router(), rest);
    const Amount min_token = apply_slippage(rest, cfg_.deposit_slippage);
    const Amount min_reference = apply_slippage(report.reference_received, cfg_.deposit_slippage);
    const DepositReceipt receipt = exchange_.add_liquidity(pair_, rest, report.reference_received, min_token,
                                                           min_reference, self_, cfg_.liquidity_receiver,
                                                           deadline());
    ledger_.approve(self_, exchange_.router(), 0);
    report.tokens_deposited = receipt.token_used;
    report.reference_deposited = receipt.reference_used;
    report.shares_minted = receipt.shares;

    ++metrics_.liquidity_conversions;
    metrics_.reference_deposited = checked_add(metrics_.reference_deposited, receipt.reference_used);
    std::stringstream ss;
    ss << "pool=liquidity swapped=" << half << " received=" << report.reference_received
       << " deposited_tokens=" << receipt.token_used << " deposited_reference=" << receipt.reference_used
       << " shares=" << receipt.shares;
    events_.emit(Event::Type::ConversionFinished, ss.str());
    if (manual) {
        ++metrics_.manual_conversions;
        events_.emit(Event::Type::ManualConversion, ss.str());
    }
    utils::info("liquidity conversion: " + ss.str());
    return report;
}

Amount ConversionEngine::min_output_for(Amount amount_in) const {
    const Reserves r = exchange_.reserves(pair_);
    if (r.token == 0 || r.reference == 0) {
        throw EngineError(ErrorCode::InsufficientLiquidity, "pair " + display(pair_) + " has no reserves to quote");
    }
    const Amount expected = exchange_.get_amount_out(amount_in, r.token, r.reference);
    return std::max<Amount>(1, apply_slippage(expected, cfg_.swap_slippage));
}

void ConversionEngine::set_fee_recipient(const Address &recipient) {
    require_receiver(recipient, "fee recipient");
    cfg_.fee_recipient = recipient;
}

void ConversionEngine::set_liquidity_receiver(const Address &receiver) {
    require_receiver(receiver, "liquidity receiver");
    cfg_.liquidity_receiver = receiver;
}

void ConversionEngine::set_swap_slippage(uint32_t ppt) {
    if (ppt >= kSlippageDenominator) {
        throw EngineError(ErrorCode::InvalidRate, "swap slippage must stay below 1000 ppt");
    }
    cfg_.swap_slippage = ppt;
}

void ConversionEngine::set_deposit_slippage(uint32_t ppt) {
    if (ppt > kSlippageDenominator) {
        throw EngineError(ErrorCode::InvalidRate, "deposit slippage must not exceed 1000 ppt");
    }
    cfg_.deposit_slippage = ppt;
}

void ConversionEngine::rollback() {
    if (saved_) {
        cfg_ = saved_->cfg;
        pair_ = saved_->pair;
        metrics_ = saved_->metrics;
        saved_.reset();
    }
}

void ConversionEngine::require_idle(const char *what) const {
    if (!idle()) {
        throw EngineError(ErrorCode::Reentrant,
                          std::string(what) + " refused while " + state_name(state_) + " is in flight");
    }
}

Amount ConversionEngine::swap_for_reference(Amount amount) {
    const Amount min_out = min_output_for(amount);
    ledger_.approve(self_, exchange_.router(), amount);
    const Amount before = reference_.balance_of(self_);
    // The exchange reports its own figure; only the balance delta is trusted.
    exchange_.swap_tokens_for_reference(pair_, amount, min_out, self_, self_, deadline());
    ledger_.approve(self_, exchange_.router(), 0);
    const Amount after = reference_.balance_of(self_);
    const Amount received = after > before ? after - before : 0;
    if (received < min_out) {
        throw EngineError(ErrorCode::InsufficientOutput, "swap delivered " + std::to_string(received) +
                                                             ", minimum " + std::to_string(min_out));
    }
    return received;
}

int64_t ConversionEngine::deadline() const { return utils::unix_now_s() + cfg_.deadline_window_s; }

}  // namespace tollgate::engine
