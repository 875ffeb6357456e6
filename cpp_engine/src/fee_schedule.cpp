#include "engine/fee_schedule.hpp"

#include <utility>

#include "engine/amount_math.hpp"
#include "engine/errors.hpp"

namespace tollgate::engine {

FeeSchedule::FeeSchedule(FeeConfig cfg) : cfg_(std::move(cfg)) { validate(cfg_); }

FeeResult FeeSchedule::compute(TransferKind kind, Amount amount) const {
    FeeResult res;
    res.kind = kind;
    if (amount == 0) {
        return res;
    }
    if (kind == TransferKind::Sell) {
        res.royalty_fee = apply_rate(amount, cfg_.sell_royalty, cfg_.denominator);
        res.liquidity_fee = apply_rate(amount, cfg_.sell_liquidity, cfg_.denominator);
    } else if (kind == TransferKind::Buy) {
        res.liquidity_fee = apply_rate(amount, cfg_.buy_liquidity, cfg_.denominator);
    }
    return res;
}

Amount FeeSchedule::apply_rate(Amount amount, uint32_t rate, uint32_t denominator) {
    if (rate == 0) {
        return 0;
    }
    return mul_div(amount, rate, denominator);
}

void FeeSchedule::set_sell_royalty(uint32_t rate) {
    FeeConfig next = cfg_;
    next.sell_royalty = rate;
    replace(next);
}

void FeeSchedule::set_sell_liquidity(uint32_t rate) {
    FeeConfig next = cfg_;
    next.sell_liquidity = rate;
    replace(next);
}

void FeeSchedule::set_buy_liquidity(uint32_t rate) {
    FeeConfig next = cfg_;
    next.buy_liquidity = rate;
    replace(next);
}

void FeeSchedule::set_sell_rates(uint32_t royalty, uint32_t liquidity) {
    FeeConfig next = cfg_;
    next.sell_royalty = royalty;
    next.sell_liquidity = liquidity;
    replace(next);
}

void FeeSchedule::validate(const FeeConfig &cfg) {
    if (cfg.denominator == 0) {
        throw EngineError(ErrorCode::InvalidRate, "fee denominator must be positive");
    }
    if (cfg.max_sell_total > cfg.denominator) {
        throw EngineError(ErrorCode::InvalidRate, "fee ceiling " + std::to_string(cfg.max_sell_total) +
                                                      " exceeds denominator " + std::to_string(cfg.denominator));
    }
    const uint64_t sell_total = static_cast<uint64_t>(cfg.sell_royalty) + cfg.sell_liquidity;
    if (sell_total > cfg.max_sell_total) {
        throw EngineError(ErrorCode::FeeCeilingExceeded, "sell fees " + std::to_string(sell_total) + "/" +
                                                             std::to_string(cfg.denominator) + " exceed ceiling " +
                                                             std::to_string(cfg.max_sell_total));
    }
    if (cfg.buy_liquidity > cfg.max_sell_total) {
        throw EngineError(ErrorCode::FeeCeilingExceeded, "buy fee " + std::to_string(cfg.buy_liquidity) +
                                                             " exceeds ceiling " +
                                                             std::to_string(cfg.max_sell_total));
    }
}

void FeeSchedule::replace(const FeeConfig &next) {
    validate(next);
    cfg_ = next;
}

void FeeSchedule::rollback() {
    if (saved_) {
        cfg_ = *saved_;
        saved_.reset();
    }
}

}  // namespace tollgate::engine
