#include "engine/constant_product_exchange.hpp"

#include <algorithm>
#include <utility>

#include "engine/amount_math.hpp"
#include "engine/errors.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"

namespace tollgate::engine {
namespace {

Amount excess(Amount balance, Amount reserve) { return balance > reserve ? balance - reserve : 0; }

}  // namespace

ConstantProductExchange::ConstantProductExchange(Ledger &reference, ExchangeConfig cfg)
    : reference_(reference), cfg_(std::move(cfg)) {
    if (cfg_.router.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, "exchange router must not be the zero address");
    }
    if (cfg_.fee_denominator == 0 || cfg_.fee_numerator >= cfg_.fee_denominator) {
        throw EngineError(ErrorCode::InvalidRate, "exchange fee must be a fraction below one");
    }
}

Address ConstantProductExchange::create_pair(TokenPort &token) {
    Address pair("pair:" + token.address().str() + "/" + reference_.symbol());
    auto it = pools_.find(pair);
    if (it == pools_.end()) {
        Pool pool;
        pool.token = &token;
        pool.reserves.updated_s = utils::unix_now_s();
        pools_.emplace(pair, std::move(pool));
        utils::info("exchange pair created: " + pair.str());
    }
    return pair;
}

Reserves ConstantProductExchange::reserves(const Address &pair) const { return pool_at(pair).reserves; }

Amount ConstantProductExchange::get_amount_out(Amount amount_in, Amount reserve_in, Amount reserve_out) const {
    if (amount_in == 0) {
        return 0;
    }
    if (reserve_in == 0 || reserve_out == 0) {
        throw EngineError(ErrorCode::InsufficientLiquidity, "pair has no reserves");
    }
    const unsigned __int128 in_with_fee =
        static_cast<unsigned __int128>(amount_in) * (cfg_.fee_denominator - cfg_.fee_numerator);
    const unsigned __int128 numerator = in_with_fee * reserve_out;
    const unsigned __int128 denominator = static_cast<unsigned __int128>(reserve_in) * cfg_.fee_denominator + in_with_fee;
    return static_cast<Amount>(numerator / denominator);
}

Amount ConstantProductExchange::swap_tokens_for_reference(const Address &pair, Amount amount_in, Amount min_out,
                                                          const Address &from, const Address &to,
                                                          int64_t deadline) {
    check_deadline(deadline);
    if (amount_in == 0) {
        throw EngineError(ErrorCode::ZeroAmount, "swap input must be positive");
    }
    Pool &pool = pool_at(pair);
    // A fee conversion may run inside this transfer and re-sync the reserves
    // before we measure, which keeps its tokens out of this swap's input.
    pool.token->transfer_from(cfg_.router, from, pair, amount_in);

    const Amount received = excess(pool.token->balance_of(pair), pool.reserves.token);
    const Amount out = get_amount_out(received, pool.reserves.token, pool.reserves.reference);
    if (out == 0 || out < min_out) {
        throw EngineError(ErrorCode::InsufficientOutput, "swap of " + std::to_string(received) + " yields " +
                                                             std::to_string(out) + ", minimum " +
                                                             std::to_string(min_out));
    }
    reference_.settle(pair, to, out);
    sync(pair, pool);
    return out;
}

Amount ConstantProductExchange::swap_reference_for_tokens(const Address &pair, Amount amount_in, Amount min_out,
                                                          const Address &from, const Address &to,
                                                          int64_t deadline) {
    check_deadline(deadline);
    if (amount_in == 0) {
        throw EngineError(ErrorCode::ZeroAmount, "swap input must be positive");
    }
    Pool &pool = pool_at(pair);
    reference_.settle(from, pair, amount_in);
    const Amount received = excess(reference_.balance_of(pair), pool.reserves.reference);
    const Amount out = get_amount_out(received, pool.reserves.reference, pool.reserves.token);
    if (out == 0 || out < min_out) {
        throw EngineError(ErrorCode::InsufficientOutput, "swap of " + std::to_string(received) + " yields " +
                                                             std::to_string(out) + ", minimum " +
                                                             std::to_string(min_out));
    }
    pool.token->transfer(pair, to, out);
    sync(pair, pool);
    return out;
}

DepositReceipt ConstantProductExchange::add_liquidity(const Address &pair, Amount token_amount,
                                                      Amount reference_amount, Amount min_token,
                                                      Amount min_reference, const Address &from, const Address &to,
                                                      int64_t deadline) {
    check_deadline(deadline);
    if (to.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, "liquidity shares need a receiver");
    }
    if (token_amount == 0 || reference_amount == 0) {
        throw EngineError(ErrorCode::DepositFailed, "deposit needs both sides");
    }
    Pool &pool = pool_at(pair);
    Amount token_used = token_amount;
    Amount reference_used = reference_amount;
    if (pool.total_shares > 0) {
        const Amount reference_optimal = mul_div(token_amount, pool.reserves.reference, pool.reserves.token);
        if (reference_optimal <= reference_amount) {
            reference_used = reference_optimal;
        } else {
            token_used = mul_div(reference_amount, pool.reserves.token, pool.reserves.reference);
        }
    }
    if (token_used < min_token || reference_used < min_reference) {
        throw EngineError(ErrorCode::DepositFailed, "deposit ratio moved past the accepted minimum");
    }
    if (token_used == 0 || reference_used == 0) {
        throw EngineError(ErrorCode::DepositFailed, "deposit rounds down to nothing on one side");
    }

    pool.token->transfer_from(cfg_.router, from, pair, token_used);
    reference_.settle(from, pair, reference_used);

    const Amount token_in = excess(pool.token->balance_of(pair), pool.reserves.token);
    const Amount reference_in = excess(reference_.balance_of(pair), pool.reserves.reference);
    Amount shares = 0;
    if (pool.total_shares == 0) {
        shares = isqrt(static_cast<unsigned __int128>(token_in) * reference_in);
    } else {
        shares = std::min(mul_div(token_in, pool.total_shares, pool.reserves.token),
                          mul_div(reference_in, pool.total_shares, pool.reserves.reference));
    }
    if (shares == 0) {
        throw EngineError(ErrorCode::DepositFailed, "deposit mints no shares");
    }
    pool.shares[to] = checked_add(pool.shares[to], shares);
    pool.total_shares = checked_add(pool.total_shares, shares);
    sync(pair, pool);

    DepositReceipt receipt;
    receipt.token_used = token_in;
    receipt.reference_used = reference_in;
    receipt.shares = shares;
    return receipt;
}

Amount ConstantProductExchange::shares_of(const Address &pair, const Address &holder) const {
    const Pool &pool = pool_at(pair);
    auto it = pool.shares.find(holder);
    return it == pool.shares.end() ? 0 : it->second;
}

Amount ConstantProductExchange::total_shares(const Address &pair) const { return pool_at(pair).total_shares; }

void ConstantProductExchange::rollback() {
    if (saved_) {
        pools_ = std::move(*saved_);
        saved_.reset();
    }
}

ConstantProductExchange::Pool &ConstantProductExchange::pool_at(const Address &pair) {
    auto it = pools_.find(pair);
    if (it == pools_.end()) {
        throw EngineError(ErrorCode::InsufficientLiquidity, "unknown pair " + display(pair));
    }
    return it->second;
}

const ConstantProductExchange::Pool &ConstantProductExchange::pool_at(const Address &pair) const {
    auto it = pools_.find(pair);
    if (it == pools_.end()) {
        throw EngineError(ErrorCode::InsufficientLiquidity, "unknown pair " + display(pair));
    }
    return it->second;
}

void ConstantProductExchange::sync(const Address &pair, Pool &pool) {
    pool.reserves.token = pool.token->balance_of(pair);
    pool.reserves.reference = reference_.balance_of(pair);
    pool.reserves.updated_s = utils::unix_now_s();
}

void ConstantProductExchange::check_deadline(int64_t deadline) {
    if (deadline < utils::unix_now_s()) {
        throw EngineError(ErrorCode::DeadlineExpired, "deadline " + std::to_string(deadline) + " has passed");
    }
}

}  // namespace tollgate::engine
