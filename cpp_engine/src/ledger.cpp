#include "engine/ledger.hpp"

#include <utility>

#include "engine/amount_math.hpp"
#include "engine/errors.hpp"

namespace tollgate::engine {

Amount Ledger::balance_of(const Address &account) const {
    auto it = state_.balances.find(account);
    return it == state_.balances.end() ? 0 : it->second;
}

Amount Ledger::allowance(const Address &owner, const Address &spender) const {
    auto it = state_.allowances.find({owner, spender});
    return it == state_.allowances.end() ? 0 : it->second;
}

void Ledger::settle(const Address &from, const Address &to, Amount amount) {
    if (from.is_zero() || to.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, symbol_ + " settlement with zero address");
    }
    const Amount have = balance_of(from);
    if (have < amount) {
        throw EngineError(ErrorCode::InsufficientBalance, symbol_ + " balance of " + from.str() + " is " +
                                                              std::to_string(have) + ", needs " +
                                                              std::to_string(amount));
    }
    if (amount == 0 || from == to) {
        return;
    }
    const Amount credited = checked_add(balance_of(to), amount);
    state_.balances[from] = have - amount;
    state_.balances[to] = credited;
}

void Ledger::approve(const Address &owner, const Address &spender, Amount amount) {
    if (owner.is_zero() || spender.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, symbol_ + " approval with zero address");
    }
    state_.allowances[{owner, spender}] = amount;
}

void Ledger::spend_allowance(const Address &owner, const Address &spender, Amount amount) {
    const Amount current = allowance(owner, spender);
    if (current < amount) {
        throw EngineError(ErrorCode::InsufficientAllowance, spender.str() + " may move " + std::to_string(current) +
                                                                " of " + owner.str() + ", needs " +
                                                                std::to_string(amount));
    }
    state_.allowances[{owner, spender}] = current - amount;
}

void Ledger::mint(const Address &to, Amount amount) {
    if (to.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, symbol_ + " mint to zero address");
    }
    const Amount supply = checked_add(state_.supply, amount);
    state_.balances[to] = checked_add(balance_of(to), amount);
    state_.supply = supply;
}

void Ledger::burn(const Address &from, Amount amount) {
    if (from.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, symbol_ + " burn from zero address");
    }
    const Amount have = balance_of(from);
    if (have < amount) {
        throw EngineError(ErrorCode::InsufficientBalance, symbol_ + " burn exceeds balance of " + from.str());
    }
    state_.balances[from] = have - amount;
    state_.supply -= amount;
}

void Ledger::checkpoint() { saved_ = state_; }

void Ledger::rollback() {
    if (saved_) {
        state_ = std::move(*saved_);
        saved_.reset();
    }
}

void Ledger::release() { saved_.reset(); }

}  // namespace tollgate::engine
