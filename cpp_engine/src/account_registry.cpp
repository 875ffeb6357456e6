#include "engine/account_registry.hpp"

#include <utility>

#include "engine/errors.hpp"

namespace tollgate::engine {

AccountRegistry::AccountRegistry(Address canonical_pair) : canonical_pair_(std::move(canonical_pair)) {
    require_account(canonical_pair_);
    flags_[canonical_pair_].market_pair = true;
}

AccountFlags AccountRegistry::flags(const Address &account) const {
    auto it = flags_.find(account);
    return it == flags_.end() ? AccountFlags{} : it->second;
}

TransferKind AccountRegistry::classify(const Address &from, const Address &to) const {
    if (is_market_pair(to)) {
        return TransferKind::Sell;
    }
    if (is_market_pair(from)) {
        return TransferKind::Buy;
    }
    return TransferKind::Wallet;
}

void AccountRegistry::set_fee_exempt(const Address &account, bool exempt) {
    require_account(account);
    flags_[account].fee_exempt = exempt;
}

void AccountRegistry::set_market_pair(const Address &account, bool market_pair) {
    require_account(account);
    if (!market_pair && account == canonical_pair_) {
        throw EngineError(ErrorCode::ProtectedPair, "canonical pair " + account.str() + " must stay a market pair");
    }
    flags_[account].market_pair = market_pair;
}

void AccountRegistry::set_denied(const Address &account, bool denied) {
    require_account(account);
    flags_[account].denied = denied;
}

Address AccountRegistry::migrate_canonical_pair(const Address &next) {
    require_account(next);
    Address previous = canonical_pair_;
    flags_[next].market_pair = true;
    canonical_pair_ = next;
    return previous;
}

void AccountRegistry::require_account(const Address &account) {
    if (account.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, "account must not be the zero address");
    }
}

void AccountRegistry::rollback() {
    if (saved_) {
        flags_ = std::move(saved_->flags);
        canonical_pair_ = std::move(saved_->canonical_pair);
        saved_.reset();
    }
}

}  // namespace tollgate::engine
