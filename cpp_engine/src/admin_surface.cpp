#include "engine/admin_surface.hpp"

#include <sstream>

#include "engine/errors.hpp"
#include "utils/logger.hpp"

namespace tollgate::engine {
namespace {

const char *flag(bool value) { return value ? "true" : "false"; }

void require_account(const Address &account, const char *what) {
    if (account.is_zero()) {
        throw EngineError(ErrorCode::ZeroAddress, std::string(what) + " must not be the zero address");
    }
}

}  // namespace

void AdminSurface::set_sell_royalty_rate(const Address &caller, uint32_t rate) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.schedule().set_sell_royalty(rate);
    rate_changed("sell_royalty");
    scope.commit();
}

void AdminSurface::set_sell_liquidity_rate(const Address &caller, uint32_t rate) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.schedule().set_sell_liquidity(rate);
    rate_changed("sell_liquidity");
    scope.commit();
}

void AdminSurface::set_buy_liquidity_rate(const Address &caller, uint32_t rate) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.schedule().set_buy_liquidity(rate);
    rate_changed("buy_liquidity");
    scope.commit();
}

void AdminSurface::set_sell_rates(const Address &caller, uint32_t royalty, uint32_t liquidity) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.schedule().set_sell_rates(royalty, liquidity);
    rate_changed("sell_royalty,sell_liquidity");
    scope.commit();
}

void AdminSurface::set_royalty_threshold(const Address &caller, Amount amount) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.conversion().set_royalty_threshold(amount);
    token_.events().emit(Event::Type::ThresholdChanged, "pool=royalty min=" + std::to_string(amount));
    scope.commit();
}

void AdminSurface::set_liquidity_threshold(const Address &caller, Amount amount) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.conversion().set_liquidity_threshold(amount);
    token_.events().emit(Event::Type::ThresholdChanged, "pool=liquidity min=" + std::to_string(amount));
    scope.commit();
}

void AdminSurface::set_fee_exempt(const Address &caller, const Address &account, bool exempt) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.registry().set_fee_exempt(account, exempt);
    token_.events().emit(Event::Type::ExemptionChanged, "account=" + account.str() + " exempt=" + flag(exempt));
    scope.commit();
}

void AdminSurface::set_market_pair(const Address &caller, const Address &account, bool market_pair) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.registry().set_market_pair(account, market_pair);
    token_.events().emit(Event::Type::MarketPairChanged,
                         "account=" + account.str() + " market_pair=" + flag(market_pair));
    scope.commit();
}

void AdminSurface::migrate_canonical_pair(const Address &caller, const Address &next) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    require_account(next, "canonical pair");
    const Address previous = token_.registry().migrate_canonical_pair(next);
    token_.conversion().set_pair(next);
    token_.events().emit(Event::Type::PairMigrated, "from=" + previous.str() + " to=" + next.str());
    utils::warn("canonical pair migrated from " + previous.str() + " to " + next.str() + " by " + caller.str());
    scope.commit();
}

void AdminSurface::set_denied(const Address &caller, const Address &account, bool denied) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.registry().set_denied(account, denied);
    token_.events().emit(Event::Type::DenyListChanged, "account=" + account.str() + " denied=" + flag(denied));
    scope.commit();
}

void AdminSurface::set_fee_recipient(const Address &caller, const Address &recipient) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.conversion().set_fee_recipient(recipient);
    token_.events().emit(Event::Type::RecipientChanged, "role=fee_recipient account=" + recipient.str());
    scope.commit();
}

void AdminSurface::set_liquidity_receiver(const Address &caller, const Address &receiver) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.conversion().set_liquidity_receiver(receiver);
    token_.events().emit(Event::Type::RecipientChanged, "role=liquidity_receiver account=" + receiver.str());
    scope.commit();
}

void AdminSurface::set_swap_enabled(const Address &caller, bool enabled) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.conversion().set_swap_enabled(enabled);
    token_.events().emit(Event::Type::SwapEnabledChanged, std::string("enabled=") + flag(enabled));
    scope.commit();
}

void AdminSurface::set_swap_slippage(const Address &caller, uint32_t ppt) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.conversion().set_swap_slippage(ppt);
    token_.events().emit(Event::Type::SlippageChanged, "side=swap ppt=" + std::to_string(ppt));
    scope.commit();
}

void AdminSurface::set_deposit_slippage(const Address &caller, uint32_t ppt) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    token_.conversion().set_deposit_slippage(ppt);
    token_.events().emit(Event::Type::SlippageChanged, "side=deposit ppt=" + std::to_string(ppt));
    scope.commit();
}

ConversionReport AdminSurface::manual_convert_royalty(const Address &caller) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    ConversionReport report = token_.conversion().convert_royalty(true);
    scope.commit();
    return report;
}

ConversionReport AdminSurface::manual_convert_liquidity(const Address &caller) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Operator, caller);
    ConversionReport report = token_.conversion().convert_liquidity(true);
    scope.commit();
    return report;
}

void AdminSurface::mint(const Address &caller, const Address &to, Amount amount) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Minter, caller);
    if (token_.registry().is_denied(to)) {
        throw EngineError(ErrorCode::DeniedAccount, "cannot mint to denied account " + to.str());
    }
    token_.ledger().mint(to, amount);
    token_.events().emit(Event::Type::Transfer, "from=0x0 to=" + to.str() + " amount=" + std::to_string(amount));
    scope.commit();
}

void AdminSurface::burn(const Address &caller, const Address &from, Amount amount) {
    Journal::Scope scope(token_.journal());
    require_role(authorizer_, Role::Minter, caller);
    if (from == token_.address()) {
        throw EngineError(ErrorCode::InsufficientPool, "engine custody backs the fee pools and cannot be burned");
    }
    token_.ledger().burn(from, amount);
    token_.events().emit(Event::Type::Transfer, "from=" + from.str() + " to=0x0 amount=" + std::to_string(amount));
    scope.commit();
}

void AdminSurface::rate_changed(const char *which) {
    const FeeConfig &fees = token_.schedule().config();
    std::stringstream ss;
    ss << "changed=" << which << " sell_royalty=" << fees.sell_royalty << " sell_liquidity=" << fees.sell_liquidity
       << " buy_liquidity=" << fees.buy_liquidity << " denominator=" << fees.denominator;
    token_.events().emit(Event::Type::RateChanged, ss.str());
    utils::info("fee rates " + ss.str());
}

}  // namespace tollgate::engine
