#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <set>

#include "engine/admin_surface.hpp"
#include "engine/amount_math.hpp"
#include "engine/authorizer.hpp"
#include "engine/constant_product_exchange.hpp"
#include "engine/errors.hpp"
#include "engine/event_bus.hpp"
#include "engine/exchange.hpp"
#include "engine/fee_token.hpp"
#include "engine/journal.hpp"
#include "engine/ledger.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"

namespace tollgate::testing {

using namespace tollgate::engine;

template <typename Fn>
ErrorCode code_of(Fn &&fn) {
    try {
        fn();
    } catch (const EngineError &err) {
        return err.code();
    }
    return ErrorCode::None;
}

// Reference ledger that refuses deliveries to blocked accounts.
class RejectingLedger : public Ledger {
  public:
    using Ledger::Ledger;

    void settle(const Address &from, const Address &to, Amount amount) override {
        if (blocked.count(to) > 0) {
            throw EngineError(ErrorCode::TransferFailed, to.str() + " rejects " + symbol());
        }
        Ledger::settle(from, to, amount);
    }

    std::set<Address> blocked;
};

/**
 * Deterministic exchange double. Prices at the configured reserve ratio with
 * no fee, pays out `payout_ppt` of that price, and mints the reference asset
 * it pays. on_swap runs after the tokens are pulled and before payment.
 * With honour_min_out off it pays short without complaint.
 */
class ScriptedExchange : public Exchange, public Revertible {
  public:
    explicit ScriptedExchange(Ledger &reference) : reference_(reference) {}

    const Address &router() const override { return router_; }

    Address create_pair(TokenPort &token) override {
        token_ = &token;
        return pair_;
    }

    Reserves reserves(const Address &) const override { return quoted; }

    Amount get_amount_out(Amount amount_in, Amount reserve_in, Amount reserve_out) const override {
        return mul_div(amount_in, reserve_out, reserve_in);
    }

    Amount swap_tokens_for_reference(const Address &pair, Amount amount_in, Amount min_out, const Address &from,
                                     const Address &to, int64_t) override {
        ++record_.swaps;
        if (fail_swap) {
            throw EngineError(ErrorCode::InsufficientOutput, "scripted swap failure");
        }
        token_->transfer_from(router_, from, pair, amount_in);
        if (on_swap) {
            on_swap();
        }
        Amount out = get_amount_out(amount_in, quoted.token, quoted.reference);
        out = mul_div(out, payout_ppt, 1000);
        if (honour_min_out && out < min_out) {
            throw EngineError(ErrorCode::InsufficientOutput, "scripted swap below minimum");
        }
        reference_.mint(to, out);
        record_.last_swap_in = amount_in;
        record_.last_min_out = min_out;
        return out;
    }

    DepositReceipt add_liquidity(const Address &pair, Amount token_amount, Amount reference_amount, Amount,
                                 Amount, const Address &from, const Address &to, int64_t) override {
        ++record_.deposits;
        if (fail_deposit) {
            throw EngineError(ErrorCode::DepositFailed, "scripted deposit failure");
        }
        token_->transfer_from(router_, from, pair, token_amount);
        reference_.settle(from, pair, reference_amount);
        record_.last_deposit_tokens = token_amount;
        record_.last_deposit_reference = reference_amount;
        record_.last_deposit_to = to;
        DepositReceipt receipt;
        receipt.token_used = token_amount;
        receipt.reference_used = reference_amount;
        receipt.shares = token_amount;
        return receipt;
    }

    struct Record {
        uint64_t swaps{0};
        uint64_t deposits{0};
        Amount last_swap_in{0};
        Amount last_min_out{0};
        Amount last_deposit_tokens{0};
        Amount last_deposit_reference{0};
        Address last_deposit_to;
    };

    const Record &record() const { return record_; }
    const Address &pair() const { return pair_; }

    void checkpoint() override { saved_ = record_; }
    void rollback() override {
        if (saved_) {
            record_ = *saved_;
            saved_.reset();
        }
    }
    void release() override { saved_.reset(); }

    Reserves quoted{1000000, 1000000, 0};
    uint32_t payout_ppt{1000};
    bool honour_min_out{true};
    bool fail_swap{false};
    bool fail_deposit{false};
    std::function<void()> on_swap;

  private:
    Ledger &reference_;
    TokenPort *token_{nullptr};
    Address router_{"scripted.router"};
    Address pair_{"pair:scripted"};
    Record record_;
    std::optional<Record> saved_;
};

enum class Market { Scripted, ConstantProduct };

// Thresholds out of reach unless a test lowers them.
inline ConversionConfig quiet_conversion() {
    ConversionConfig cfg;
    cfg.min_royalty_to_swap = 1000000000;
    cfg.min_liquidity_to_swap = 1000000000;
    return cfg;
}

inline FeeConfig sell_fees(uint32_t royalty, uint32_t liquidity, uint32_t buy = 0) {
    FeeConfig cfg;
    cfg.sell_royalty = royalty;
    cfg.sell_liquidity = liquidity;
    cfg.buy_liquidity = buy;
    return cfg;
}

/**
 * A wired engine: token ledger, reference ledger, exchange, roles and an
 * admin holding every role. Treasury is exempt and holds the supply; alice
 * and bob start with 1,000,000 tokens each. With the constant-product market
 * the pair is seeded 10,000,000 / 10,000,000.
 */
struct Harness {
    Address admin{"admin"};
    Address treasury{"treasury"};
    Address alice{"alice"};
    Address bob{"bob"};
    Address carol{"carol"};
    Address recipient{"royalty.vault"};
    Address lp{"liquidity.vault"};

    Ledger ledger{"TOLL"};
    RejectingLedger reference{"WETH"};
    Journal journal;
    EventBus events{1024};
    RoleRegistry roles{admin};
    std::unique_ptr<ScriptedExchange> scripted;
    std::unique_ptr<ConstantProductExchange> cpx;
    Exchange *exchange{nullptr};
    std::unique_ptr<FeeToken> token;
    std::unique_ptr<AdminSurface> ops;

    Harness(Market market, FeeConfig fees, ConversionConfig conversion) {
        utils::set_min_level(utils::LogLevel::Warn);
        roles.grant_role(admin, Role::Operator, admin);
        roles.grant_role(admin, Role::Minter, admin);
        if (market == Market::Scripted) {
            scripted = std::make_unique<ScriptedExchange>(reference);
            exchange = scripted.get();
        } else {
            cpx = std::make_unique<ConstantProductExchange>(reference);
            exchange = cpx.get();
        }
        if (conversion.fee_recipient.is_zero()) {
            conversion.fee_recipient = recipient;
        }
        if (conversion.liquidity_receiver.is_zero()) {
            conversion.liquidity_receiver = lp;
        }
        token = std::make_unique<FeeToken>(TokenConfig{}, fees, conversion, ledger, reference, *exchange, journal,
                                           events);
        if (scripted) {
            journal.track(*scripted);
        } else {
            journal.track(*cpx);
        }
        ops = std::make_unique<AdminSurface>(*token, roles);

        ops->set_fee_exempt(admin, treasury, true);
        ops->mint(admin, treasury, 1000000000);
        if (cpx) {
            reference.mint(treasury, 10000000);
            token->approve(treasury, cpx->router(), 10000000);
            cpx->add_liquidity(pair(), 10000000, 10000000, 10000000, 10000000, treasury, treasury,
                               utils::unix_now_s() + 60);
        }
        token->transfer(treasury, alice, 1000000);
        token->transfer(treasury, bob, 1000000);
        drain_events();
    }

    const Address &pair() const { return token->pair(); }
    const Address &self() const { return token->address(); }
    Amount balance(const Address &a) const { return ledger.balance_of(a); }
    Amount royalty_pool() const { return token->accrual().royalty_pool(); }
    Amount liquidity_pool() const { return token->accrual().liquidity_pool(); }

    // Trader-side sell through the router: approve, then swap.
    Amount sell(const Address &trader, Amount amount) {
        Journal::Scope scope(journal);
        token->approve(trader, exchange->router(), amount);
        const Amount out =
            exchange->swap_tokens_for_reference(pair(), amount, 0, trader, trader, utils::unix_now_s() + 60);
        scope.commit();
        return out;
    }

    std::size_t drain_events() {
        std::size_t n = 0;
        while (events.poll()) {
            ++n;
        }
        return n;
    }

    bool saw_event(Event::Type type) {
        bool seen = false;
        while (auto e = events.poll()) {
            seen = seen || e->type == type;
        }
        return seen;
    }
};

}  // namespace tollgate::testing
