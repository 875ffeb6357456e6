#include <cassert>

#include "fixture.hpp"

using namespace tollgate::testing;

// Everything the exchange callback attempts while the engine is converting.
struct Attempts {
    bool ran{false};
    bool royalty_latch{false};
    bool liquidity_latch{false};
    ConversionState state{ConversionState::Idle};
    ErrorCode sell{ErrorCode::None};
    ErrorCode wallet{ErrorCode::None};
    ErrorCode manual_royalty{ErrorCode::None};
    ErrorCode manual_liquidity{ErrorCode::None};
    ErrorCode custody{ErrorCode::None};
    ErrorCode delegated{ErrorCode::None};
};

static void install_callback(Harness &h, Attempts &seen) {
    h.token->approve(h.bob, h.carol, 500);
    h.scripted->on_swap = [&h, &seen] {
        seen.ran = true;
        seen.state = h.token->conversion().state();
        seen.royalty_latch = h.token->conversion().royalty_latch();
        seen.liquidity_latch = h.token->conversion().liquidity_latch();
        seen.sell = code_of([&] { h.token->transfer(h.bob, h.pair(), 100); });
        seen.wallet = code_of([&] { h.token->transfer(h.bob, h.carol, 100); });
        seen.manual_royalty = code_of([&] { h.ops->manual_convert_royalty(h.admin); });
        seen.manual_liquidity = code_of([&] { h.ops->manual_convert_liquidity(h.admin); });
        seen.custody = code_of([&] { h.token->transfer(h.self(), h.carol, 10); });
        seen.delegated = code_of([&] { h.token->transfer_from(h.carol, h.bob, h.carol, 100); });
    };
}

static void test_liquidity_conversion_holds_latch() {
    ConversionConfig cfg;
    cfg.min_royalty_to_swap = 1000000000;
    cfg.min_liquidity_to_swap = 500;
    Harness h(Market::Scripted, sell_fees(40, 60), cfg);
    Attempts seen;
    install_callback(h, seen);

    const Amount bob_before = h.balance(h.bob);
    h.token->transfer(h.alice, h.pair(), 10000);

    assert(seen.ran);
    assert(seen.state == ConversionState::ConvertingLiquidity);
    assert(seen.liquidity_latch);
    assert(!seen.royalty_latch);
    assert(seen.sell == ErrorCode::Reentrant);
    assert(seen.wallet == ErrorCode::Reentrant);
    assert(seen.manual_royalty == ErrorCode::Reentrant);
    assert(seen.manual_liquidity == ErrorCode::Reentrant);
    assert(seen.custody == ErrorCode::Unauthorized);
    assert(seen.delegated == ErrorCode::Reentrant);

    // The outer sell still completed and the refused attempts left no trace.
    assert(h.token->conversion().idle());
    assert(h.balance(h.bob) == bob_before);
    assert(h.balance(h.carol) == 0);
    assert(h.token->allowance(h.bob, h.carol) == 500);
    assert(h.royalty_pool() == 400);
    assert(h.liquidity_pool() == 0);
    assert(h.scripted->record().deposits == 1);
    assert(h.token->conversion().metrics().manual_conversions == 0);
    assert(h.token->check_invariants().ok);
}

static void test_royalty_conversion_holds_latch() {
    ConversionConfig cfg;
    cfg.min_royalty_to_swap = 10;
    cfg.min_liquidity_to_swap = 1000000000;
    Harness h(Market::Scripted, sell_fees(50, 30), cfg);
    Attempts seen;
    install_callback(h, seen);

    h.token->transfer(h.alice, h.pair(), 1000);

    assert(seen.ran);
    assert(seen.royalty_latch);
    assert(!seen.liquidity_latch);
    assert(seen.sell == ErrorCode::Reentrant);
    assert(seen.wallet == ErrorCode::Reentrant);
    assert(seen.manual_royalty == ErrorCode::Reentrant);
    assert(seen.manual_liquidity == ErrorCode::Reentrant);
    assert(seen.custody == ErrorCode::Unauthorized);
    assert(seen.delegated == ErrorCode::Reentrant);
    assert(h.token->conversion().idle());
    assert(h.token->allowance(h.bob, h.carol) == 500);
    assert(h.balance(h.carol) == 0);
    assert(h.royalty_pool() == 0);
    assert(h.balance(h.self()) == h.liquidity_pool());
    assert(h.token->check_invariants().ok);
    assert(h.reference.balance_of(h.recipient) == 50);
    assert(h.scripted->record().swaps == 1);
}

static void test_guard_releases_on_failure() {
    ConversionConfig cfg;
    cfg.min_royalty_to_swap = 10;
    cfg.min_liquidity_to_swap = 1000000000;
    Harness h(Market::Scripted, sell_fees(50, 30), cfg);
    h.scripted->fail_swap = true;

    assert(code_of([&] { h.token->transfer(h.alice, h.pair(), 1000); }) == ErrorCode::InsufficientOutput);
    assert(h.token->conversion().idle());
    assert(!h.token->conversion().royalty_latch());

    // Nothing stuck: the next sell goes through once the market recovers.
    h.scripted->fail_swap = false;
    h.token->transfer(h.alice, h.pair(), 1000);
    assert(h.reference.balance_of(h.recipient) == 50);
    assert(h.token->conversion().idle());
}

static void test_guard_refuses_nesting() {
    ConversionState state = ConversionState::Idle;
    {
        ConversionGuard outer(state, ConversionState::ConvertingRoyalty);
        assert(state == ConversionState::ConvertingRoyalty);
        assert(code_of([&] { ConversionGuard inner(state, ConversionState::ConvertingLiquidity); }) ==
               ErrorCode::Reentrant);
        assert(state == ConversionState::ConvertingRoyalty);
    }
    assert(state == ConversionState::Idle);
}

int main() {
    test_liquidity_conversion_holds_latch();
    test_royalty_conversion_holds_latch();
    test_guard_releases_on_failure();
    test_guard_refuses_nesting();
    return 0;
}
