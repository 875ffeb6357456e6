#include <cassert>

#include "fixture.hpp"

using namespace tollgate::testing;

static int64_t soon() { return tollgate::utils::unix_now_s() + 60; }

static void test_quote() {
    Harness h(Market::ConstantProduct, sell_fees(0, 0), quiet_conversion());
    const Reserves r = h.cpx->reserves(h.pair());
    assert(r.token == 10000000);
    assert(r.reference == 10000000);
    assert(h.cpx->total_shares(h.pair()) == 10000000);
    assert(h.cpx->shares_of(h.pair(), h.treasury) == 10000000);

    assert(h.cpx->get_amount_out(1000, 10000000, 10000000) == 996);
    assert(h.cpx->get_amount_out(0, 10000000, 10000000) == 0);
    assert(code_of([&] { h.cpx->get_amount_out(10, 0, 10); }) == ErrorCode::InsufficientLiquidity);
    assert(code_of([&] { h.cpx->reserves(Address("pair:nowhere")); }) == ErrorCode::InsufficientLiquidity);
    assert(h.cpx->create_pair(*h.token) == h.pair());
}

static void test_swaps_move_reserves() {
    Harness h(Market::ConstantProduct, sell_fees(0, 0), quiet_conversion());
    const Amount out = h.sell(h.alice, 1000);
    assert(out == 996);
    Reserves r = h.cpx->reserves(h.pair());
    assert(r.token == 10001000);
    assert(r.reference == 10000000 - 996);
    assert(h.reference.balance_of(h.alice) == 996);

    const Amount bob_tokens = h.balance(h.bob);
    h.reference.mint(h.bob, 2000);
    Amount bought = 0;
    {
        Journal::Scope scope(h.journal);
        bought = h.cpx->swap_reference_for_tokens(h.pair(), 2000, 1, h.bob, h.bob, soon());
        scope.commit();
    }
    assert(bought > 0);
    assert(h.balance(h.bob) == bob_tokens + bought);
    r = h.cpx->reserves(h.pair());
    assert(r.token == 10001000 - bought);
    assert(r.reference == 10000000 - 996 + 2000);
}

static void test_taxed_sell_priced_on_landed_amount() {
    Harness h(Market::ConstantProduct, sell_fees(50, 30), quiet_conversion());
    const Reserves r = h.cpx->reserves(h.pair());
    const Amount expected = h.cpx->get_amount_out(920, r.token, r.reference);
    const Amount out = h.sell(h.alice, 1000);
    assert(out == expected);
    assert(h.cpx->reserves(h.pair()).token == r.token + 920);
    assert(h.balance(h.self()) == 80);
}

static void test_rejections_roll_back() {
    Harness h(Market::ConstantProduct, sell_fees(0, 0), quiet_conversion());
    const Amount alice = h.balance(h.alice);
    const Reserves r = h.cpx->reserves(h.pair());

    auto guarded_sell = [&](Amount amount, Amount min_out, int64_t deadline) {
        Journal::Scope scope(h.journal);
        h.token->approve(h.alice, h.cpx->router(), amount);
        h.cpx->swap_tokens_for_reference(h.pair(), amount, min_out, h.alice, h.alice, deadline);
        scope.commit();
    };

    assert(code_of([&] { guarded_sell(1000, 997, soon()); }) == ErrorCode::InsufficientOutput);
    assert(code_of([&] { guarded_sell(1000, 0, tollgate::utils::unix_now_s() - 10); }) ==
           ErrorCode::DeadlineExpired);
    assert(code_of([&] { guarded_sell(0, 0, soon()); }) == ErrorCode::ZeroAmount);

    assert(h.balance(h.alice) == alice);
    assert(h.token->allowance(h.alice, h.cpx->router()) == 0);
    assert(h.cpx->reserves(h.pair()).token == r.token);
    assert(h.cpx->reserves(h.pair()).reference == r.reference);
}

static void test_add_liquidity_uses_pool_ratio() {
    Harness h(Market::ConstantProduct, sell_fees(0, 0), quiet_conversion());
    h.token->transfer(h.treasury, h.carol, 5000);
    h.reference.mint(h.carol, 5000);
    h.token->approve(h.carol, h.cpx->router(), 5000);

    auto deposit = [&](Amount tokens, Amount reference, Amount min_reference) {
        Journal::Scope scope(h.journal);
        DepositReceipt receipt = h.cpx->add_liquidity(h.pair(), tokens, reference, 0, min_reference, h.carol,
                                                      h.carol, soon());
        scope.commit();
        return receipt;
    };

    assert(code_of([&] { deposit(1000, 2000, 1500); }) == ErrorCode::DepositFailed);
    assert(code_of([&] { deposit(1000, 0, 0); }) == ErrorCode::DepositFailed);

    const DepositReceipt receipt = deposit(1000, 2000, 900);
    assert(receipt.token_used == 1000);
    assert(receipt.reference_used == 1000);
    assert(receipt.shares == 1000);
    assert(h.cpx->shares_of(h.pair(), h.carol) == 1000);
    assert(h.balance(h.carol) == 4000);
    assert(h.reference.balance_of(h.carol) == 4000);
    assert(h.cpx->reserves(h.pair()).token == 10001000);
}

int main() {
    test_quote();
    test_swaps_move_reserves();
    test_taxed_sell_priced_on_landed_amount();
    test_rejections_roll_back();
    test_add_liquidity_uses_pool_ratio();
    return 0;
}
