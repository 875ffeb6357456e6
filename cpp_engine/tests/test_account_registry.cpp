#include <cassert>

#include "engine/account_registry.hpp"
#include "engine/errors.hpp"

using namespace tollgate::engine;

template <typename Fn>
static ErrorCode code_of(Fn fn) {
    try {
        fn();
    } catch (const EngineError &err) {
        return err.code();
    }
    return ErrorCode::None;
}

int main() {
    const Address pair("pair:TOLL/WETH");
    const Address other("pair:TOLL/USDC");
    const Address alice("alice");
    const Address bob("bob");
    AccountRegistry registry(pair);

    assert(registry.canonical_pair() == pair);
    assert(registry.is_market_pair(pair));
    assert(!registry.is_market_pair(alice));

    assert(registry.classify(alice, pair) == TransferKind::Sell);
    assert(registry.classify(pair, alice) == TransferKind::Buy);
    assert(registry.classify(alice, bob) == TransferKind::Wallet);

    // The canonical pair cannot be cleared through the ordinary setter.
    assert(code_of([&] { registry.set_market_pair(pair, false); }) == ErrorCode::ProtectedPair);
    assert(registry.is_market_pair(pair));

    registry.set_market_pair(other, true);
    assert(registry.classify(bob, other) == TransferKind::Sell);
    registry.set_market_pair(other, false);
    assert(registry.classify(bob, other) == TransferKind::Wallet);

    registry.set_fee_exempt(alice, true);
    registry.set_denied(bob, true);
    assert(registry.is_fee_exempt(alice));
    assert(!registry.is_fee_exempt(bob));
    assert(registry.is_denied(bob));
    registry.set_denied(bob, false);
    assert(!registry.is_denied(bob));

    assert(code_of([&] { registry.set_fee_exempt(Address::zero(), true); }) == ErrorCode::ZeroAddress);
    assert(code_of([&] { registry.set_denied(Address(), true); }) == ErrorCode::ZeroAddress);
    assert(code_of([&] { registry.set_market_pair(Address(), true); }) == ErrorCode::ZeroAddress);

    // Migration moves the protection; the old pair keeps its flag until cleared.
    const Address previous = registry.migrate_canonical_pair(other);
    assert(previous == pair);
    assert(registry.canonical_pair() == other);
    assert(registry.is_market_pair(other));
    assert(registry.is_market_pair(pair));
    registry.set_market_pair(pair, false);
    assert(!registry.is_market_pair(pair));
    assert(code_of([&] { registry.set_market_pair(other, false); }) == ErrorCode::ProtectedPair);
    assert(code_of([&] { registry.migrate_canonical_pair(Address()); }) == ErrorCode::ZeroAddress);

    bool threw = false;
    try {
        AccountRegistry bad{Address()};
    } catch (const EngineError &err) {
        threw = err.code() == ErrorCode::ZeroAddress;
    }
    assert(threw);
    return 0;
}
