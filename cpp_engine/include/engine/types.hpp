#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "engine/deterministic_hash.hpp"

namespace tollgate::engine {

using Amount = uint64_t;

// Opaque account identifier. The empty identifier is the zero address.
class Address {
  public:
    Address() = default;
    explicit Address(std::string id) : id_(std::move(id)) {}

    static Address zero() { return Address(); }

    bool is_zero() const { return id_.empty(); }
    const std::string &str() const { return id_; }

    bool operator==(const Address &other) const { return id_ == other.id_; }
    bool operator!=(const Address &other) const { return id_ != other.id_; }
    bool operator<(const Address &other) const { return id_ < other.id_; }

  private:
    std::string id_;
};

struct AddressHash {
    std::size_t operator()(const Address &a) const { return static_cast<std::size_t>(fnv1a64(a.str())); }
};

inline std::string display(const Address &a) { return a.is_zero() ? std::string("0x0") : a.str(); }

enum class Role : uint8_t { Admin, Operator, Minter };

enum class TransferKind : uint8_t { Wallet, Buy, Sell };

enum class ConversionState : uint8_t { Idle, ConvertingRoyalty, ConvertingLiquidity };

enum class ConversionOutcome : uint8_t { None, Royalty, Liquidity };

inline const char *role_name(Role role) {
    switch (role) {
        case Role::Admin:
            return "admin";
        case Role::Operator:
            return "operator";
        case Role::Minter:
            return "minter";
    }
    return "unknown";
}

inline const char *kind_name(TransferKind kind) {
    switch (kind) {
        case TransferKind::Wallet:
            return "wallet";
        case TransferKind::Buy:
            return "buy";
        case TransferKind::Sell:
            return "sell";
    }
    return "unknown";
}

inline const char *state_name(ConversionState state) {
    switch (state) {
        case ConversionState::Idle:
            return "idle";
        case ConversionState::ConvertingRoyalty:
            return "converting_royalty";
        case ConversionState::ConvertingLiquidity:
            return "converting_liquidity";
    }
    return "unknown";
}

struct Event {
    enum class Type {
        Transfer,
        FeesCredited,
        ConversionStarted,
        ConversionFinished,
        ManualConversion,
        ExemptionChanged,
        DenyListChanged,
        RateChanged,
        ThresholdChanged,
        RecipientChanged,
        MarketPairChanged,
        PairMigrated,
        SwapEnabledChanged,
        SlippageChanged,
        Unknown
    };
    Type type{Type::Unknown};
    uint64_t seq{0};
    std::string payload;
};

const char *event_type_name(Event::Type type);

}  // namespace tollgate::engine
