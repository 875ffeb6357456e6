#pragma once

#include <optional>
#include <unordered_map>

#include "engine/journal.hpp"
#include "engine/types.hpp"

namespace tollgate::engine {

struct AccountFlags {
    bool fee_exempt{false};
    bool market_pair{false};
    bool denied{false};
};

/**
 * Per-address classification read on every transfer. The canonical pair is
 * always a market pair; clearing it through set_market_pair is refused and
 * moving the protection requires migrate_canonical_pair.
 */
class AccountRegistry : public Revertible {
  public:
    explicit AccountRegistry(Address canonical_pair);

    AccountFlags flags(const Address &account) const;
    bool is_fee_exempt(const Address &account) const { return flags(account).fee_exempt; }
    bool is_market_pair(const Address &account) const { return flags(account).market_pair; }
    bool is_denied(const Address &account) const { return flags(account).denied; }
    const Address &canonical_pair() const { return canonical_pair_; }

    TransferKind classify(const Address &from, const Address &to) const;

    void set_fee_exempt(const Address &account, bool exempt);
    void set_market_pair(const Address &account, bool market_pair);
    void set_denied(const Address &account, bool denied);
    // Returns the previous canonical pair.
    Address migrate_canonical_pair(const Address &next);

    void checkpoint() override { saved_ = Saved{flags_, canonical_pair_}; }
    void rollback() override;
    void release() override { saved_.reset(); }

  private:
    static void require_account(const Address &account);

    std::unordered_map<Address, AccountFlags, AddressHash> flags_;
    Address canonical_pair_;

    struct Saved {
        std::unordered_map<Address, AccountFlags, AddressHash> flags;
        Address canonical_pair;
    };
    std::optional<Saved> saved_;
};

}  // namespace tollgate::engine
