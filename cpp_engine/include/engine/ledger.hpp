#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "engine/journal.hpp"
#include "engine/types.hpp"

namespace tollgate::engine {

/**
 * Balance and allowance book for one asset. Used both for the fee-bearing
 * token and for the reference asset the engine converts into. settle() is
 * virtual so a collaborator can refuse a transfer.
 */
class Ledger : public Revertible {
  public:
    explicit Ledger(std::string symbol) : symbol_(std::move(symbol)) {}
    ~Ledger() override = default;

    const std::string &symbol() const { return symbol_; }
    Amount balance_of(const Address &account) const;
    Amount total_supply() const { return state_.supply; }
    Amount allowance(const Address &owner, const Address &spender) const;

    virtual void settle(const Address &from, const Address &to, Amount amount);
    void approve(const Address &owner, const Address &spender, Amount amount);
    void spend_allowance(const Address &owner, const Address &spender, Amount amount);
    void mint(const Address &to, Amount amount);
    void burn(const Address &from, Amount amount);

    void checkpoint() override;
    void rollback() override;
    void release() override;

  private:
    struct State {
        std::unordered_map<Address, Amount, AddressHash> balances;
        std::map<std::pair<Address, Address>, Amount> allowances;
        Amount supply{0};
    };

    std::string symbol_;
    State state_;
    std::optional<State> saved_;
};

}  // namespace tollgate::engine
