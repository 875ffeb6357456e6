#pragma once

#include <filesystem>
#include <string>

#include "engine/constant_product_exchange.hpp"
#include "engine/conversion_engine.hpp"
#include "engine/fee_schedule.hpp"
#include "engine/fee_token.hpp"

namespace tollgate::engine {

// Accounts and balances the simulator sets up before replaying.
struct SimulationConfig {
    Address admin{"admin"};
    Address treasury{"treasury"};
    Amount initial_supply{1000000000};
    Amount seed_tokens{100000000};
    Amount seed_reference{100000000};
    std::string log_level{"info"};
    std::string source{"default"};
};

struct EngineConfig {
    TokenConfig token;
    FeeConfig fees;
    ConversionConfig conversion;
    ExchangeConfig exchange;
    SimulationConfig simulation;

    EngineConfig() {
        conversion.fee_recipient = Address("royalty.vault");
        conversion.liquidity_receiver = Address("liquidity.vault");
        conversion.min_royalty_to_swap = 10000;
        conversion.min_liquidity_to_swap = 10000;
        fees.sell_royalty = 50;
        fees.sell_liquidity = 30;
        fees.buy_liquidity = 20;
    }
};

// Accepts true/false, 1/0 and yes/no; leaves `out` alone otherwise.
bool parse_switch(const std::string &value, bool &out);

/**
 * Reads the YAML subset used under config/: top-level section names followed
 * by indented `key: value` lines, `#` comments. Unknown keys are ignored.
 * Returns false and fills `error` when the file is missing or a value does
 * not parse; `cfg` keeps whatever was read before the failure.
 */
bool load_engine_config(const std::filesystem::path &path, EngineConfig &cfg, std::string &error);

}  // namespace tollgate::engine
