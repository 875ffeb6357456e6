#include "engine/config.hpp"

#include <fstream>
#include <stdexcept>

namespace tollgate::engine {
namespace {

std::string ltrim(const std::string &s) {
    std::size_t start = s.find_first_not_of(" \t");
    return (start == std::string::npos) ? std::string() : s.substr(start);
}

std::string rtrim(const std::string &s) {
    std::size_t end = s.find_last_not_of(" \t\r");
    return (end == std::string::npos) ? std::string() : s.substr(0, end + 1);
}

bool keyval(const std::string &s, std::string &key, std::string &val) {
    auto pos = s.find(':');
    if (pos == std::string::npos) {
        return false;
    }
    key = rtrim(ltrim(s.substr(0, pos)));
    val = rtrim(ltrim(s.substr(pos + 1)));
    return true;
}

std::string strip_quotes(const std::string &s) {
    std::size_t start = 0;
    std::size_t end = s.size();
    while (start < end && (s[start] == '"' || s[start] == '\'')) {
        ++start;
    }
    while (end > start && (s[end - 1] == '"' || s[end - 1] == '\'')) {
        --end;
    }
    return s.substr(start, end - start);
}

Amount to_amount(const std::string &val) {
    if (val.empty() || val[0] == '-') {
        throw std::invalid_argument("expected a non-negative integer, got '" + val + "'");
    }
    std::size_t used = 0;
    const unsigned long long v = std::stoull(val, &used);
    if (used != val.size()) {
        throw std::invalid_argument("trailing characters in '" + val + "'");
    }
    return static_cast<Amount>(v);
}

uint32_t to_rate(const std::string &val) {
    const Amount v = to_amount(val);
    if (v > 0xFFFFFFFFULL) {
        throw std::out_of_range("rate '" + val + "' out of range");
    }
    return static_cast<uint32_t>(v);
}

bool to_bool(const std::string &val) {
    bool out = false;
    if (!parse_switch(val, out)) {
        throw std::invalid_argument("expected a boolean, got '" + val + "'");
    }
    return out;
}

void apply_token(TokenConfig &cfg, const std::string &key, const std::string &val) {
    if (key == "name") {
        cfg.name = val;
    } else if (key == "symbol") {
        cfg.symbol = val;
    } else if (key == "address") {
        cfg.self = Address(val);
    }
}

void apply_fees(FeeConfig &cfg, const std::string &key, const std::string &val) {
    if (key == "sell_royalty") {
        cfg.sell_royalty = to_rate(val);
    } else if (key == "sell_liquidity") {
        cfg.sell_liquidity = to_rate(val);
    } else if (key == "buy_liquidity") {
        cfg.buy_liquidity = to_rate(val);
    } else if (key == "denominator") {
        cfg.denominator = to_rate(val);
    } else if (key == "max_sell_total") {
        cfg.max_sell_total = to_rate(val);
    }
}

void apply_conversion(ConversionConfig &cfg, const std::string &key, const std::string &val) {
    if (key == "min_royalty_to_swap") {
        cfg.min_royalty_to_swap = to_amount(val);
    } else if (key == "min_liquidity_to_swap") {
        cfg.min_liquidity_to_swap = to_amount(val);
    } else if (key == "swap_enabled") {
        cfg.swap_enabled = to_bool(val);
    } else if (key == "swap_slippage") {
        cfg.swap_slippage = to_rate(val);
    } else if (key == "deposit_slippage") {
        cfg.deposit_slippage = to_rate(val);
    } else if (key == "deadline_window_s") {
        cfg.deadline_window_s = static_cast<int64_t>(to_amount(val));
    } else if (key == "fee_recipient") {
        cfg.fee_recipient = Address(val);
    } else if (key == "liquidity_receiver") {
        cfg.liquidity_receiver = Address(val);
    }
}

void apply_exchange(ExchangeConfig &cfg, const std::string &key, const std::string &val) {
    if (key == "router") {
        cfg.router = Address(val);
    } else if (key == "fee_numerator") {
        cfg.fee_numerator = to_rate(val);
    } else if (key == "fee_denominator") {
        cfg.fee_denominator = to_rate(val);
    }
}

void apply_simulation(SimulationConfig &cfg, const std::string &key, const std::string &val) {
    if (key == "admin") {
        cfg.admin = Address(val);
    } else if (key == "treasury") {
        cfg.treasury = Address(val);
    } else if (key == "initial_supply") {
        cfg.initial_supply = to_amount(val);
    } else if (key == "seed_tokens") {
        cfg.seed_tokens = to_amount(val);
    } else if (key == "seed_reference") {
        cfg.seed_reference = to_amount(val);
    } else if (key == "log_level") {
        cfg.log_level = val;
    }
}

}  // namespace

bool parse_switch(const std::string &value, bool &out) {
    if (value == "true" || value == "1" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

bool load_engine_config(const std::filesystem::path &path, EngineConfig &cfg, std::string &error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "cannot open " + path.string();
        return false;
    }
    const std::string source = "file:" + path.string();
    std::string section;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        const std::string trimmed = rtrim(ltrim(line));
        if (trimmed.empty()) {
            continue;
        }
        const bool indented = line[0] == ' ' || line[0] == '\t';
        if (!indented && trimmed.back() == ':') {
            section = trimmed.substr(0, trimmed.size() - 1);
            continue;
        }
        std::string key, val;
        if (!keyval(trimmed, key, val)) {
            continue;
        }
        val = strip_quotes(val);
        try {
            if (section == "token") {
                apply_token(cfg.token, key, val);
                cfg.token.source = source;
            } else if (section == "fees") {
                apply_fees(cfg.fees, key, val);
                cfg.fees.source = source;
            } else if (section == "conversion") {
                apply_conversion(cfg.conversion, key, val);
                cfg.conversion.source = source;
            } else if (section == "exchange") {
                apply_exchange(cfg.exchange, key, val);
                cfg.exchange.source = source;
            } else if (section == "simulation") {
                apply_simulation(cfg.simulation, key, val);
                cfg.simulation.source = source;
            }
        } catch (const std::exception &ex) {
            error = path.string() + ":" + std::to_string(line_no) + ": " + section + "." + key + ": " + ex.what();
            return false;
        }
    }
    return true;
}

}  // namespace tollgate::engine
