#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>

#include "engine/admin_surface.hpp"
#include "engine/authorizer.hpp"
#include "engine/config.hpp"
#include "engine/constant_product_exchange.hpp"
#include "engine/event_bus.hpp"
#include "engine/fee_token.hpp"
#include "engine/journal.hpp"
#include "engine/ledger.hpp"
#include "engine/recorder.hpp"
#include "engine/transfer_replay.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"

using namespace tollgate;

namespace {

void print_usage() {
    std::cout << "usage: tollgate_sim [--config path] [--events path] [--log_level level] "
                 "[--swap_enabled 0|1] [replay.csv]\n";
}

void seed_market(const engine::EngineConfig &cfg, engine::FeeToken &token, engine::ConstantProductExchange &exchange,
                 engine::Ledger &reference, engine::AdminSurface &admin) {
    const engine::SimulationConfig &sim = cfg.simulation;
    engine::Journal::Scope scope(token.journal());
    admin.set_fee_exempt(sim.admin, sim.treasury, true);
    admin.mint(sim.admin, sim.treasury, sim.initial_supply);
    reference.mint(sim.treasury, sim.seed_reference);
    token.approve(sim.treasury, exchange.router(), sim.seed_tokens);
    const engine::DepositReceipt receipt =
        exchange.add_liquidity(token.pair(), sim.seed_tokens, sim.seed_reference, sim.seed_tokens,
                               sim.seed_reference, sim.treasury, sim.treasury, utils::unix_now_s() + 60);
    scope.commit();
    std::stringstream ss;
    ss << "market seeded: tokens=" << receipt.token_used << " reference=" << receipt.reference_used
       << " shares=" << receipt.shares;
    utils::info(ss.str());
}

std::string summarize(const engine::FeeToken &token, const engine::ConstantProductExchange &exchange,
                      const engine::Ledger &reference, const engine::TransferReplay &replay) {
    const engine::TransferMetrics &m = token.metrics();
    const engine::ConversionMetrics &c = token.conversion().metrics();
    const engine::ConversionConfig &conv = token.conversion().config();
    const engine::Reserves r = exchange.reserves(token.pair());
    std::stringstream ss;
    ss << "Replay summary\n";
    ss << "  steps applied=" << replay.applied() << "/" << replay.size() << "\n";
    ss << "  transfers=" << m.transfers << " sells=" << m.sells << " buys=" << m.buys << " wallet=" << m.wallet
       << " exempt=" << m.exempt << "\n";
    ss << "  fees collected royalty=" << m.royalty_collected << " liquidity=" << m.liquidity_collected << "\n";
    ss << "  pools royalty=" << token.accrual().royalty_pool() << " liquidity=" << token.accrual().liquidity_pool()
       << "\n";
    ss << "  conversions royalty=" << c.royalty_conversions << " liquidity=" << c.liquidity_conversions
       << " manual=" << c.manual_conversions << " skipped_busy=" << c.skipped_busy << "\n";
    ss << "  forwarded to " << conv.fee_recipient.str() << "=" << reference.balance_of(conv.fee_recipient)
       << " liquidity shares to " << conv.liquidity_receiver.str() << "="
       << exchange.shares_of(token.pair(), conv.liquidity_receiver) << "\n";
    ss << "  reserves token=" << r.token << " reference=" << r.reference << "\n";
    for (const auto &kv : replay.reject_counts()) {
        ss << "  rejects[" << engine::error_code_name(kv.first) << "]=" << kv.second << "\n";
    }
    return ss.str();
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path = "config/tollgate.yaml";
    std::string replay_source = "data/replay/sample_transfers.csv";
    std::string events_path;
    std::string log_level_override;
    int swap_enabled_override = -1;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--events" && i + 1 < argc) {
            events_path = argv[++i];
        } else if (arg == "--log_level" && i + 1 < argc) {
            log_level_override = argv[++i];
        } else if (arg == "--swap_enabled" && i + 1 < argc) {
            const std::string value = argv[++i];
            bool enabled = false;
            if (!engine::parse_switch(value, enabled)) {
                utils::error("--swap_enabled expects 0 or 1, got '" + value + "'");
                print_usage();
                return 1;
            }
            swap_enabled_override = enabled ? 1 : 0;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] != '-') {
            replay_source = arg;
        } else {
            utils::warn("ignoring unknown argument " + arg);
        }
    }

    engine::EngineConfig cfg;
    std::string config_error;
    if (!load_engine_config(config_path, cfg, config_error)) {
        if (std::filesystem::exists(config_path)) {
            utils::error("[FATAL] " + config_error);
            return 1;
        }
        utils::warn("Config " + config_path + " not found, using defaults");
    }
    if (swap_enabled_override >= 0) {
        cfg.conversion.swap_enabled = swap_enabled_override == 1;
    }
    const std::string level_name = log_level_override.empty() ? cfg.simulation.log_level : log_level_override;
    utils::LogLevel level = utils::LogLevel::Info;
    if (!utils::parse_level(level_name, level)) {
        utils::warn("unknown log level " + level_name + ", keeping info");
    }
    utils::set_min_level(level);

    engine::TransferReplay replay;
    if (!replay.load_file(replay_source)) {
        utils::error("[FATAL] " + replay.last_error());
        return 1;
    }

    const auto started = utils::now_ns();
    try {
        engine::Ledger ledger(cfg.token.symbol);
        engine::Ledger reference("WETH");
        engine::ConstantProductExchange exchange(reference, cfg.exchange);
        engine::Journal journal;
        engine::EventBus events(4096);
        engine::RoleRegistry roles(cfg.simulation.admin);
        roles.grant_role(cfg.simulation.admin, engine::Role::Operator, cfg.simulation.admin);
        roles.grant_role(cfg.simulation.admin, engine::Role::Minter, cfg.simulation.admin);

        engine::FeeToken token(cfg.token, cfg.fees, cfg.conversion, ledger, reference, exchange, journal, events);
        journal.track(exchange);
        engine::AdminSurface admin(token, roles);

        std::unique_ptr<engine::Recorder> recorder;
        if (!events_path.empty()) {
            recorder = std::make_unique<engine::Recorder>(events_path);
            if (!recorder->is_open()) {
                utils::error("Failed to open event record " + events_path);
                return 1;
            }
        }

        seed_market(cfg, token, exchange, reference, admin);

        engine::ReplayContext ctx{token, exchange, reference, admin, cfg.simulation.admin};
        while (!replay.finished()) {
            const engine::ReplayResult res = replay.apply_next(ctx);
            if (!res.ok && engine::error_class(res.code) == engine::ErrorClass::External) {
                utils::warn(res.message);
            }
            if (recorder) {
                recorder->drain(events);
            } else {
                while (events.poll()) {
                    // no sink configured
                }
            }
            const engine::InvariantReport inv = token.check_invariants();
            if (!inv.ok) {
                utils::error("[FATAL] invariant broken after replay step " + std::to_string(replay.position()) +
                             ": " + inv.message);
                return 2;
            }
        }
        if (recorder) {
            recorder->flush();
            utils::info("Recorded " + std::to_string(recorder->recorded()) + " events to " + events_path);
        }

        utils::info(summarize(token, exchange, reference, replay));
        const auto elapsed_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(utils::now_ns() - started).count();
        utils::info("Replay of " + replay_source + " complete in " + std::to_string(elapsed_ms) + " ms (requests committed=" +
                    std::to_string(journal.committed()) + " reverted=" + std::to_string(journal.reverted()) + ")");
    } catch (const engine::EngineError &err) {
        utils::error(std::string("[FATAL] ") + err.what());
        return 1;
    }
    return 0;
}
