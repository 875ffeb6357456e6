#include "engine/transfer_replay.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/logger.hpp"
#include "utils/time.hpp"

namespace tollgate::engine {
namespace {

std::vector<std::string> split_fields(const std::string &line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        std::size_t start = field.find_first_not_of(" \t");
        std::size_t end = field.find_last_not_of(" \t\r");
        out.push_back(start == std::string::npos ? std::string() : field.substr(start, end - start + 1));
    }
    return out;
}

bool parse_amount(const std::string &s, Amount &out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = static_cast<Amount>(std::stoull(s));
    } catch (const std::out_of_range &) {
        return false;
    }
    return true;
}

}  // namespace

const char *replay_op_name(ReplayOp op) {
    switch (op) {
        case ReplayOp::Transfer:
            return "transfer";
        case ReplayOp::Sell:
            return "sell";
        case ReplayOp::Buy:
            return "buy";
        case ReplayOp::Fund:
            return "fund";
        case ReplayOp::Deny:
            return "deny";
        case ReplayOp::Allow:
            return "allow";
        case ReplayOp::ConvertRoyalty:
            return "convert_royalty";
        case ReplayOp::ConvertLiquidity:
            return "convert_liquidity";
    }
    return "unknown";
}

bool TransferReplay::load_file(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return set_error("cannot open replay file " + path.string());
    }
    return load_stream(in);
}

bool TransferReplay::load_stream(std::istream &in) {
    steps_.clear();
    cursor_ = 0;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }
        if (!parse_line(line, line_no)) {
            return false;
        }
    }
    return true;
}

bool TransferReplay::parse_line(const std::string &line, std::size_t line_no) {
    const auto fields = split_fields(line);
    const std::string where = "replay line " + std::to_string(line_no) + ": ";
    ReplayStep step;
    step.line = line_no;
    const std::string &op = fields.at(0);
    auto need = [&](std::size_t n) {
        if (fields.size() != n) {
            return set_error(where + op + " expects " + std::to_string(n - 1) + " fields");
        }
        return true;
    };
    if (op == "transfer") {
        if (!need(4)) {
            return false;
        }
        step.op = ReplayOp::Transfer;
        step.actor = Address(fields[1]);
        step.counterparty = Address(fields[2]);
        if (!parse_amount(fields[3], step.amount)) {
            return set_error(where + "bad amount '" + fields[3] + "'");
        }
    } else if (op == "sell" || op == "buy" || op == "fund") {
        if (!need(3)) {
            return false;
        }
        step.op = (op == "sell") ? ReplayOp::Sell : (op == "buy") ? ReplayOp::Buy : ReplayOp::Fund;
        step.actor = Address(fields[1]);
        if (!parse_amount(fields[2], step.amount)) {
            return set_error(where + "bad amount '" + fields[2] + "'");
        }
    } else if (op == "deny" || op == "allow") {
        if (!need(2)) {
            return false;
        }
        step.op = (op == "deny") ? ReplayOp::Deny : ReplayOp::Allow;
        step.actor = Address(fields[1]);
    } else if (op == "convert_royalty" || op == "convert_liquidity") {
        if (!need(1)) {
            return false;
        }
        step.op = (op == "convert_royalty") ? ReplayOp::ConvertRoyalty : ReplayOp::ConvertLiquidity;
    } else {
        return set_error(where + "unknown op '" + op + "'");
    }
    steps_.push_back(step);
    return true;
}

ReplayResult TransferReplay::apply_next(ReplayContext &ctx) {
    ReplayResult res;
    if (finished()) {
        res.message = "replay finished";
        return res;
    }
    const ReplayStep &step = steps_[cursor_++];
    try {
        execute(step, ctx);
        res.ok = true;
        ++applied_;
    } catch (const EngineError &err) {
        res.code = err.code();
        res.message = err.what();
        ++reject_counts_[err.code()];
        utils::debug("replay line " + std::to_string(step.line) + " (" + replay_op_name(step.op) +
                     ") rejected: " + res.message);
    }
    return res;
}

void TransferReplay::execute(const ReplayStep &step, ReplayContext &ctx) {
    const int64_t deadline = utils::unix_now_s() + 60;
    const Address &pair = ctx.token.pair();
    switch (step.op) {
        case ReplayOp::Transfer:
            ctx.token.transfer(step.actor, step.counterparty, step.amount);
            break;
        case ReplayOp::Sell: {
            Journal::Scope scope(ctx.token.journal());
            ctx.token.approve(step.actor, ctx.exchange.router(), step.amount);
            ctx.exchange.swap_tokens_for_reference(pair, step.amount, 0, step.actor, step.actor, deadline);
            scope.commit();
            break;
        }
        case ReplayOp::Buy: {
            Journal::Scope scope(ctx.token.journal());
            ctx.exchange.swap_reference_for_tokens(pair, step.amount, 0, step.actor, step.actor, deadline);
            scope.commit();
            break;
        }
        case ReplayOp::Fund: {
            Journal::Scope scope(ctx.token.journal());
            ctx.reference.mint(step.actor, step.amount);
            scope.commit();
            break;
        }
        case ReplayOp::Deny:
            ctx.admin.set_denied(ctx.operator_account, step.actor, true);
            break;
        case ReplayOp::Allow:
            ctx.admin.set_denied(ctx.operator_account, step.actor, false);
            break;
        case ReplayOp::ConvertRoyalty:
            ctx.admin.manual_convert_royalty(ctx.operator_account);
            break;
        case ReplayOp::ConvertLiquidity:
            ctx.admin.manual_convert_liquidity(ctx.operator_account);
            break;
    }
}

bool TransferReplay::set_error(const std::string &err) {
    error_ = true;
    last_error_ = err;
    return false;
}

}  // namespace tollgate::engine
