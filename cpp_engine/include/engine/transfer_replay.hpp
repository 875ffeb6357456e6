#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <vector>

#include "engine/admin_surface.hpp"
#include "engine/constant_product_exchange.hpp"
#include "engine/errors.hpp"
#include "engine/fee_token.hpp"
#include "engine/ledger.hpp"

namespace tollgate::engine {

enum class ReplayOp : uint8_t { Transfer, Sell, Buy, Fund, Deny, Allow, ConvertRoyalty, ConvertLiquidity };

struct ReplayStep {
    std::size_t line{0};
    ReplayOp op{ReplayOp::Transfer};
    Address actor;
    Address counterparty;
    Amount amount{0};
};

struct ReplayResult {
    bool ok{false};
    ErrorCode code{ErrorCode::None};
    std::string message;
};

// Everything a replay step may touch.
struct ReplayContext {
    FeeToken &token;
    ConstantProductExchange &exchange;
    Ledger &reference;
    AdminSurface &admin;
    Address operator_account;
};

/**
 * Scripted activity against a FeeToken. One step per CSV line:
 *
 *   transfer,<from>,<to>,<amount>
 *   sell,<trader>,<amount>        tokens -> reference through the exchange
 *   buy,<trader>,<amount>         reference -> tokens through the exchange
 *   fund,<account>,<amount>       mint reference asset to an account
 *   deny,<account> / allow,<account>
 *   convert_royalty / convert_liquidity
 *
 * Engine rejections are returned per step; parse errors stop loading.
 */
class TransferReplay {
  public:
    TransferReplay() = default;

    bool load_file(const std::filesystem::path &path);
    bool load_stream(std::istream &in);
    bool finished() const { return cursor_ >= steps_.size(); }
    std::size_t size() const { return steps_.size(); }
    std::size_t position() const { return cursor_; }
    const ReplayStep &peek() const { return steps_.at(cursor_); }
    ReplayResult apply_next(ReplayContext &ctx);

    const std::map<ErrorCode, uint64_t> &reject_counts() const { return reject_counts_; }
    uint64_t applied() const { return applied_; }
    bool has_error() const { return error_; }
    const std::string &last_error() const { return last_error_; }

  private:
    bool parse_line(const std::string &line, std::size_t line_no);
    void execute(const ReplayStep &step, ReplayContext &ctx);
    bool set_error(const std::string &err);

    std::vector<ReplayStep> steps_;
    std::size_t cursor_{0};
    uint64_t applied_{0};
    std::map<ErrorCode, uint64_t> reject_counts_;
    bool error_{false};
    std::string last_error_;
};

const char *replay_op_name(ReplayOp op);

}  // namespace tollgate::engine
