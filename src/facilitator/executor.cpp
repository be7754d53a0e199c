// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "executor.hpp"

#include "evm/math.hpp"
#include "evm/util.hpp"
#include "nonce_guard.hpp"

#include <algorithm>
#include <cstring>
#include <thread>

namespace agentpay::facilitator {
    namespace {
        constexpr auto min_poll_interval = std::chrono::milliseconds(1);
        constexpr auto max_poll_interval = std::chrono::milliseconds(1000);
        constexpr auto max_sleep_slice = std::chrono::milliseconds(50);
        constexpr size_t inclusion_window_factor = 4;
    }

    struct executor::context {
        std::shared_ptr<chain::interface> m_adapter;
        const payment_request& m_req;
        cancel_flag m_cancelled;
        std::chrono::steady_clock::time_point m_deadline;
        /// Hashes of every transaction signed for this payment.
        std::vector<hash_t> m_own_txs{};
        settlement_receipt m_receipt{};
    };

    enum class executor::outcome {
        confirmed,
        reverted,
        dropped,
        reorged,
        interrupted
    };

    executor::executor(std::shared_ptr<chain::registry> chains,
                       const config& cfg,
                       std::shared_ptr<logging::log> log,
                       clock_type clock)
        : m_chains(std::move(chains)),
          m_verifier(m_chains->domains()),
          m_clock_skew(cfg.m_clock_skew),
          m_settlement_timeout(cfg.m_settlement_timeout),
          m_max_attempts(cfg.m_max_submit_attempts),
          m_backoff_initial(cfg.m_backoff_initial),
          m_backoff_max(cfg.m_backoff_max),
          m_log(std::move(log)),
          m_clock(std::move(clock)) {}

    auto executor::system_clock() -> uint64_t {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count());
    }

    auto executor::check_offline(const chain::interface& adapter,
                                 const payment_request& req)
        -> std::variant<evmc::address, error> {
        const auto& auth = req.m_authorization;
        auto res = m_verifier.verify(adapter.config().domain(), auth);
        if(std::holds_alternative<error>(res)) {
            return res;
        }
        if(auto err = check_validity_window(auth, m_clock(), m_clock_skew)) {
            return err.value();
        }
        if(auto err = check_requirements(auth, req.m_requirements)) {
            return err.value();
        }
        return res;
    }

    auto executor::check_balance(chain::interface& adapter,
                                 const payment_authorization& auth)
        -> std::optional<error> {
        auto bal = adapter.balance_of(auth.m_from);
        if(auto* err = std::get_if<chain::error>(&bal)) {
            return error{error_code::settlement_unavailable,
                         "unable to read payer balance: " + err->m_message};
        }
        const auto& balance = std::get<evmc::uint256be>(bal);
        if(std::memcmp(balance.bytes,
                       auth.m_value.bytes,
                       sizeof(balance.bytes))
           < 0) {
            return error{error_code::settlement_failed, "insufficient_funds"};
        }
        return std::nullopt;
    }

    auto executor::verify(const payment_request& req)
        -> std::variant<evmc::address, error> {
        auto maybe_adapter = m_chains->get(req.m_network);
        if(auto* err = std::get_if<error>(&maybe_adapter)) {
            return *err;
        }
        auto& adapter = std::get<std::shared_ptr<chain::interface>>(
            maybe_adapter);

        auto res = check_offline(*adapter, req);
        if(std::holds_alternative<error>(res)) {
            return res;
        }
        if(auto err = check_nonce(*adapter, req.m_authorization)) {
            return err.value();
        }
        if(auto err = check_balance(*adapter, req.m_authorization)) {
            return err.value();
        }
        return res;
    }

    void executor::transition(context& ctx, settlement_status status) {
        ctx.m_receipt.m_status = status;
        m_log->trace("Settlement of nonce",
                     evm::to_hex(ctx.m_req.m_authorization.m_nonce),
                     "on",
                     ctx.m_req.m_network,
                     "->",
                     to_string(status));
    }

    auto executor::interrupted(const context& ctx) const -> bool {
        return (ctx.m_cancelled && *ctx.m_cancelled)
            || std::chrono::steady_clock::now() >= ctx.m_deadline;
    }

    auto executor::interruption(const context& ctx) -> error {
        if(ctx.m_own_txs.empty()) {
            return error{error_code::cancelled,
                         "settlement abandoned before submission"};
        }
        return error{error_code::settlement_unavailable,
                     "settlement budget elapsed with transaction 0x"
                         + agentpay::to_string(ctx.m_own_txs.back())
                         + " unconfirmed"};
    }

    auto executor::pause(context& ctx, std::chrono::milliseconds duration)
        -> bool {
        auto until = std::chrono::steady_clock::now() + duration;
        while(std::chrono::steady_clock::now() < until) {
            if(interrupted(ctx)) {
                return false;
            }
            auto remaining
                = std::chrono::duration_cast<std::chrono::milliseconds>(
                    until - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(
                std::clamp(remaining,
                           std::chrono::milliseconds(0),
                           max_sleep_slice));
        }
        return !interrupted(ctx);
    }

    auto executor::find_own_inclusion(context& ctx)
        -> std::optional<evm::evm_tx_receipt> {
        for(const auto& tx_hash : ctx.m_own_txs) {
            auto res = ctx.m_adapter->get_receipt(tx_hash);
            if(auto* receipt
               = std::get_if<std::optional<evm::evm_tx_receipt>>(&res)) {
                if(receipt->has_value() && receipt->value().m_success) {
                    return receipt->value();
                }
            }
        }
        return std::nullopt;
    }

    auto executor::await_inclusion(context& ctx, const hash_t& tx_hash)
        -> std::pair<outcome, std::optional<evm::evm_tx_receipt>> {
        const auto& cfg = ctx.m_adapter->config();
        auto poll = std::clamp(
            std::chrono::milliseconds(cfg.m_block_time_ms / 2),
            min_poll_interval,
            max_poll_interval);
        auto window = std::max(ctx.m_adapter->confirmation_estimate(),
                               poll)
                    * inclusion_window_factor;
        auto until = std::chrono::steady_clock::now() + window;

        while(std::chrono::steady_clock::now() < until) {
            auto res = ctx.m_adapter->get_receipt(tx_hash);
            if(auto* receipt
               = std::get_if<std::optional<evm::evm_tx_receipt>>(&res)) {
                if(receipt->has_value()) {
                    auto outcome_val = receipt->value().m_success
                                         ? outcome::confirmed
                                         : outcome::reverted;
                    return {outcome_val, receipt->value()};
                }
            } else {
                m_log->warn("Receipt poll for",
                            agentpay::to_string(tx_hash),
                            "failed:",
                            std::get<chain::error>(res).m_message);
            }
            if(!pause(ctx, poll)) {
                return {outcome::interrupted, std::nullopt};
            }
        }
        return {outcome::dropped, std::nullopt};
    }

    auto executor::await_confirmation(context& ctx,
                                      const evm::evm_tx_receipt& receipt)
        -> outcome {
        const auto& cfg = ctx.m_adapter->config();
        auto poll = std::clamp(
            std::chrono::milliseconds(cfg.m_block_time_ms / 2),
            min_poll_interval,
            max_poll_interval);
        auto target = receipt.m_block_number + cfg.m_confirmations;

        while(true) {
            auto head = ctx.m_adapter->block_number();
            if(auto* number = std::get_if<uint64_t>(&head)) {
                if(*number >= target) {
                    break;
                }
            }
            if(!pause(ctx, poll)) {
                return outcome::interrupted;
            }
        }

        // The inclusion block must still be canonical and still contain
        // the transaction.
        auto canonical = ctx.m_adapter->block_hash(receipt.m_block_number);
        auto current = ctx.m_adapter->get_receipt(receipt.m_tx_hash);
        auto* block = std::get_if<std::optional<hash_t>>(&canonical);
        auto* rcpt = std::get_if<std::optional<evm::evm_tx_receipt>>(&current);
        if(block == nullptr || rcpt == nullptr) {
            // Unknown. Treat as a reorg so the nonce is re-checked.
            return outcome::reorged;
        }
        if(!block->has_value() || block->value() != receipt.m_block_hash
           || !rcpt->has_value()
           || rcpt->value().m_block_hash != receipt.m_block_hash) {
            return outcome::reorged;
        }
        return outcome::confirmed;
    }

    auto executor::finish(context& ctx, const evm::evm_tx_receipt& receipt)
        -> settlement_receipt {
        ctx.m_receipt.m_tx_hash = receipt.m_tx_hash;
        ctx.m_receipt.m_block_number = receipt.m_block_number;
        ctx.m_receipt.m_block_hash = receipt.m_block_hash;
        transition(ctx, settlement_status::confirmed);
        m_log->info("Settled payment from",
                    evm::to_checksum_address(ctx.m_receipt.m_payer),
                    "on",
                    ctx.m_req.m_network,
                    "in tx",
                    agentpay::to_string(receipt.m_tx_hash),
                    "block",
                    receipt.m_block_number);
        return ctx.m_receipt;
    }

    auto executor::after_consumed_nonce(context& ctx)
        -> std::variant<settlement_receipt, error, outcome> {
        auto own = find_own_inclusion(ctx);
        if(own.has_value()) {
            auto res = await_confirmation(ctx, own.value());
            if(res == outcome::confirmed) {
                return finish(ctx, own.value());
            }
            if(res == outcome::interrupted) {
                return interruption(ctx);
            }
            return res;
        }
        auto err = check_nonce(*ctx.m_adapter, ctx.m_req.m_authorization);
        if(!err.has_value()) {
            // The consuming transaction was reorganized away.
            return outcome::reorged;
        }
        return err.value();
    }

    auto executor::settle(const payment_request& req,
                          const cancel_flag& cancelled)
        -> std::variant<settlement_receipt, error> {
        auto maybe_adapter = m_chains->get(req.m_network);
        if(auto* err = std::get_if<error>(&maybe_adapter)) {
            m_log->debug("Settlement rejected:", err->m_message);
            return *err;
        }

        auto ctx = context{
            std::get<std::shared_ptr<chain::interface>>(maybe_adapter),
            req,
            cancelled,
            std::chrono::steady_clock::now() + m_settlement_timeout};
        const auto& auth = req.m_authorization;
        ctx.m_receipt.m_network = req.m_network;
        ctx.m_receipt.m_payer = auth.m_from;
        ctx.m_receipt.m_nonce = auth.m_nonce;
        transition(ctx, settlement_status::received);

        auto fail = [&](error err) -> std::variant<settlement_receipt, error> {
            transition(ctx, settlement_status::failed);
            m_log->info("Settlement on",
                        req.m_network,
                        "failed:",
                        to_string(err.m_code),
                        err.m_message);
            return err;
        };

        auto verified = check_offline(*ctx.m_adapter, req);
        if(auto* err = std::get_if<error>(&verified)) {
            return fail(*err);
        }
        transition(ctx, settlement_status::verified);

        auto backoff = m_backoff_initial;
        auto last_error = error{error_code::settlement_unavailable,
                                "ledger unavailable"};
        auto retry = [&](error err) -> bool {
            last_error = std::move(err);
            m_log->warn("Settlement attempt on",
                        req.m_network,
                        "failed transiently:",
                        last_error.m_message);
            auto ok = pause(ctx, backoff);
            backoff = std::min(backoff * 2, m_backoff_max);
            return ok;
        };

        for(size_t attempt = 0; attempt < m_max_attempts; attempt++) {
            if(interrupted(ctx)) {
                return fail(interruption(ctx));
            }

            // The ledger decides whether this authorization may still be
            // submitted.
            auto state = query_nonce(*ctx.m_adapter, auth);
            if(auto* err = std::get_if<chain::error>(&state)) {
                if(!retry(error{error_code::settlement_unavailable,
                                "unable to read authorization state: "
                                    + err->m_message})) {
                    return fail(interruption(ctx));
                }
                continue;
            }
            if(std::get<bool>(state)) {
                auto res = after_consumed_nonce(ctx);
                if(auto* receipt = std::get_if<settlement_receipt>(&res)) {
                    return *receipt;
                }
                if(auto* err = std::get_if<error>(&res)) {
                    return fail(*err);
                }
                m_log->warn("Inclusion block of settlement on",
                            req.m_network,
                            "was reorganized");
                continue;
            }

            if(auto err
               = check_validity_window(auth, m_clock(), m_clock_skew)) {
                return fail(err.value());
            }
            if(auto err = check_balance(*ctx.m_adapter, auth)) {
                if(err->m_code == error_code::settlement_unavailable) {
                    if(!retry(err.value())) {
                        return fail(interruption(ctx));
                    }
                    continue;
                }
                return fail(err.value());
            }

            auto sub = ctx.m_adapter->submit_transfer(auth);
            if(sub.m_tx_hash.has_value()) {
                ctx.m_own_txs.push_back(sub.m_tx_hash.value());
            }
            if(sub.m_error.has_value()) {
                const auto& err = sub.m_error.value();
                if(err.m_kind == chain::error_kind::transient) {
                    if(!retry(error{error_code::settlement_unavailable,
                                    err.m_message})) {
                        return fail(interruption(ctx));
                    }
                    continue;
                }
                // A racing settlement may have consumed the nonce.
                auto after = query_nonce(*ctx.m_adapter, auth);
                if(auto* used = std::get_if<bool>(&after); used && *used) {
                    auto res = after_consumed_nonce(ctx);
                    if(auto* receipt = std::get_if<settlement_receipt>(&res)) {
                        return *receipt;
                    }
                    if(auto* e = std::get_if<error>(&res)) {
                        return fail(*e);
                    }
                    continue;
                }
                return fail(error{error_code::settlement_failed,
                                  err.m_message});
            }

            const auto& tx_hash = sub.m_tx_hash.value();
            ctx.m_receipt.m_tx_hash = tx_hash;
            transition(ctx, settlement_status::submitted);

            auto [inclusion, receipt] = await_inclusion(ctx, tx_hash);
            switch(inclusion) {
                case outcome::confirmed: {
                    auto conf = await_confirmation(ctx, receipt.value());
                    if(conf == outcome::confirmed) {
                        return finish(ctx, receipt.value());
                    }
                    if(conf == outcome::interrupted) {
                        return fail(interruption(ctx));
                    }
                    m_log->warn("Transaction",
                                agentpay::to_string(tx_hash),
                                "was reorganized out of block",
                                receipt->m_block_number);
                    last_error = error{error_code::settlement_unavailable,
                                       "transaction 0x"
                                           + agentpay::to_string(tx_hash)
                                           + " was reorganized"};
                    break;
                }
                case outcome::reverted: {
                    // An earlier transaction of ours may have consumed the
                    // nonce first.
                    auto after = query_nonce(*ctx.m_adapter, auth);
                    if(auto* used = std::get_if<bool>(&after); used && *used) {
                        auto res = after_consumed_nonce(ctx);
                        if(auto* rcpt = std::get_if<settlement_receipt>(&res)) {
                            return *rcpt;
                        }
                        if(auto* e = std::get_if<error>(&res)) {
                            return fail(*e);
                        }
                        continue;
                    }
                    if(std::holds_alternative<chain::error>(after)
                       && ctx.m_own_txs.size() > 1) {
                        return fail(error{
                            error_code::settlement_unavailable,
                            "transaction 0x" + agentpay::to_string(tx_hash)
                                + " reverted and the authorization state of "
                                  "earlier submissions is unknown: "
                                + std::get<chain::error>(after).m_message});
                    }
                    return fail(error{error_code::settlement_failed,
                                      "transaction 0x"
                                          + agentpay::to_string(tx_hash)
                                          + " reverted"});
                }
                case outcome::dropped:
                    m_log->warn("Transaction",
                                agentpay::to_string(tx_hash),
                                "was not included, re-checking nonce");
                    last_error = error{error_code::settlement_unavailable,
                                       "transaction 0x"
                                           + agentpay::to_string(tx_hash)
                                           + " was not included"};
                    break;
                case outcome::interrupted:
                    return fail(interruption(ctx));
                case outcome::reorged:
                    break;
            }
        }

        return fail(last_error);
    }
}
