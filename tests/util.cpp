// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "evm/abi.hpp"
#include "evm/hash.hpp"
#include "evm/math.hpp"
#include "evm/serialization.hpp"
#include "evm/signature.hpp"
#include "evm/util.hpp"
#include "facilitator/typed_data.hpp"

#include <cstring>

namespace agentpay::test {
    auto make_chain_config(const std::string& network, uint64_t chain_id)
        -> chain::chain_config {
        auto cfg = chain::chain_config();
        cfg.m_network = network;
        cfg.m_family = chain::family::evm;
        cfg.m_rpc_endpoint = "http://127.0.0.1:8545";
        cfg.m_chain_id = chain_id;
        cfg.m_token = make_address(0xaa);
        cfg.m_domain_name = "USD Coin";
        cfg.m_domain_version = "2";
        cfg.m_identity_registry = make_address(0xbb);
        cfg.m_reputation_registry = make_address(0xcc);
        cfg.m_block_time_ms = 2;
        cfg.m_confirmations = 1;
        cfg.m_gas_price_multiplier_pct = 100;
        cfg.m_gas_limit = 150000;
        return cfg;
    }

    auto make_key(unsigned char seed) -> privkey_t {
        auto key = privkey_t();
        key.fill(seed);
        return key;
    }

    auto address_of(const privkey_t& key) -> evmc::address {
        auto ctx = make_secp256k1_context();
        return evm::address_from_privkey(key, ctx).value();
    }

    auto make_address(unsigned char id) -> evmc::address {
        auto addr = evmc::address();
        addr.bytes[sizeof(addr.bytes) - 1] = id;
        return addr;
    }

    void sign_authorization(const privkey_t& payer_key,
                            const facilitator::typed_domain& domain,
                            facilitator::payment_authorization& auth) {
        auto ctx = make_secp256k1_context();
        auto digest = facilitator::transfer_digest(domain, auth);
        auth.m_signature = evm::sign_hash(payer_key, digest, ctx);
    }

    auto make_authorization(const privkey_t& payer_key,
                            const evmc::address& payee,
                            uint64_t value,
                            const facilitator::typed_domain& domain,
                            uint64_t now,
                            unsigned char nonce_seed)
        -> facilitator::payment_authorization {
        auto auth = facilitator::payment_authorization();
        auth.m_from = address_of(payer_key);
        auth.m_to = payee;
        auth.m_value = evmc::uint256be(value);
        auth.m_valid_after = evmc::uint256be(now - 60);
        auth.m_valid_before = evmc::uint256be(now + 3600);
        auth.m_nonce.bytes[0] = nonce_seed;
        auth.m_nonce.bytes[sizeof(auth.m_nonce.bytes) - 1] = nonce_seed;
        sign_authorization(payer_key, domain, auth);
        return auth;
    }

    auto make_payment_body(const std::string& network,
                           const facilitator::payment_authorization& auth)
        -> nlohmann::json {
        return {{"network", network},
                {"authorization",
                 {{"from", evm::to_checksum_address(auth.m_from)},
                  {"to", evm::to_checksum_address(auth.m_to)},
                  {"value", evm::to_decimal(auth.m_value)},
                  {"validAfter", evm::to_decimal(auth.m_valid_after)},
                  {"validBefore", evm::to_decimal(auth.m_valid_before)},
                  {"nonce", "0x" + evm::to_hex(auth.m_nonce)},
                  {"signature", auth.m_signature.to_hex_prefixed()}}}};
    }

    auto make_signed_call(const privkey_t& key,
                          uint64_t chain_id,
                          const evmc::address& to,
                          const buffer& input,
                          uint64_t nonce) -> buffer {
        auto ctx = make_secp256k1_context();
        auto tx = evm::evm_tx();
        tx.m_type = evm::evm_tx_type::legacy;
        tx.m_to = to;
        tx.m_nonce = evmc::uint256be(nonce);
        tx.m_gas_price = evmc::uint256be(1000000000);
        tx.m_gas_limit = evmc::uint256be(100000);
        tx.m_input.assign(input.c_ptr(), input.c_ptr() + input.size());
        tx.m_sig = evm::eth_sign(key,
                                 evm::sig_hash(tx, chain_id),
                                 tx.m_type,
                                 chain_id,
                                 ctx);
        return evm::tx_encode(tx, chain_id);
    }

    fake_chain::fake_chain(chain::chain_config cfg) : m_cfg(std::move(cfg)) {
        m_block_hashes[m_head] = keccak_data("genesis", 7);
    }

    auto fake_chain::config() const -> const chain::chain_config& {
        return m_cfg;
    }

    auto fake_chain::enter(const std::string& method)
        -> std::optional<chain::error> {
        m_calls[method]++;
        auto it = m_failures.find(method);
        if(it == m_failures.end() || it->second.empty()) {
            return std::nullopt;
        }
        auto err = it->second.front();
        it->second.pop_front();
        return err;
    }

    auto fake_chain::mine(const std::string& tag)
        -> std::pair<uint64_t, hash_t> {
        m_head++;
        auto seed = tag + std::to_string(m_head);
        auto hash = keccak_data(seed.data(), seed.size());
        m_block_hashes[m_head] = hash;

        auto due = std::vector<pending_transfer>();
        for(auto it = m_pending.begin(); it != m_pending.end();) {
            if(it->m_due <= m_head) {
                due.push_back(*it);
                it = m_pending.erase(it);
            } else {
                it++;
            }
        }
        for(const auto& p : due) {
            include(p.m_tx_hash, p.m_auth, m_head, hash);
        }
        return {m_head, hash};
    }

    auto fake_chain::include(const hash_t& tx_hash,
                             const facilitator::payment_authorization& auth,
                             uint64_t number,
                             const hash_t& block_hash) -> bool {
        auto value = evm::to_uint64(auth.m_value);
        auto receipt = evm::evm_tx_receipt();
        receipt.m_tx_hash = tx_hash;
        receipt.m_block_number = number;
        receipt.m_block_hash = block_hash;
        receipt.m_success
            = m_used_nonces.count({auth.m_from, auth.m_nonce}) == 0
           && m_balances[auth.m_from] >= value;
        if(receipt.m_success) {
            m_used_nonces.insert({auth.m_from, auth.m_nonce});
            m_balances[auth.m_from] -= value;
            m_balances[auth.m_to] += value;
            m_transfers[tx_hash]
                = mined_transfer{auth.m_from, auth.m_to, value, auth.m_nonce};
        }
        m_receipts[tx_hash] = receipt;
        return receipt.m_success;
    }

    auto fake_chain::balance_of(const evmc::address& owner)
        -> chain::result<evmc::uint256be> {
        std::unique_lock l(m_mut);
        if(auto err = enter("balance_of")) {
            return err.value();
        }
        return evmc::uint256be(m_balances[owner]);
    }

    auto fake_chain::authorization_used(const evmc::address& authorizer,
                                        const evmc::bytes32& nonce)
        -> chain::result<bool> {
        std::unique_lock l(m_mut);
        if(auto err = enter("authorization_used")) {
            return err.value();
        }
        return m_used_nonces.count({authorizer, nonce}) > 0;
    }

    auto
    fake_chain::submit_transfer(const facilitator::payment_authorization& auth)
        -> chain::submission {
        std::unique_lock l(m_mut);
        if(auto err = enter("submit_transfer")) {
            return {std::nullopt, err};
        }
        if(m_used_nonces.count({auth.m_from, auth.m_nonce}) > 0) {
            return {std::nullopt,
                    chain::error{chain::error_kind::reverted,
                                 "FiatTokenV2: authorization is used or "
                                 "canceled"}};
        }
        auto value = evm::to_uint64(auth.m_value);
        if(m_balances[auth.m_from] < value) {
            return {std::nullopt,
                    chain::error{chain::error_kind::reverted,
                                 "ERC20: transfer amount exceeds balance"}};
        }

        m_tx_count++;
        auto seed = "tx" + std::to_string(m_tx_count);
        auto tx_hash = keccak_data(seed.data(), seed.size());
        m_submitted.push_back(tx_hash);
        auto broadcast_err = std::optional<chain::error>();
        if(!m_broadcast_failures.empty()) {
            broadcast_err = m_broadcast_failures.front();
            m_broadcast_failures.pop_front();
        }
        if(m_drop > 0) {
            m_drop--;
            return {tx_hash, broadcast_err};
        }
        if(m_delay_count > 0) {
            m_delay_count--;
            m_pending.push_back(
                pending_transfer{tx_hash, auth, m_head + m_delay_blocks});
            return {tx_hash, broadcast_err};
        }

        auto [number, mined_hash] = mine("block");
        if(include(tx_hash, auth, number, mined_hash) && m_reorg_pending) {
            m_reorg_pending = false;
            m_reorg_tx = tx_hash;
        }
        return {tx_hash, broadcast_err};
    }

    auto fake_chain::get_receipt(const hash_t& tx_hash)
        -> chain::result<std::optional<evm::evm_tx_receipt>> {
        std::unique_lock l(m_mut);
        if(auto err = enter("get_receipt")) {
            return err.value();
        }
        auto it = m_receipts.find(tx_hash);
        if(it == m_receipts.end()) {
            return std::optional<evm::evm_tx_receipt>();
        }
        return std::optional<evm::evm_tx_receipt>(it->second);
    }

    auto fake_chain::block_number() -> chain::result<uint64_t> {
        std::unique_lock l(m_mut);
        if(auto err = enter("block_number")) {
            return err.value();
        }
        mine("empty");
        return m_head;
    }

    auto fake_chain::block_hash(uint64_t number)
        -> chain::result<std::optional<hash_t>> {
        std::unique_lock l(m_mut);
        if(auto err = enter("block_hash")) {
            return err.value();
        }
        if(m_reorg_tx.has_value()) {
            auto rcpt = m_receipts.find(m_reorg_tx.value());
            if(rcpt != m_receipts.end()
               && rcpt->second.m_block_number == number) {
                // Replace the block with one that does not contain the
                // transfer and undo its effects.
                const auto& xfer = m_transfers[m_reorg_tx.value()];
                m_used_nonces.erase({xfer.m_from, xfer.m_nonce});
                m_balances[xfer.m_from] += xfer.m_value;
                m_balances[xfer.m_to] -= xfer.m_value;
                m_transfers.erase(m_reorg_tx.value());
                m_receipts.erase(rcpt);
                auto seed = "uncle" + std::to_string(number);
                m_block_hashes[number] = keccak_data(seed.data(), seed.size());
                m_reorg_tx.reset();
            }
        }
        auto it = m_block_hashes.find(number);
        if(it == m_block_hashes.end()) {
            return std::optional<hash_t>();
        }
        return std::optional<hash_t>(it->second);
    }

    auto fake_chain::find_agent_by_address(const evmc::address& addr)
        -> const agent* {
        for(const auto& a : m_agents) {
            if(a.m_address == addr) {
                return &a;
            }
        }
        return nullptr;
    }

    auto fake_chain::identity_call(const buffer& data)
        -> chain::result<buffer> {
        auto split = evm::abi_split_call(data);
        if(!split.has_value()) {
            return chain::error{chain::error_kind::reverted, "no selector"};
        }
        const auto& [selector, args] = split.value();

        const agent* found = nullptr;
        if(selector == evm::abi_selector("resolveByAddress(address)")) {
            auto vals = evm::abi_decode(args, {evm::abi_type::address});
            if(vals.has_value()) {
                found = find_agent_by_address(vals->front().as_address());
            }
        } else if(selector == evm::abi_selector("resolveByDomain(string)")) {
            auto vals = evm::abi_decode(args, {evm::abi_type::string});
            for(const auto& a : m_agents) {
                if(vals.has_value()
                   && a.m_domain == vals->front().as_string()) {
                    found = &a;
                }
            }
        } else if(selector == evm::abi_selector("getAgent(uint256)")) {
            auto vals = evm::abi_decode(args, {evm::abi_type::uint256});
            for(const auto& a : m_agents) {
                if(vals.has_value()
                   && evmc::uint256be(a.m_id) == vals->front().as_uint()) {
                    found = &a;
                }
            }
        } else {
            return chain::error{chain::error_kind::reverted,
                                "unknown selector"};
        }

        if(found == nullptr) {
            return chain::error{chain::error_kind::reverted,
                                "AgentNotFound"};
        }
        auto ret = evm::abi_encode(
            {evm::abi_value::from_uint(evmc::uint256be(32))});
        ret.append(evm::abi_encode(
            {evm::abi_value::from_uint(evmc::uint256be(found->m_id)),
             evm::abi_value::from_string(found->m_domain),
             evm::abi_value::from_address(found->m_address)}));
        return ret;
    }

    auto fake_chain::reputation_call(const buffer& data,
                                     const std::optional<evmc::address>& from,
                                     bool write) -> chain::result<buffer> {
        auto split = evm::abi_split_call(data);
        if(!split.has_value()) {
            return chain::error{chain::error_kind::reverted, "no selector"};
        }
        const auto& [selector, args] = split.value();

        for(auto dir : {registry::direction::client_to_server,
                        registry::direction::server_to_client,
                        registry::direction::server_to_validator}) {
            auto write_data = registry::reputation_recorder::make_call_data(
                dir,
                evmc::uint256be(),
                0);
            auto write_split = evm::abi_split_call(write_data);
            if(selector == write_split->first) {
                auto vals = evm::abi_decode(
                    args,
                    {evm::abi_type::uint256, evm::abi_type::uint8});
                if(!vals.has_value() || !from.has_value()) {
                    return chain::error{chain::error_kind::reverted,
                                        "bad arguments"};
                }
                const auto* rater = find_agent_by_address(from.value());
                if(rater == nullptr) {
                    return chain::error{chain::error_kind::reverted,
                                        "UnauthorizedFeedback"};
                }
                auto subject = evm::to_uint64((*vals)[0].as_uint());
                auto key = rating_key{dir, rater->m_id, subject};
                if(m_allowed_ratings.count(key) == 0) {
                    return chain::error{chain::error_kind::reverted,
                                        "UnauthorizedFeedback"};
                }
                if(write) {
                    m_ratings[key] = (*vals)[1].as_uint8();
                }
                return buffer();
            }
        }

        struct read_fn {
            const char* m_sig;
            registry::direction m_dir;
            bool m_rater_first;
        };
        static const auto reads = std::vector<read_fn>{
            {"getServerRating(uint256,uint256)",
             registry::direction::client_to_server,
             true},
            {"getClientRating(uint256,uint256)",
             registry::direction::server_to_client,
             false},
            {"getValidatorRating(uint256,uint256)",
             registry::direction::server_to_validator,
             false}};
        for(const auto& fn : reads) {
            if(selector != evm::abi_selector(fn.m_sig)) {
                continue;
            }
            auto vals = evm::abi_decode(
                args,
                {evm::abi_type::uint256, evm::abi_type::uint256});
            if(!vals.has_value()) {
                return chain::error{chain::error_kind::reverted,
                                    "bad arguments"};
            }
            auto first = evm::to_uint64((*vals)[0].as_uint());
            auto second = evm::to_uint64((*vals)[1].as_uint());
            auto key = fn.m_rater_first
                         ? rating_key{fn.m_dir, first, second}
                         : rating_key{fn.m_dir, second, first};
            auto it = m_ratings.find(key);
            auto has = it != m_ratings.end();
            return evm::abi_encode(
                {evm::abi_value::from_bool(has),
                 evm::abi_value::from_uint8(has ? it->second : 0)});
        }
        return chain::error{chain::error_kind::reverted, "unknown selector"};
    }

    auto fake_chain::call(const evmc::address& to,
                          const buffer& data,
                          const std::optional<evmc::address>& from)
        -> chain::result<buffer> {
        std::unique_lock l(m_mut);
        if(auto err = enter("call")) {
            return err.value();
        }
        if(m_cfg.m_identity_registry.has_value()
           && to == m_cfg.m_identity_registry.value()) {
            return identity_call(data);
        }
        if(m_cfg.m_reputation_registry.has_value()
           && to == m_cfg.m_reputation_registry.value()) {
            return reputation_call(data, from, false);
        }
        return chain::error{chain::error_kind::reverted, "no contract"};
    }

    auto fake_chain::send_raw_transaction(const buffer& raw_tx)
        -> chain::result<hash_t> {
        std::unique_lock l(m_mut);
        if(auto err = enter("send_raw_transaction")) {
            return err.value();
        }
        auto tx = evm::tx_decode(raw_tx, m_cfg.m_chain_id);
        if(!tx.has_value()) {
            return chain::error{chain::error_kind::rejected,
                                "rlp: invalid transaction"};
        }
        auto sender
            = evm::check_signature(tx.value(), m_cfg.m_chain_id, m_secp);
        if(!sender.has_value()) {
            return chain::error{chain::error_kind::rejected,
                                "invalid sender"};
        }
        auto tx_hash = keccak_data(raw_tx);
        auto input = buffer();
        input.append(tx->m_input.data(), tx->m_input.size());

        auto receipt = evm::evm_tx_receipt();
        receipt.m_tx_hash = tx_hash;
        receipt.m_success = tx->m_to.has_value()
                         && m_cfg.m_reputation_registry.has_value()
                         && tx->m_to.value()
                                == m_cfg.m_reputation_registry.value()
                         && std::holds_alternative<buffer>(
                                reputation_call(input, sender, true));
        auto [number, mined_hash] = mine("block");
        receipt.m_block_number = number;
        receipt.m_block_hash = mined_hash;
        m_receipts[tx_hash] = receipt;
        return tx_hash;
    }

    void fake_chain::set_balance(const evmc::address& owner, uint64_t amount) {
        std::unique_lock l(m_mut);
        m_balances[owner] = amount;
    }

    auto fake_chain::balance(const evmc::address& owner) -> uint64_t {
        std::unique_lock l(m_mut);
        return m_balances[owner];
    }

    void fake_chain::consume_nonce(const evmc::address& authorizer,
                                   const evmc::bytes32& nonce) {
        std::unique_lock l(m_mut);
        m_used_nonces.insert({authorizer, nonce});
    }

    void fake_chain::register_agent(uint64_t id,
                                    const std::string& domain,
                                    const evmc::address& addr) {
        std::unique_lock l(m_mut);
        m_agents.push_back(agent{id, domain, addr});
    }

    void fake_chain::allow_rating(registry::direction dir,
                                  uint64_t rater_id,
                                  uint64_t subject_id) {
        std::unique_lock l(m_mut);
        m_allowed_ratings.insert({dir, rater_id, subject_id});
    }

    void fake_chain::set_rating(registry::direction dir,
                                uint64_t rater_id,
                                uint64_t subject_id,
                                uint8_t score) {
        std::unique_lock l(m_mut);
        m_ratings[{dir, rater_id, subject_id}] = score;
    }

    void fake_chain::fail_next(const std::string& method,
                               size_t count,
                               chain::error err) {
        std::unique_lock l(m_mut);
        for(size_t i = 0; i < count; i++) {
            m_failures[method].push_back(err);
        }
    }

    void fake_chain::drop_next(size_t count) {
        std::unique_lock l(m_mut);
        m_drop += count;
    }

    void fake_chain::delay_next(size_t count, uint64_t blocks) {
        std::unique_lock l(m_mut);
        m_delay_count += count;
        m_delay_blocks = blocks;
    }

    void fake_chain::fail_broadcast_next(size_t count, chain::error err) {
        std::unique_lock l(m_mut);
        for(size_t i = 0; i < count; i++) {
            m_broadcast_failures.push_back(err);
        }
    }

    auto fake_chain::submitted() -> std::vector<hash_t> {
        std::unique_lock l(m_mut);
        return m_submitted;
    }

    void fake_chain::reorg_next() {
        std::unique_lock l(m_mut);
        m_reorg_pending = true;
    }

    auto fake_chain::calls(const std::string& method) -> size_t {
        std::unique_lock l(m_mut);
        return m_calls[method];
    }

    auto fake_chain::total_calls() -> size_t {
        std::unique_lock l(m_mut);
        auto total = size_t();
        for(const auto& entry : m_calls) {
            total += entry.second;
        }
        return total;
    }

    auto fake_chain::transfers() -> size_t {
        std::unique_lock l(m_mut);
        return m_transfers.size();
    }

    void scripted_rpc_client::expect(const std::string& method,
                                     rpc::call_result reply) {
        std::unique_lock l(m_mut);
        m_replies[method].push_back(std::move(reply));
    }

    auto scripted_rpc_client::call(const std::string& method,
                                   nlohmann::json params)
        -> rpc::call_result {
        std::unique_lock l(m_mut);
        m_requests.emplace_back(method, params);
        auto it = m_replies.find(method);
        if(it == m_replies.end() || it->second.empty()) {
            return rpc::failure{rpc::failure_kind::transport,
                                0,
                                0,
                                "no scripted reply for " + method,
                                ""};
        }
        auto reply = std::move(it->second.front());
        it->second.pop_front();
        return reply;
    }

    auto scripted_rpc_client::requests()
        -> std::vector<std::pair<std::string, nlohmann::json>> {
        std::unique_lock l(m_mut);
        return m_requests;
    }
}
