// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_TESTS_UTIL_H_
#define AGENTPAY_TESTS_UTIL_H_

#include "chain/interface.hpp"
#include "evm/messages.hpp"
#include "facilitator/messages.hpp"
#include "registry/reputation.hpp"
#include "util/common/keys.hpp"
#include "util/rpc/http/json_rpc_client.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace agentpay::test {
    /// Builds a network configuration with fast block times.
    auto make_chain_config(const std::string& network, uint64_t chain_id)
        -> chain::chain_config;

    /// Returns a private key whose bytes are all equal to seed.
    auto make_key(unsigned char seed) -> privkey_t;

    /// Returns the address controlled by a key.
    auto address_of(const privkey_t& key) -> evmc::address;

    /// Returns an address whose last byte is id.
    auto make_address(unsigned char id) -> evmc::address;

    /// Builds an authorization of value from the key's address to payee,
    /// valid from now - 60 until now + 3600, and signs it for domain.
    auto make_authorization(const privkey_t& payer_key,
                            const evmc::address& payee,
                            uint64_t value,
                            const facilitator::typed_domain& domain,
                            uint64_t now,
                            unsigned char nonce_seed)
        -> facilitator::payment_authorization;

    /// Re-signs an authorization for a domain after its fields changed.
    void sign_authorization(const privkey_t& payer_key,
                            const facilitator::typed_domain& domain,
                            facilitator::payment_authorization& auth);

    /// Builds the JSON body of a /verify or /settle request with the
    /// signature as a single hex string.
    auto make_payment_body(const std::string& network,
                           const facilitator::payment_authorization& auth)
        -> nlohmann::json;

    /// Signs a legacy EIP-155 transaction calling a contract.
    auto make_signed_call(const privkey_t& key,
                          uint64_t chain_id,
                          const evmc::address& to,
                          const buffer& input,
                          uint64_t nonce) -> buffer;

    /// In-memory ledger implementing the chain adapter. Models the token
    /// contract's balances and authorization state, an identity registry
    /// and a reputation registry. Transactions are mined into a new block
    /// as soon as they are submitted and every block_number() call
    /// advances the head by one block.
    class fake_chain : public chain::interface {
      public:
        explicit fake_chain(chain::chain_config cfg);

        [[nodiscard]] auto config() const
            -> const chain::chain_config& override;
        auto balance_of(const evmc::address& owner)
            -> chain::result<evmc::uint256be> override;
        auto authorization_used(const evmc::address& authorizer,
                                const evmc::bytes32& nonce)
            -> chain::result<bool> override;
        auto submit_transfer(const facilitator::payment_authorization& auth)
            -> chain::submission override;
        auto get_receipt(const hash_t& tx_hash)
            -> chain::result<std::optional<evm::evm_tx_receipt>> override;
        auto block_number() -> chain::result<uint64_t> override;
        auto block_hash(uint64_t number)
            -> chain::result<std::optional<hash_t>> override;
        auto call(const evmc::address& to,
                  const buffer& data,
                  const std::optional<evmc::address>& from)
            -> chain::result<buffer> override;
        auto send_raw_transaction(const buffer& raw_tx)
            -> chain::result<hash_t> override;

        void set_balance(const evmc::address& owner, uint64_t amount);
        [[nodiscard]] auto balance(const evmc::address& owner) -> uint64_t;

        /// Consumes a nonce as if another party settled it.
        void consume_nonce(const evmc::address& authorizer,
                           const evmc::bytes32& nonce);

        void register_agent(uint64_t id,
                            const std::string& domain,
                            const evmc::address& addr);

        /// Lets rater_id rate subject_id in a direction, as the registry
        /// does once the two agents have transacted.
        void allow_rating(registry::direction dir,
                          uint64_t rater_id,
                          uint64_t subject_id);

        /// Stores a rating directly.
        void set_rating(registry::direction dir,
                        uint64_t rater_id,
                        uint64_t subject_id,
                        uint8_t score);

        /// Makes the next count calls of a method fail with err. Methods
        /// are named after the interface functions.
        void fail_next(const std::string& method,
                       size_t count,
                       chain::error err);

        /// The next count submissions are signed but never mined.
        void drop_next(size_t count);

        /// The next count submissions stay in the mempool until blocks
        /// more blocks are mined. A transfer whose nonce was consumed in
        /// the meantime is mined with a failed receipt.
        void delay_next(size_t count, uint64_t blocks);

        /// The next count submissions reach the ledger but report err to
        /// the caller together with their hash.
        void fail_broadcast_next(size_t count, chain::error err);

        /// The next mined transfer is reorganized out of its block the
        /// first time that block's hash is queried.
        void reorg_next();

        /// Returns the hashes of all signed transfers in submission order.
        [[nodiscard]] auto submitted() -> std::vector<hash_t>;

        /// Returns how often a method was called.
        [[nodiscard]] auto calls(const std::string& method) -> size_t;

        /// Returns the total number of calls to any method.
        [[nodiscard]] auto total_calls() -> size_t;

        /// Returns the number of transfers currently mined.
        [[nodiscard]] auto transfers() -> size_t;

      private:
        using rating_key = std::tuple<registry::direction, uint64_t, uint64_t>;

        struct agent {
            uint64_t m_id{};
            std::string m_domain;
            evmc::address m_address{};
        };

        struct mined_transfer {
            evmc::address m_from{};
            evmc::address m_to{};
            uint64_t m_value{};
            evmc::bytes32 m_nonce{};
        };

        struct pending_transfer {
            hash_t m_tx_hash{};
            facilitator::payment_authorization m_auth;
            uint64_t m_due{};
        };

        chain::chain_config m_cfg;
        std::mutex m_mut;

        std::map<evmc::address, uint64_t> m_balances;
        std::set<std::pair<evmc::address, evmc::bytes32>> m_used_nonces;
        std::vector<agent> m_agents;
        std::set<rating_key> m_allowed_ratings;
        std::map<rating_key, uint8_t> m_ratings;

        uint64_t m_head{1};
        uint64_t m_tx_count{};
        std::map<uint64_t, hash_t> m_block_hashes;
        std::map<hash_t, evm::evm_tx_receipt> m_receipts;
        std::map<hash_t, mined_transfer> m_transfers;

        std::map<std::string, std::deque<chain::error>> m_failures;
        std::map<std::string, size_t> m_calls;
        size_t m_drop{};
        size_t m_delay_count{};
        uint64_t m_delay_blocks{};
        std::vector<pending_transfer> m_pending;
        std::deque<chain::error> m_broadcast_failures;
        std::vector<hash_t> m_submitted;
        bool m_reorg_pending{false};
        std::optional<hash_t> m_reorg_tx;
        secp256k1_context_ptr m_secp{make_secp256k1_context()};

        auto enter(const std::string& method) -> std::optional<chain::error>;
        auto mine(const std::string& tag) -> std::pair<uint64_t, hash_t>;
        auto include(const hash_t& tx_hash,
                     const facilitator::payment_authorization& auth,
                     uint64_t number,
                     const hash_t& block_hash) -> bool;
        auto find_agent_by_address(const evmc::address& addr)
            -> const agent*;
        auto identity_call(const buffer& data) -> chain::result<buffer>;
        auto reputation_call(const buffer& data,
                             const std::optional<evmc::address>& from,
                             bool write) -> chain::result<buffer>;
    };

    /// JSON-RPC client replaying scripted replies per method.
    class scripted_rpc_client : public rpc::json_rpc_client {
      public:
        /// Queues a reply for the next call of method.
        void expect(const std::string& method, rpc::call_result reply);

        auto call(const std::string& method, nlohmann::json params)
            -> rpc::call_result override;

        /// Methods and parameters of all calls in order.
        [[nodiscard]] auto requests()
            -> std::vector<std::pair<std::string, nlohmann::json>>;

      private:
        std::mutex m_mut;
        std::map<std::string, std::deque<rpc::call_result>> m_replies;
        std::vector<std::pair<std::string, nlohmann::json>> m_requests;
    };
}

#endif
