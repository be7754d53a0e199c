// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_EVM_ABI_H_
#define AGENTPAY_SRC_EVM_ABI_H_

#include "util/common/buffer.hpp"

#include <array>
#include <evmc/evmc.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agentpay::evm {
    /// Size of a function selector in bytes.
    static constexpr size_t selector_size = 4;
    /// Size of an ABI word in bytes.
    static constexpr size_t abi_word_size = 32;

    using selector_t = std::array<uint8_t, selector_size>;

    /// Solidity types understood by the codec.
    enum class abi_type {
        address,
        uint256,
        uint8,
        boolean,
        bytes32,
        string,
        bytes
    };

    /// A single ABI-encoded argument or return value. Static types are held
    /// in a 32-byte word, dynamic types in a byte buffer.
    class abi_value {
      public:
        static auto from_address(const evmc::address& addr) -> abi_value;
        static auto from_uint(const evmc::uint256be& v) -> abi_value;
        static auto from_uint8(uint8_t v) -> abi_value;
        static auto from_bool(bool v) -> abi_value;
        static auto from_bytes32(const evmc::bytes32& v) -> abi_value;
        static auto from_string(const std::string& v) -> abi_value;
        static auto from_bytes(const buffer& v) -> abi_value;

        [[nodiscard]] auto type() const -> abi_type;
        [[nodiscard]] auto is_dynamic() const -> bool;

        [[nodiscard]] auto as_address() const -> evmc::address;
        [[nodiscard]] auto as_uint() const -> evmc::uint256be;
        [[nodiscard]] auto as_uint8() const -> uint8_t;
        [[nodiscard]] auto as_bool() const -> bool;
        [[nodiscard]] auto as_bytes32() const -> evmc::bytes32;
        [[nodiscard]] auto as_string() const -> std::string;
        [[nodiscard]] auto as_bytes() const -> const buffer&;

        /// Returns the 32-byte head word of a static value.
        [[nodiscard]] auto word() const -> const evmc::bytes32&;

      private:
        abi_type m_type{abi_type::uint256};
        evmc::bytes32 m_word{};
        buffer m_dynamic{};
    };

    /// Computes the 4-byte selector of a canonical function signature such
    /// as "transfer(address,uint256)".
    auto abi_selector(const std::string& signature) -> selector_t;

    /// Encodes a list of values as a tuple using head/tail layout.
    auto abi_encode(const std::vector<abi_value>& values) -> buffer;

    /// Encodes a call: selector followed by the encoded arguments.
    /// \param signature canonical function signature.
    /// \param args call arguments.
    /// \return call data.
    auto abi_encode_call(const std::string& signature,
                         const std::vector<abi_value>& args) -> buffer;

    /// Decodes a tuple of the given types starting at the beginning of the
    /// data.
    /// \param data encoded tuple.
    /// \param types expected element types.
    /// \return values or std::nullopt if the data is truncated, offsets
    ///         point outside the data, or a value is out of range for its
    ///         type.
    auto abi_decode(const buffer& data, const std::vector<abi_type>& types)
        -> std::optional<std::vector<abi_value>>;

    /// Decodes a single dynamic tuple return value, which is encoded as an
    /// offset word followed by the tuple.
    auto abi_decode_tuple(const buffer& data,
                          const std::vector<abi_type>& types)
        -> std::optional<std::vector<abi_value>>;

    /// Splits call data into its selector and the encoded arguments.
    /// \return selector and arguments or std::nullopt if the data is
    ///         shorter than a selector.
    auto abi_split_call(const buffer& call_data)
        -> std::optional<std::pair<selector_t, buffer>>;

    /// Decodes the reason string of an Error(string) revert payload.
    /// \return reason or std::nullopt if the payload is not Error(string).
    auto abi_decode_revert(const buffer& data) -> std::optional<std::string>;
}

#endif
