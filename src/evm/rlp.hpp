// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_EVM_RLP_H_
#define AGENTPAY_SRC_EVM_RLP_H_

#include "messages.hpp"
#include "util/common/buffer.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <vector>

namespace agentpay::evm {
    /// Possible types for an RLP value.
    enum class rlp_value_type {
        /// A collection of RLP values.
        array,
        /// A singular RLP value (byte string).
        buffer
    };

    /// A recursive length prefix value: either a byte string or an array of
    /// further RLP values.
    class rlp_value {
      public:
        /// Constructs an empty RLP value of the given type.
        explicit rlp_value(rlp_value_type type = rlp_value_type::buffer);

        /// Constructs a byte string RLP value.
        /// \param data value contents.
        explicit rlp_value(const buffer& data);

        /// Replaces the contents of a byte string value.
        void assign(const buffer& data);

        /// Appends an item to an array value.
        void push_back(const rlp_value& data);

        /// Returns the contents of a byte string value.
        [[nodiscard]] auto value() const -> const buffer&;

        /// Returns the number of items of an array value.
        [[nodiscard]] auto size() const -> size_t;

        /// Returns the item at the given index of an array value.
        [[nodiscard]] auto value_at(size_t index) const -> const rlp_value&;

        [[nodiscard]] auto type() const -> rlp_value_type;

      private:
        rlp_value_type m_type;
        buffer m_buffer{};
        std::vector<rlp_value> m_values{};
    };

    /// Creates a byte string RLP value from a fixed-size evmc type.
    /// \param v value to encode.
    /// \param trim_leading_zeroes true to encode as an integer (strip
    ///                            leading zero bytes).
    /// \return RLP value.
    template<typename T>
    auto make_rlp_value(const T& v, bool trim_leading_zeroes = false)
        -> rlp_value {
        size_t start = 0;
        if(trim_leading_zeroes) {
            while(start < sizeof(v.bytes) && v.bytes[start] == 0) {
                start++;
            }
        }
        auto buf = buffer();
        buf.append(&v.bytes[start], sizeof(v.bytes) - start);
        return rlp_value(buf);
    }

    /// Creates an RLP array from the given values.
    template<typename... Ts>
    auto make_rlp_array(const Ts&... values) -> rlp_value {
        auto ret = rlp_value(rlp_value_type::array);
        (ret.push_back(values), ...);
        return ret;
    }

    /// Encodes an access list as an RLP array.
    auto make_rlp_access_list(const evm_access_list& access_list)
        -> rlp_value;

    /// Parses an RLP access list.
    auto parse_rlp_access_list(const rlp_value& rlp)
        -> std::optional<evm_access_list>;

    /// Serializes an RLP value.
    /// \param v value to serialize.
    /// \return encoded bytes.
    auto rlp_encode(const rlp_value& v) -> buffer;

    /// Deserializes an RLP value. The encoding must be canonical and must
    /// consume the entire input.
    /// \param buf bytes to decode.
    /// \return decoded value or std::nullopt if the input is malformed.
    auto rlp_decode(const buffer& buf) -> std::optional<rlp_value>;

    /// Interprets an RLP byte string as a big-endian 256-bit integer.
    /// \return the value or std::nullopt if it is longer than 32 bytes or
    ///         has leading zero bytes.
    auto rlp_to_uint256(const rlp_value& v) -> std::optional<evmc::uint256be>;

    /// Interprets an RLP byte string as a 20-byte address.
    auto rlp_to_address(const rlp_value& v) -> std::optional<evmc::address>;
}

#endif
