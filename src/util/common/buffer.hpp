// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_COMMON_BUFFER_H_
#define AGENTPAY_SRC_UTIL_COMMON_BUFFER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentpay {
    /// Buffer to store and retrieve byte data.
    class buffer {
      public:
        buffer() = default;

        /// Returns the number of bytes contained in the buffer.
        /// \return number of bytes.
        [[nodiscard]] auto size() const -> size_t;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return pointer to the first byte of data.
        [[nodiscard]] auto data() -> void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return pointer to the first byte of data.
        [[nodiscard]] auto data() const -> const void*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return pointer to the first byte of data.
        [[nodiscard]] auto c_ptr() -> uint8_t*;

        /// Returns a raw pointer to the start of the buffer data.
        /// \return pointer to the first byte of data.
        [[nodiscard]] auto c_ptr() const -> const uint8_t*;

        /// Adds the given number of bytes from the given pointer to the end
        /// of the buffer.
        /// \param data pointer to bytes to append.
        /// \param len number of bytes to append.
        void append(const void* data, size_t len);

        /// Appends the contents of another buffer.
        /// \param other buffer to append.
        void append(const buffer& other);

        /// Removes any bytes from the buffer.
        void clear();

        /// Extends the size of the buffer by the given length, filled with
        /// zeroes.
        /// \param len the number of bytes to add.
        void extend(size_t len);

        auto operator==(const buffer& other) const -> bool;
        auto operator!=(const buffer& other) const -> bool;
        auto operator<(const buffer& other) const -> bool;

        /// Returns a hex string representation of the contents of the
        /// buffer.
        /// \return hex string.
        [[nodiscard]] auto to_hex() const -> std::string;

        /// Returns a hex string representation of the contents of the
        /// buffer prefixed with the given prefix.
        /// \param prefix string to prepend, defaults to "0x".
        /// \return prefixed hex string.
        [[nodiscard]] auto to_hex_prefixed(const std::string& prefix
                                           = "0x") const -> std::string;

        /// Creates a new buffer from the provided hex string.
        /// \param hex hex string to parse.
        /// \return buffer, or std::nullopt if the input is not valid hex.
        static auto from_hex(const std::string& hex) -> std::optional<buffer>;

        /// Creates a new buffer from the provided hex string, removing the
        /// given prefix if it is present.
        /// \param hex hex string to parse.
        /// \param prefix prefix to strip, defaults to "0x".
        /// \return buffer, or std::nullopt if the input is not valid hex.
        static auto from_hex_prefixed(const std::string& hex,
                                      const std::string& prefix = "0x")
            -> std::optional<buffer>;

      private:
        std::vector<uint8_t> m_data{};
    };
}

#endif
