// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_COMMON_CONFIG_H_
#define AGENTPAY_SRC_UTIL_COMMON_CONFIG_H_

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace agentpay::network {
    /// [host name, port number].
    using endpoint_t = std::pair<std::string, unsigned short>;

    /// Parses a "host:port" string.
    /// \param in_str string to parse.
    /// \return endpoint, or std::nullopt if the string is malformed.
    auto parse_ip_port(const std::string& in_str)
        -> std::optional<endpoint_t>;
}

namespace agentpay::config {
    /// Reads configuration parameters line-by-line from a file or stream.
    /// Lines are of the form key=value. String values are double-quoted,
    /// integer values are bare. Blank lines and lines starting with # are
    /// ignored.
    class parser {
      public:
        /// Value held by a configuration key.
        using value_t = std::variant<std::string, int64_t>;

        /// Constructor.
        /// \param filename path to the configuration file.
        explicit parser(const std::string& filename);

        /// Constructor.
        /// \param stream stream to read the configuration from.
        explicit parser(std::istream& stream);

        /// Returns true if the file or stream could be read and every
        /// non-comment line was well formed.
        [[nodiscard]] auto valid() const -> bool;

        /// Returns the line number of the first malformed line, if any.
        [[nodiscard]] auto error_line() const -> std::optional<size_t>;

        /// Returns the string value for the given key.
        /// \param key configuration key.
        /// \return value, or std::nullopt if the key is missing or is not a
        ///         string.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Returns the signed integer value for the given key.
        /// \param key configuration key.
        /// \return value, or std::nullopt if the key is missing or is not an
        ///         integer.
        [[nodiscard]] auto get_int(const std::string& key) const
            -> std::optional<int64_t>;

        /// Returns the unsigned integer value for the given key.
        /// \param key configuration key.
        /// \return value, or std::nullopt if the key is missing, is not an
        ///         integer or is negative.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<uint64_t>;

        /// Returns the endpoint value for the given key.
        /// \param key configuration key.
        /// \return endpoint, or std::nullopt if the key is missing or
        ///         malformed.
        [[nodiscard]] auto get_endpoint(const std::string& key) const
            -> std::optional<network::endpoint_t>;

      private:
        std::map<std::string, value_t> m_opts;
        bool m_valid{false};
        std::optional<size_t> m_error_line;

        void init(std::istream& stream);
    };

    /// Returns key prefixed with the indexed name, e.g. network3_chain_id.
    /// \param prefix key prefix such as "network".
    /// \param idx index of the item.
    /// \param name key suffix such as "chain_id".
    /// \return combined key.
    auto get_key(const std::string& prefix, size_t idx, const std::string& name)
        -> std::string;
}

#endif
