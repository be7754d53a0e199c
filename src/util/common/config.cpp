// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <limits>

namespace agentpay::network {
    auto parse_ip_port(const std::string& in_str)
        -> std::optional<endpoint_t> {
        auto sep = in_str.rfind(':');
        if(sep == std::string::npos || sep == 0
           || sep == in_str.size() - 1) {
            return std::nullopt;
        }
        auto host = in_str.substr(0, sep);
        auto port_str = in_str.substr(sep + 1);
        auto port = uint64_t{};
        auto [ptr, ec] = std::from_chars(port_str.data(),
                                         port_str.data() + port_str.size(),
                                         port);
        if(ec != std::errc() || ptr != port_str.data() + port_str.size()
           || port > std::numeric_limits<unsigned short>::max()) {
            return std::nullopt;
        }
        return endpoint_t{host, static_cast<unsigned short>(port)};
    }
}

namespace agentpay::config {
    namespace {
        auto trim(const std::string& s) -> std::string {
            const auto* ws = " \t\r\n";
            auto begin = s.find_first_not_of(ws);
            if(begin == std::string::npos) {
                return "";
            }
            auto end = s.find_last_not_of(ws);
            return s.substr(begin, end - begin + 1);
        }
    }

    parser::parser(const std::string& filename) {
        auto file = std::ifstream(filename);
        if(!file.good()) {
            return;
        }
        init(file);
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    void parser::init(std::istream& stream) {
        auto line = std::string();
        size_t line_no{0};
        while(std::getline(stream, line)) {
            line_no++;
            line = trim(line);
            if(line.empty() || line[0] == '#') {
                continue;
            }
            auto eq = line.find('=');
            if(eq == std::string::npos || eq == 0) {
                m_error_line = line_no;
                return;
            }
            auto key = trim(line.substr(0, eq));
            auto value = trim(line.substr(eq + 1));
            if(value.size() >= 2 && value.front() == '"'
               && value.back() == '"') {
                m_opts[key] = value.substr(1, value.size() - 2);
                continue;
            }
            auto v = int64_t{};
            auto [ptr, ec]
                = std::from_chars(value.data(), value.data() + value.size(), v);
            if(ec != std::errc() || ptr != value.data() + value.size()) {
                m_error_line = line_no;
                return;
            }
            m_opts[key] = v;
        }
        m_valid = true;
    }

    auto parser::valid() const -> bool {
        return m_valid;
    }

    auto parser::error_line() const -> std::optional<size_t> {
        return m_error_line;
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        auto it = m_opts.find(key);
        if(it == m_opts.end()
           || !std::holds_alternative<std::string>(it->second)) {
            return std::nullopt;
        }
        return std::get<std::string>(it->second);
    }

    auto parser::get_int(const std::string& key) const
        -> std::optional<int64_t> {
        auto it = m_opts.find(key);
        if(it == m_opts.end() || !std::holds_alternative<int64_t>(it->second)) {
            return std::nullopt;
        }
        return std::get<int64_t>(it->second);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<uint64_t> {
        auto v = get_int(key);
        if(!v.has_value() || v.value() < 0) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(v.value());
    }

    auto parser::get_endpoint(const std::string& key) const
        -> std::optional<network::endpoint_t> {
        auto v = get_string(key);
        if(!v.has_value()) {
            return std::nullopt;
        }
        return network::parse_ip_port(v.value());
    }

    auto get_key(const std::string& prefix, size_t idx, const std::string& name)
        -> std::string {
        return prefix + std::to_string(idx) + "_" + name;
    }
}
