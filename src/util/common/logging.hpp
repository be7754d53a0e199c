// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_COMMON_LOGGING_H_
#define AGENTPAY_SRC_UTIL_COMMON_LOGGING_H_

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace agentpay::logging {
    /// Log severity levels, in increasing order of severity.
    enum class log_level {
        /// Fine-grained state transitions.
        trace,
        /// Diagnostic information.
        debug,
        /// Normal operation.
        info,
        /// Recoverable problems.
        warn,
        /// Failures the current operation cannot recover from.
        error,
        /// Failures the process cannot recover from.
        fatal
    };

    /// Returns the fixed-width name of a log level.
    /// \param level level to name.
    /// \return level name.
    auto to_string(log_level level) -> std::string;

    /// Parses a log level name (case-insensitive).
    /// \param level name such as "INFO" or "trace".
    /// \return log level, or std::nullopt if the name is unknown.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;

    /// Thread-safe line logger. Each call writes one line prefixed with a
    /// UTC timestamp and the level to stdout and, if provided, a log file.
    class log {
      public:
        /// Constructor.
        /// \param level minimum level to output.
        /// \param use_stdout true if messages should be written to stdout.
        /// \param logfile optional additional output stream.
        explicit log(log_level level,
                     bool use_stdout = true,
                     std::unique_ptr<std::ostream> logfile = nullptr);

        template<typename... Ts>
        void trace(Ts&&... msg) {
            write_log(log_level::trace, std::forward<Ts>(msg)...);
        }

        template<typename... Ts>
        void debug(Ts&&... msg) {
            write_log(log_level::debug, std::forward<Ts>(msg)...);
        }

        template<typename... Ts>
        void info(Ts&&... msg) {
            write_log(log_level::info, std::forward<Ts>(msg)...);
        }

        template<typename... Ts>
        void warn(Ts&&... msg) {
            write_log(log_level::warn, std::forward<Ts>(msg)...);
        }

        template<typename... Ts>
        void error(Ts&&... msg) {
            write_log(log_level::error, std::forward<Ts>(msg)...);
        }

        /// Logs the message and terminates the process.
        template<typename... Ts>
        [[noreturn]] void fatal(Ts&&... msg) {
            write_log(log_level::fatal, std::forward<Ts>(msg)...);
            std::exit(EXIT_FAILURE);
        }

        /// Sets the minimum level to output.
        /// \param level new minimum level.
        void set_loglevel(log_level level);

      private:
        bool m_stdout;
        std::unique_ptr<std::ostream> m_logfile;
        std::atomic<log_level> m_loglevel;
        std::mutex m_stream_mut;

        template<typename... Ts>
        void write_log(log_level level, Ts&&... msg) {
            if(level < m_loglevel) {
                return;
            }
            auto ss = std::stringstream();
            ss << prefix(level);
            ((ss << ' ' << std::forward<Ts>(msg)), ...);
            ss << '\n';
            write_line(ss.str());
        }

        [[nodiscard]] static auto prefix(log_level level) -> std::string;
        void write_line(const std::string& line);
    };
}

#endif
