// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_COMMON_LOGGING_H_
#define SHARDX_SRC_COMMON_LOGGING_H_

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace shardx::logging {
    /// Available logging levels, ordered by increasing severity.
    enum class log_level {
        /// Fine-grained, fully verbose operating information.
        trace,
        /// Diagnostic information.
        debug,
        /// General information about the state of the system.
        info,
        /// Potentially unintended, unexpected, or undesirable behavior.
        warn,
        /// Serious, critical errors.
        error,
        /// Only used for errors that cause the process to exit.
        fatal
    };

    /// Parses a log level from its lowercase or uppercase name.
    /// \param level name of the level, e.g. "info" or "WARN".
    /// \return log level, or std::nullopt if the name is not a level.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;

    /// Returns the uppercase name of a log level.
    auto to_string(log_level level) -> std::string;

    /// Generalized logging class. Writes space-separated arguments prefixed
    /// with a timestamp and the level to stdout and, optionally, a file.
    /// Safe to use from multiple threads.
    class log {
      public:
        /// Creates a new log instance.
        /// \param level minimum level at which messages are written.
        /// \param use_stdout true if messages should be written to stdout.
        /// \param logfile optional additional destination for messages.
        explicit log(log_level level,
                     bool use_stdout = true,
                     std::unique_ptr<std::ostream> logfile = nullptr);

        template<typename... Targs>
        void trace(Targs&&... args) {
            write_log(log_level::trace, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void debug(Targs&&... args) {
            write_log(log_level::debug, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void info(Targs&&... args) {
            write_log(log_level::info, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void warn(Targs&&... args) {
            write_log(log_level::warn, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void error(Targs&&... args) {
            write_log(log_level::error, std::forward<Targs>(args)...);
        }

        /// Writes the message then terminates the process.
        template<typename... Targs>
        [[noreturn]] void fatal(Targs&&... args) {
            write_log(log_level::fatal, std::forward<Targs>(args)...);
            std::exit(EXIT_FAILURE);
        }

        /// Changes the minimum level at which messages are written.
        void set_loglevel(log_level level);

        /// Returns the current minimum level.
        [[nodiscard]] auto get_loglevel() const -> log_level;

        /// Redirects the stdout destination to the given stream. Used by
        /// tests to capture output.
        /// \param stream destination stream. Must outlive the log.
        void set_stream(std::ostream* stream);

      private:
        template<typename... Targs>
        void write_log(log_level level, Targs&&... args) {
            if(level < m_loglevel.load()) {
                return;
            }
            auto ss = std::stringstream();
            ss << timestamp() << " [" << to_string(level) << "]";
            ((ss << " " << std::forward<Targs>(args)), ...);
            ss << "\n";
            auto line = ss.str();

            std::unique_lock<std::mutex> lck(m_stream_mut);
            if(m_stdout) {
                *m_ostream << line << std::flush;
            }
            if(m_logfile) {
                *m_logfile << line << std::flush;
            }
        }

        static auto timestamp() -> std::string;

        bool m_stdout;
        std::ostream* m_ostream{&std::cout};
        std::unique_ptr<std::ostream> m_logfile;
        std::atomic<log_level> m_loglevel;
        std::mutex m_stream_mut;
    };
}

#endif
