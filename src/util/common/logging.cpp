// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace shardx::logging {
    auto parse_loglevel(const std::string& level)
        -> std::optional<log_level> {
        auto upper = level;
        std::transform(upper.begin(),
                       upper.end(),
                       upper.begin(),
                       [](unsigned char c) {
                           return static_cast<char>(std::toupper(c));
                       });
        if(upper == "TRACE") {
            return log_level::trace;
        }
        if(upper == "DEBUG") {
            return log_level::debug;
        }
        if(upper == "INFO") {
            return log_level::info;
        }
        if(upper == "WARN") {
            return log_level::warn;
        }
        if(upper == "ERROR") {
            return log_level::error;
        }
        if(upper == "FATAL") {
            return log_level::fatal;
        }
        return std::nullopt;
    }

    auto to_string(log_level level) -> std::string {
        switch(level) {
            case log_level::trace:
                return "TRACE";
            case log_level::debug:
                return "DEBUG";
            case log_level::info:
                return "INFO ";
            case log_level::warn:
                return "WARN ";
            case log_level::error:
                return "ERROR";
            case log_level::fatal:
                return "FATAL";
        }
        return "?????";
    }

    log::log(log_level level,
             bool use_stdout,
             std::unique_ptr<std::ostream> logfile)
        : m_stdout(use_stdout),
          m_logfile(std::move(logfile)),
          m_loglevel(level) {}

    void log::set_loglevel(log_level level) {
        m_loglevel = level;
    }

    auto log::get_loglevel() const -> log_level {
        return m_loglevel;
    }

    void log::set_stream(std::ostream* stream) {
        std::unique_lock<std::mutex> lck(m_stream_mut);
        m_ostream = stream;
    }

    auto log::timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto secs = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                    % std::chrono::seconds(1);
        auto tm = std::tm();
        gmtime_r(&secs, &tm);
        auto ss = std::stringstream();
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "."
           << std::setfill('0') << std::setw(3) << millis.count();
        return ss.str();
    }
}
