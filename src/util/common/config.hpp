// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_COMMON_CONFIG_H_
#define SHARDX_SRC_COMMON_CONFIG_H_

#include "logging.hpp"

#include <istream>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace shardx::config {
    /// Reads configuration parameters line-by-line from a file or stream.
    /// Each non-empty line not starting with '#' must have the form
    /// key=value. Quoted values are strings, values containing a '.' are
    /// decimals, other numeric values are unsigned integers. Unquoted
    /// non-numeric values are kept as strings.
    class parser {
      public:
        /// Type of a parsed configuration value.
        using value_t = std::variant<std::string, size_t, double>;

        /// Constructor. Parses the configuration file at the given path.
        /// \param filename path to the configuration file.
        explicit parser(const std::string& filename);

        /// Constructor. Parses the configuration from the given stream.
        /// \param stream input stream holding the configuration.
        explicit parser(std::istream& stream);

        /// Indicates whether the source was readable and every line was
        /// well-formed.
        /// \return true if the configuration parsed without errors.
        [[nodiscard]] auto is_valid() const -> bool;

        /// Returns the string value for the given key.
        /// \param key key to look up.
        /// \return value, or std::nullopt if the key is missing or its value
        ///         is not a string.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Returns the unsigned integer value for the given key.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// Returns the log level for the given key.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

      private:
        void init(std::istream& stream);

        template<typename T>
        [[nodiscard]] auto find_value(const std::string& key) const
            -> std::optional<T> {
            auto it = m_options.find(key);
            if(it == m_options.end()) {
                return std::nullopt;
            }
            if(!std::holds_alternative<T>(it->second)) {
                return std::nullopt;
            }
            return std::get<T>(it->second);
        }

        std::map<std::string, value_t> m_options;
        bool m_valid{true};
    };

    /// Parses a single configuration value.
    /// \param value text to the right of '=' with whitespace trimmed.
    /// \return typed value.
    auto parse_value(const std::string& value) -> parser::value_t;
}

#endif
