// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace shardx::config {
    namespace {
        auto trim(const std::string& str) -> std::string {
            auto is_space = [](unsigned char c) {
                return std::isspace(c) != 0;
            };
            auto begin = std::find_if_not(str.begin(), str.end(), is_space);
            auto end
                = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
            if(begin >= end) {
                return {};
            }
            return {begin, end};
        }

        auto is_digits(const std::string& str) -> bool {
            return !str.empty()
                && std::all_of(str.begin(), str.end(), [](unsigned char c) {
                       return std::isdigit(c) != 0;
                   });
        }
    }

    parser::parser(const std::string& filename) {
        auto file = std::ifstream(filename);
        if(!file.good()) {
            m_valid = false;
            return;
        }
        init(file);
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    void parser::init(std::istream& stream) {
        auto line = std::string();
        while(std::getline(stream, line)) {
            auto trimmed = trim(line);
            if(trimmed.empty() || trimmed.front() == '#') {
                continue;
            }
            auto eq = trimmed.find('=');
            if(eq == std::string::npos) {
                m_valid = false;
                continue;
            }
            auto key = trim(trimmed.substr(0, eq));
            auto value = trim(trimmed.substr(eq + 1));
            if(key.empty()) {
                m_valid = false;
                continue;
            }
            m_options.insert_or_assign(std::move(key), parse_value(value));
        }
    }

    auto parse_value(const std::string& value) -> parser::value_t {
        if(value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            return value.substr(1, value.size() - 2);
        }
        if(is_digits(value)) {
            try {
                return static_cast<size_t>(std::stoull(value));
            } catch(const std::out_of_range& /* e */) {
                return value;
            }
        }
        auto dot = value.find('.');
        if(dot != std::string::npos
           && value.find('.', dot + 1) == std::string::npos) {
            auto whole = value.substr(0, dot);
            auto frac = value.substr(dot + 1);
            if((whole.empty() || is_digits(whole)) && is_digits(frac)) {
                return std::stod(value);
            }
        }
        return value;
    }

    auto parser::is_valid() const -> bool {
        return m_valid;
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return find_value<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return find_value<size_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        auto str = get_string(key);
        if(!str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(str.value());
    }
}
