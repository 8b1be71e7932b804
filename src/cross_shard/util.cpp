// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "util/common/config.hpp"

#include <unordered_set>

namespace shardx::cross_shard {
    namespace {
        // Shard IDs may be written as plain numbers, which the parser reads
        // as integers.
        auto get_id(const shardx::config::parser& cfg, const std::string& key)
            -> std::optional<std::string> {
            if(auto str = cfg.get_string(key); str.has_value()) {
                return str;
            }
            if(auto num = cfg.get_ulong(key); num.has_value()) {
                return std::to_string(num.value());
            }
            return std::nullopt;
        }

        auto read_shards(const shardx::config::parser& cfg,
                         std::vector<shard_registry::shard_info>& shards)
            -> std::optional<std::string> {
            auto count = cfg.get_ulong("shard_count").value_or(0);
            auto seen = std::unordered_set<shard_id_type>();
            for(size_t i = 0; i < count; i++) {
                auto prefix = "shard" + std::to_string(i);
                auto id = get_id(cfg, prefix + "_id");
                if(!id.has_value() || id->empty()) {
                    return "Missing " + prefix + "_id";
                }
                if(!seen.insert(id.value()).second) {
                    return "Duplicate shard ID " + id.value();
                }
                auto info = shard_registry::shard_info();
                info.m_id = std::move(id.value());
                info.m_name = cfg.get_string(prefix + "_name")
                                  .value_or(info.m_id);
                info.m_endpoint
                    = cfg.get_string(prefix + "_endpoint").value_or("");
                shards.push_back(std::move(info));
            }
            return std::nullopt;
        }

        auto read_options(const shardx::config::parser& cfg, options& opts)
            -> std::optional<std::string> {
            if(auto v = cfg.get_ulong("timeout_seconds")) {
                opts.m_timeout = std::chrono::seconds(v.value());
            }
            if(auto v = cfg.get_ulong("retry_interval_seconds")) {
                opts.m_retry_interval = std::chrono::seconds(v.value());
            }
            if(auto v = cfg.get_ulong("max_retries")) {
                opts.m_max_retries = static_cast<uint32_t>(v.value());
            }
            if(auto v = cfg.get_ulong("required_confirmations")) {
                if(v.value() == 0) {
                    return "required_confirmations must be positive";
                }
                opts.m_required_confirmations
                    = static_cast<uint32_t>(v.value());
            }
            if(auto v = cfg.get_ulong("cleanup_interval_seconds")) {
                opts.m_cleanup_interval = std::chrono::seconds(v.value());
            }
            if(auto v = cfg.get_ulong("retention_seconds")) {
                opts.m_retention_period = std::chrono::seconds(v.value());
            }
            if(auto v = cfg.get_ulong("batch_size")) {
                if(v.value() == 0) {
                    return "batch_size must be positive";
                }
                opts.m_batch_size = v.value();
            }
            if(auto v = cfg.get_ulong("tick_interval_ms")) {
                if(v.value() == 0) {
                    return "tick_interval_ms must be positive";
                }
                opts.m_tick_interval = std::chrono::milliseconds(v.value());
            }
            return std::nullopt;
        }

        auto parse_config(const shardx::config::parser& cfg)
            -> std::variant<cross_shard::config, std::string> {
            if(!cfg.is_valid()) {
                return "Malformed configuration";
            }

            auto conf = cross_shard::config();
            auto local = get_id(cfg, "local_shard_id");
            if(!local.has_value() || local->empty()) {
                return "Missing local_shard_id";
            }
            conf.m_local_shard_id = std::move(local.value());

            if(auto lvl = cfg.get_string("loglevel"); lvl.has_value()) {
                auto parsed = cfg.get_loglevel("loglevel");
                if(!parsed.has_value()) {
                    return "Unknown loglevel " + lvl.value();
                }
                conf.m_loglevel = parsed.value();
            }

            if(auto err = read_options(cfg, conf.m_options)) {
                return err.value();
            }

            if(auto err = read_shards(cfg, conf.m_shards)) {
                return err.value();
            }

            return conf;
        }
    }

    auto read_config(const std::string& config_file)
        -> std::variant<config, std::string> {
        auto cfg = shardx::config::parser(config_file);
        return parse_config(cfg);
    }

    auto read_config(std::istream& stream)
        -> std::variant<config, std::string> {
        auto cfg = shardx::config::parser(stream);
        return parse_config(cfg);
    }
}
