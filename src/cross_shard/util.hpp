// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_UTIL_H_
#define SHARDX_SRC_CROSS_SHARD_UTIL_H_

#include "cross_shard/shard_registry/interface.hpp"
#include "cross_shard/types.hpp"
#include "util/common/logging.hpp"

#include <chrono>
#include <istream>
#include <string>
#include <variant>
#include <vector>

namespace shardx::cross_shard {
    /// Tunable parameters of a coordinator.
    struct options {
        /// Time without a status change after which a pending transaction
        /// times out.
        std::chrono::seconds m_timeout{300};
        /// Time without a status change after which the retry sweep
        /// re-drives a pending transaction.
        std::chrono::seconds m_retry_interval{30};
        /// Ceiling for the retry count of new transactions.
        uint32_t m_max_retries{5};
        /// Acknowledgements needed to complete new transactions.
        uint32_t m_required_confirmations{2};
        /// Minimum time between two cleanup sweeps.
        std::chrono::seconds m_cleanup_interval{3600};
        /// Time a completed transaction is kept before cleanup removes it.
        std::chrono::seconds m_retention_period{std::chrono::hours(24 * 7)};
        /// Maximum number of IDs drained from each outbound queue per tick.
        size_t m_batch_size{10};
        /// Interval between two driver ticks.
        std::chrono::milliseconds m_tick_interval{5000};
    };

    /// Configuration of a coordinator process.
    struct config {
        /// Shard served by this coordinator.
        shard_id_type m_local_shard_id;
        /// Log level for the coordinator's logger.
        logging::log_level m_loglevel{logging::log_level::info};
        /// Coordinator options.
        options m_options;
        /// Shards known to the registry, including the local shard.
        std::vector<shard_registry::shard_info> m_shards;
    };

    /// Reads the coordinator configuration from a file.
    /// \param config_file path to the configuration file.
    /// \return configuration, or an error message describing the first
    ///         problem found.
    auto read_config(const std::string& config_file)
        -> std::variant<config, std::string>;

    /// Reads the coordinator configuration from a stream.
    /// \param stream stream holding the configuration.
    /// \return configuration, or an error message describing the first
    ///         problem found.
    auto read_config(std::istream& stream)
        -> std::variant<config, std::string>;
}

#endif
