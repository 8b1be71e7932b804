// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_TRANSACTION_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_TRANSACTION_H_

#include "cross_shard/types.hpp"
#include "status.hpp"

#include <map>
#include <optional>

namespace shardx::cross_shard::coordinator {
    /// Coordinator-side record of a transaction moving between two shards.
    /// Each coordinator holds its own copy; the copies converge through the
    /// message protocol.
    struct cross_shard_transaction {
        /// Unique transaction ID. Immutable once created.
        transaction_id_type m_id;
        /// Relayed ledger transaction.
        ledger_transaction m_payload;
        /// Shard which created the transaction.
        shard_id_type m_source_shard_id;
        /// Shard receiving the transaction. Never equal to the source.
        shard_id_type m_target_shard_id;
        /// Current status.
        transaction_status m_status{transaction_status::initialized};
        /// Time the record was created on this coordinator.
        timestamp_type m_created_at{};
        /// Time of the last status change.
        timestamp_type m_updated_at{};
        /// Time the record reached a terminal status.
        std::optional<timestamp_type> m_completed_at;
        /// Acknowledgements recorded so far.
        uint32_t m_confirmations{0};
        /// Acknowledgements needed to complete.
        uint32_t m_required_confirmations{0};
        /// Retries performed by the retry sweep.
        uint32_t m_retry_count{0};
        /// Ceiling for m_retry_count.
        uint32_t m_max_retries{0};
        /// Diagnostic annotations, e.g. the status a transaction timed out
        /// in or held before adopting a status reported by the peer.
        std::map<std::string, std::string> m_metadata;
    };
}

#endif
