// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_TYPES_H_
#define SHARDX_SRC_CROSS_SHARD_TYPES_H_

#include "util/common/buffer.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace shardx::cross_shard {
    /// Identifier of a shard partition.
    using shard_id_type = std::string;
    /// Identifier of a cross-shard transaction.
    using transaction_id_type = std::string;
    /// Wall-clock time point used for record timestamps.
    using timestamp_type = std::chrono::system_clock::time_point;

    /// Error codes reported by the coordinator and its collaborators.
    enum class error_code : uint8_t {
        /// Unknown transaction ID or shard ID.
        not_found,
        /// Shard ID mismatch, self-targeted transaction or malformed
        /// request.
        invalid_input,
        /// Operation not permitted from the transaction's current status.
        invalid_state,
        /// Malformed wire message.
        serialization_error,
        /// Local consensus rejected or failed to accept the payload.
        consensus_failure,
        /// Transport failed to hand the message to the peer shard.
        transport_failure
    };

    /// Returns a human-readable name for the error code.
    auto to_string(error_code ec) -> std::string;

    /// Ledger-level status of the relayed transaction.
    enum class ledger_status : uint8_t {
        /// Not yet finalized.
        pending,
        /// Finalized by local consensus.
        confirmed,
        /// Rejected by local consensus.
        rejected
    };

    /// Ledger transaction relayed between shards. Opaque to the coordinator
    /// except for re-submission to local consensus and its status field.
    struct ledger_transaction {
        /// Ledger transaction ID.
        std::string m_id;
        /// IDs of the transactions this one references.
        std::vector<std::string> m_parent_ids;
        /// Creation time in milliseconds since the epoch.
        uint64_t m_timestamp{};
        /// Application payload, e.g. transfer details.
        buffer m_payload;
        /// Signature over the payload.
        buffer m_signature;
        /// Ledger status of the transaction.
        ledger_status m_status{ledger_status::pending};

        auto operator==(const ledger_transaction& rhs) const -> bool;
    };
}

#endif
