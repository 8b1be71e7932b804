// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_STATUS_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_STATUS_H_

#include <cstdint>
#include <optional>
#include <string>

namespace shardx::cross_shard::coordinator {
    /// Status of a cross-shard transaction. Enumerators are listed in
    /// increasing priority order.
    enum class transaction_status : uint8_t {
        /// Created on the source shard, not yet committed locally.
        initialized,
        /// Payload committed by the source shard's local consensus.
        source_committed,
        /// Transmit message handed to the transport.
        transmitted,
        /// Target shard holds the transaction.
        target_received,
        /// Target shard's local consensus finalized the payload.
        target_committed,
        /// Source shard acknowledged the target's commit.
        source_acknowledged,
        /// Both sides confirmed. Terminal.
        completed,
        /// Terminal failure.
        failed,
        /// No progress within the timeout. Terminal.
        timed_out,
        /// Cancelled before reaching the target. Terminal.
        cancelled
    };

    /// Number of transaction_status enumerators.
    static constexpr uint8_t transaction_status_count = 10;

    /// Returns the reconciliation priority of a status. A locally held
    /// status is only replaced by a reported status with a strictly higher
    /// priority.
    /// \param status status to rank.
    /// \return priority, 1 for initialized up to 10 for cancelled.
    auto status_priority(transaction_status status) -> uint8_t;

    /// Indicates whether no further transitions occur from the status.
    /// \param status status to check.
    /// \return true for completed, failed, timed_out and cancelled.
    auto is_terminal(transaction_status status) -> bool;

    /// Returns the name of the status.
    auto to_string(transaction_status status) -> std::string;

    /// Converts a raw wire value into a status.
    /// \param raw underlying value read from the wire.
    /// \return status, or std::nullopt if the value names no status.
    auto status_from_raw(uint8_t raw) -> std::optional<transaction_status>;
}

#endif
