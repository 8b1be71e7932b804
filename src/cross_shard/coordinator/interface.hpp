// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_INTERFACE_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_INTERFACE_H_

#include "cross_shard/types.hpp"
#include "status.hpp"

#include <optional>

namespace shardx::cross_shard::coordinator {
    /// Inbound side of the cross-shard protocol. Each method handles one
    /// kind of message from a peer coordinator. Handlers are idempotent:
    /// re-delivering a message leaves the transaction in the same state as
    /// delivering it once.
    class interface {
      public:
        interface() = default;
        virtual ~interface() = default;

        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Takes a transaction transmitted by its source shard. A
        /// transaction ID which is already known is not created again.
        /// \param id cross-shard transaction ID.
        /// \param payload ledger transaction to apply locally.
        /// \param source_shard_id shard which created the transaction.
        /// \param target_shard_id shard the transaction was sent to.
        /// \return std::nullopt on success, or the reason the transaction
        ///         was refused.
        virtual auto receive_transaction(const transaction_id_type& id,
                                         ledger_transaction payload,
                                         const shard_id_type& source_shard_id,
                                         const shard_id_type& target_shard_id)
            -> std::optional<error_code> = 0;

        /// Handles the target's confirmation that it holds the transaction.
        /// \param id cross-shard transaction ID.
        /// \param source_shard_id source shard named by the message.
        /// \param target_shard_id target shard named by the message.
        /// \return std::nullopt on success or if the message was stale.
        virtual auto on_received_ack(const transaction_id_type& id,
                                     const shard_id_type& source_shard_id,
                                     const shard_id_type& target_shard_id)
            -> std::optional<error_code> = 0;

        /// Handles a commit report. On the target shard this is raised by
        /// local consensus, on the source shard by the target's message.
        /// \param id cross-shard transaction ID.
        /// \param source_shard_id source shard named by the message.
        /// \param target_shard_id target shard named by the message.
        /// \param status ledger status reported by the target's consensus.
        /// \return std::nullopt on success or if the message was stale.
        virtual auto on_commit(const transaction_id_type& id,
                               const shard_id_type& source_shard_id,
                               const shard_id_type& target_shard_id,
                               ledger_status status)
            -> std::optional<error_code> = 0;

        /// Handles the peer's acknowledgement of a commit.
        /// \param id cross-shard transaction ID.
        /// \param source_shard_id source shard named by the message.
        /// \param target_shard_id target shard named by the message.
        /// \return std::nullopt on success or if the message was stale.
        virtual auto on_acknowledge(const transaction_id_type& id,
                                    const shard_id_type& source_shard_id,
                                    const shard_id_type& target_shard_id)
            -> std::optional<error_code> = 0;

        /// Replies to the peer with the locally known status.
        /// \param id cross-shard transaction ID.
        /// \param source_shard_id source shard named by the message.
        /// \param target_shard_id target shard named by the message.
        /// \return std::nullopt if the reply was sent.
        virtual auto on_status_query(const transaction_id_type& id,
                                     const shard_id_type& source_shard_id,
                                     const shard_id_type& target_shard_id)
            -> std::optional<error_code> = 0;

        /// Merges the status reported by the peer into the local record.
        /// The local status never moves backwards.
        /// \param id cross-shard transaction ID.
        /// \param source_shard_id source shard named by the message.
        /// \param target_shard_id target shard named by the message.
        /// \param status status held by the peer.
        /// \return std::nullopt on success or if the report was stale.
        virtual auto on_status_response(const transaction_id_type& id,
                                        const shard_id_type& source_shard_id,
                                        const shard_id_type& target_shard_id,
                                        transaction_status status)
            -> std::optional<error_code> = 0;
    };
}

#endif
