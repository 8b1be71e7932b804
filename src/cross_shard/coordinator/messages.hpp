// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_MESSAGES_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_MESSAGES_H_

#include "cross_shard/types.hpp"
#include "status.hpp"

#include <variant>

namespace shardx::cross_shard::coordinator::rpc {
    /// Source asks the target to take the transaction.
    struct transaction_transmit {
        /// Cross-shard transaction ID.
        transaction_id_type m_transaction_id;
        /// Source shard of the transaction.
        shard_id_type m_source_shard_id;
        /// Target shard of the transaction.
        shard_id_type m_target_shard_id;
        /// Ledger transaction to apply on the target.
        ledger_transaction m_transaction;
    };

    /// Target reports it holds the transaction.
    struct transaction_received {
        transaction_id_type m_transaction_id;
        shard_id_type m_source_shard_id;
        shard_id_type m_target_shard_id;
    };

    /// Target reports its local consensus finalized the transaction.
    struct transaction_commit {
        transaction_id_type m_transaction_id;
        shard_id_type m_source_shard_id;
        shard_id_type m_target_shard_id;
        /// Ledger status reported by the target's local consensus.
        ledger_status m_status{ledger_status::pending};
    };

    /// One side acknowledges the other's commit.
    struct transaction_acknowledge {
        transaction_id_type m_transaction_id;
        shard_id_type m_source_shard_id;
        shard_id_type m_target_shard_id;
    };

    /// Asks the peer for its view of the transaction's status.
    struct transaction_status_query {
        transaction_id_type m_transaction_id;
        shard_id_type m_source_shard_id;
        shard_id_type m_target_shard_id;
    };

    /// Reply to a status query.
    struct transaction_status_response {
        transaction_id_type m_transaction_id;
        shard_id_type m_source_shard_id;
        shard_id_type m_target_shard_id;
        /// Status held by the responding coordinator.
        transaction_status m_status{transaction_status::initialized};
    };

    /// Message exchanged between shard coordinators. The alternative index
    /// is the wire tag, so new kinds must only be appended.
    using message = std::variant<transaction_transmit,
                                 transaction_received,
                                 transaction_commit,
                                 transaction_acknowledge,
                                 transaction_status_query,
                                 transaction_status_response>;
}

#endif
