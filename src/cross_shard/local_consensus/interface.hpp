// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_LOCAL_CONSENSUS_INTERFACE_H_
#define SHARDX_SRC_CROSS_SHARD_LOCAL_CONSENSUS_INTERFACE_H_

#include "cross_shard/types.hpp"

#include <optional>

namespace shardx::cross_shard::local_consensus {
    /// Interface to the consensus engine which orders and validates
    /// transactions within a single shard.
    class interface {
      public:
        interface() = default;
        virtual ~interface() = default;

        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Submits a ledger transaction for commitment in the local shard.
        /// May be called more than once for the same transaction.
        /// \param tx transaction to submit.
        /// \return std::nullopt if the transaction was accepted, otherwise
        ///         the error to report to the caller.
        virtual auto submit_transaction(const ledger_transaction& tx)
            -> std::optional<error_code> = 0;
    };
}

#endif
