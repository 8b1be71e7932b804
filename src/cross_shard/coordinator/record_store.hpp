// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_RECORD_STORE_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_RECORD_STORE_H_

#include "transaction.hpp"

#include <unordered_map>

namespace shardx::cross_shard::coordinator {
    /// Holds the pending and completed cross-shard transactions of one
    /// coordinator. A transaction ID is present in at most one of the two
    /// maps. Not thread-safe; callers provide synchronization.
    class record_store {
      public:
        using map_type
            = std::unordered_map<transaction_id_type, cross_shard_transaction>;

        /// Adds a record to the pending map.
        /// \param tx record to add.
        /// \return false if the ID is already pending or completed.
        auto insert_pending(cross_shard_transaction tx) -> bool;

        /// Returns the pending record with the given ID.
        /// \return pointer to the record, or nullptr if it is not pending.
        auto find_pending(const transaction_id_type& id)
            -> cross_shard_transaction*;

        /// Returns the completed record with the given ID.
        /// \return pointer to the record, or nullptr if it is not completed.
        [[nodiscard]] auto find_completed(const transaction_id_type& id) const
            -> const cross_shard_transaction*;

        /// Returns the record with the given ID, checking the pending map
        /// first.
        [[nodiscard]] auto find(const transaction_id_type& id) const
            -> const cross_shard_transaction*;

        /// Indicates whether the ID is known in either map.
        [[nodiscard]] auto contains(const transaction_id_type& id) const
            -> bool;

        /// Moves a pending record into the completed map.
        /// \param id ID of the record to move.
        /// \return false if the record was not pending.
        auto complete(const transaction_id_type& id) -> bool;

        /// Removes completed records which reached their terminal status
        /// before the cutoff.
        /// \param cutoff records with completed_at strictly earlier are
        ///               removed.
        /// \return number of records removed.
        auto purge_completed_before(timestamp_type cutoff) -> size_t;

        /// Returns the pending records.
        [[nodiscard]] auto pending() const -> const map_type&;

        /// Returns the pending records for in-place updates by the sweeps.
        auto pending() -> map_type&;

        /// Returns the completed records.
        [[nodiscard]] auto completed() const -> const map_type&;

      private:
        map_type m_pending;
        map_type m_completed;
    };
}

#endif
