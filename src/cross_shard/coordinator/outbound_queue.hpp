// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_OUTBOUND_QUEUE_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_OUTBOUND_QUEUE_H_

#include "cross_shard/types.hpp"

#include <deque>
#include <optional>
#include <unordered_set>

namespace shardx::cross_shard::coordinator {
    /// FIFO of transaction IDs awaiting an outbound send. An ID is held at
    /// most once. Not thread-safe; callers provide synchronization.
    class outbound_queue {
      public:
        /// Appends an ID to the back of the queue.
        /// \return false if the ID was already queued.
        auto push_back(const transaction_id_type& id) -> bool;

        /// Puts an ID at the front of the queue, e.g. after a failed send.
        /// \return false if the ID was already queued.
        auto push_front(const transaction_id_type& id) -> bool;

        /// Removes and returns the ID at the front of the queue.
        /// \return the ID, or std::nullopt if the queue is empty.
        auto pop_front() -> std::optional<transaction_id_type>;

        /// Removes an ID from anywhere in the queue.
        /// \return false if the ID was not queued.
        auto erase(const transaction_id_type& id) -> bool;

        [[nodiscard]] auto contains(const transaction_id_type& id) const
            -> bool;
        [[nodiscard]] auto size() const -> size_t;
        [[nodiscard]] auto empty() const -> bool;

      private:
        std::deque<transaction_id_type> m_queue;
        std::unordered_set<transaction_id_type> m_queued;
    };
}

#endif
