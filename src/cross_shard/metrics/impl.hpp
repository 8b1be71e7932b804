// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_METRICS_IMPL_H_
#define SHARDX_SRC_CROSS_SHARD_METRICS_IMPL_H_

#include "interface.hpp"

#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace shardx::cross_shard::metrics {
    /// Metrics sink which keeps counters in memory.
    class impl : public interface {
      public:
        void increment_counter(const std::string& name) override;

        /// Returns the current value of a counter.
        /// \param name counter name.
        /// \return counter value, zero if it was never incremented.
        [[nodiscard]] auto get_counter(const std::string& name) const
            -> uint64_t;

      private:
        mutable std::mutex m_mut;
        std::unordered_map<std::string, uint64_t> m_counters;
    };
}

#endif
