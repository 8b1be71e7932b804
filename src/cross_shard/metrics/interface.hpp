// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_METRICS_INTERFACE_H_
#define SHARDX_SRC_CROSS_SHARD_METRICS_INTERFACE_H_

#include <string>

namespace shardx::cross_shard::metrics {
    /// Fire-and-forget sink for coordinator counters.
    class interface {
      public:
        interface() = default;
        virtual ~interface() = default;

        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Increments the named counter by one.
        /// \param name counter name.
        virtual void increment_counter(const std::string& name) = 0;
    };
}

#endif
