// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_DRIVER_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_DRIVER_H_

#include "impl.hpp"
#include "util/common/blocking_queue.hpp"

#include <condition_variable>
#include <thread>

namespace shardx::cross_shard::coordinator {
    /// Runs a coordinator. Calls process() on a fixed interval from a ticker
    /// thread and handles inbound messages on a separate thread. Inbound
    /// messages which fail are logged and dropped.
    class driver {
      public:
        /// Constructor. Starts the ticker and inbound threads.
        /// \param coordinator coordinator to drive.
        /// \param logger log instance.
        /// \param tick_interval time between two calls to process().
        driver(std::shared_ptr<impl> coordinator,
               std::shared_ptr<logging::log> logger,
               std::chrono::milliseconds tick_interval);

        /// Stops the threads.
        ~driver();

        driver(const driver&) = delete;
        auto operator=(const driver&) -> driver& = delete;
        driver(driver&&) = delete;
        auto operator=(driver&&) -> driver& = delete;

        /// Queues a serialized message received from a peer coordinator.
        /// Called by the transport.
        /// \param pkt serialized message.
        void receive(buffer pkt);

        /// Stops the ticker and inbound threads. Messages still queued are
        /// dropped. Safe to call more than once.
        void stop();

      private:
        std::shared_ptr<impl> m_coordinator;
        std::shared_ptr<logging::log> m_log;
        std::chrono::milliseconds m_tick_interval;

        blocking_queue<buffer> m_inbound;

        std::mutex m_tick_mut;
        std::condition_variable m_tick_cv;
        bool m_running{true};

        std::thread m_tick_thread;
        std::thread m_inbound_thread;
    };
}

#endif
