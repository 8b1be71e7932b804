// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_TESTS_UNIT_UTIL_H_
#define SHARDX_TESTS_UNIT_UTIL_H_

#include "cross_shard/coordinator/interface.hpp"
#include "cross_shard/coordinator/messages.hpp"
#include "cross_shard/local_consensus/interface.hpp"
#include "cross_shard/transport/interface.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace shardx::test {
    /// Clock which only moves when told to.
    class manual_clock {
      public:
        manual_clock();

        [[nodiscard]] auto now() const -> cross_shard::timestamp_type;
        void advance(std::chrono::seconds secs);

      private:
        mutable std::mutex m_mut;
        cross_shard::timestamp_type m_now;
    };

    /// Local consensus stand-in which records submissions and can be told
    /// to fail them.
    class scripted_consensus : public cross_shard::local_consensus::interface {
      public:
        auto submit_transaction(const cross_shard::ledger_transaction& tx)
            -> std::optional<cross_shard::error_code> override;

        void set_fail(bool fail);

        /// Runs the callback once, during the next accepted submission and
        /// before it returns.
        void set_on_submit(std::function<void()> callback);

        [[nodiscard]] auto submissions() const -> size_t;
        [[nodiscard]] auto last_submission() const
            -> std::optional<cross_shard::ledger_transaction>;

      private:
        mutable std::mutex m_mut;
        bool m_fail{false};
        std::function<void()> m_on_submit;
        std::vector<cross_shard::ledger_transaction> m_submitted;
    };

    class loopback_network;

    /// Transport endpoint of one shard on a loopback_network.
    class loopback_transport : public cross_shard::transport::interface {
      public:
        explicit loopback_transport(loopback_network& net);

        auto send(const cross_shard::shard_id_type& shard_id, buffer msg)
            -> bool override;

      private:
        loopback_network& m_net;
    };

    /// In-process network which holds sent messages until the test
    /// delivers or drops them.
    class loopback_network {
      public:
        struct packet {
            cross_shard::shard_id_type m_destination;
            buffer m_data;
        };

        /// Returns a transport which sends into this network.
        auto make_transport() -> std::shared_ptr<loopback_transport>;

        /// Routes messages for a shard to the given coordinator.
        void attach(const cross_shard::shard_id_type& shard_id,
                    cross_shard::coordinator::interface* handler);

        /// Makes every following send fail, or succeed again.
        void set_fail_sends(bool fail);

        /// Delivers queued messages, including the replies they cause,
        /// until the network is idle.
        /// \return number of messages delivered.
        auto deliver_all() -> size_t;

        /// Delivers the oldest queued message. Messages to shards which are
        /// not attached are discarded.
        /// \return false if nothing was queued.
        auto deliver_one() -> bool;

        /// Discards every queued message.
        /// \return number of messages discarded.
        auto drop_all() -> size_t;

        /// Returns the queued messages, decoded, oldest first.
        [[nodiscard]] auto peek() const
            -> std::vector<cross_shard::coordinator::rpc::message>;

        [[nodiscard]] auto pending() const -> size_t;

        /// Returns the errors reported by handlers during deliveries.
        [[nodiscard]] auto errors() const
            -> std::vector<cross_shard::error_code>;

        auto enqueue(const cross_shard::shard_id_type& shard_id, buffer msg)
            -> bool;

      private:
        mutable std::mutex m_mut;
        bool m_fail{false};
        std::deque<packet> m_packets;
        std::unordered_map<cross_shard::shard_id_type,
                           cross_shard::coordinator::interface*>
            m_handlers;
        std::vector<cross_shard::error_code> m_errors;
    };

    /// Builds a small ledger transaction for tests.
    auto make_ledger_transaction(const std::string& id)
        -> cross_shard::ledger_transaction;
}

#endif
