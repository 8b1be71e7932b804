// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_TRANSPORT_INTERFACE_H_
#define SHARDX_SRC_CROSS_SHARD_TRANSPORT_INTERFACE_H_

#include "cross_shard/types.hpp"

namespace shardx::cross_shard::transport {
    /// Interface to the network layer which carries serialized coordinator
    /// messages between shard processes.
    class interface {
      public:
        interface() = default;
        virtual ~interface() = default;

        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Sends a message to the coordinator of the given shard. Delivery
        /// is best-effort and at most once per call.
        /// \param shard_id destination shard.
        /// \param msg serialized message.
        /// \return true if the message was handed to the network.
        virtual auto send(const shard_id_type& shard_id, buffer msg)
            -> bool = 0;
    };
}

#endif
