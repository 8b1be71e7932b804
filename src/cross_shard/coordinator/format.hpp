// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_FORMAT_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_FORMAT_H_

#include "messages.hpp"
#include "util/serialization/serializer.hpp"

namespace shardx {
    auto operator>>(serializer& deser, cross_shard::ledger_status& s)
        -> serializer&;

    auto operator<<(serializer& ser, const cross_shard::ledger_transaction& tx)
        -> serializer&;
    auto operator>>(serializer& deser, cross_shard::ledger_transaction& tx)
        -> serializer&;

    auto operator>>(serializer& deser,
                    cross_shard::coordinator::transaction_status& s)
        -> serializer&;

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_transmit& msg)
        -> serializer&;
    auto
    operator>>(serializer& deser,
               cross_shard::coordinator::rpc::transaction_transmit& msg)
        -> serializer&;

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_received& msg)
        -> serializer&;
    auto
    operator>>(serializer& deser,
               cross_shard::coordinator::rpc::transaction_received& msg)
        -> serializer&;

    auto
    operator<<(serializer& ser,
               const cross_shard::coordinator::rpc::transaction_commit& msg)
        -> serializer&;
    auto operator>>(serializer& deser,
                    cross_shard::coordinator::rpc::transaction_commit& msg)
        -> serializer&;

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_acknowledge& msg)
        -> serializer&;
    auto
    operator>>(serializer& deser,
               cross_shard::coordinator::rpc::transaction_acknowledge& msg)
        -> serializer&;

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_status_query& msg)
        -> serializer&;
    auto
    operator>>(serializer& deser,
               cross_shard::coordinator::rpc::transaction_status_query& msg)
        -> serializer&;

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_status_response& msg)
        -> serializer&;
    auto operator>>(
        serializer& deser,
        cross_shard::coordinator::rpc::transaction_status_response& msg)
        -> serializer&;
}

#endif
