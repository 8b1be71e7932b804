// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include "util/serialization/format.hpp"

namespace shardx {
    auto operator>>(serializer& deser, cross_shard::ledger_status& s)
        -> serializer& {
        auto raw = uint8_t();
        if(!(deser >> raw)) {
            return deser;
        }
        if(raw > static_cast<uint8_t>(cross_shard::ledger_status::rejected)) {
            deser.invalidate();
            return deser;
        }
        s = static_cast<cross_shard::ledger_status>(raw);
        return deser;
    }

    auto operator<<(serializer& ser, const cross_shard::ledger_transaction& tx)
        -> serializer& {
        return ser << tx.m_id << tx.m_parent_ids << tx.m_timestamp
                   << tx.m_payload << tx.m_signature << tx.m_status;
    }

    auto operator>>(serializer& deser, cross_shard::ledger_transaction& tx)
        -> serializer& {
        return deser >> tx.m_id >> tx.m_parent_ids >> tx.m_timestamp
            >> tx.m_payload >> tx.m_signature >> tx.m_status;
    }

    auto operator>>(serializer& deser,
                    cross_shard::coordinator::transaction_status& s)
        -> serializer& {
        auto raw = uint8_t();
        if(!(deser >> raw)) {
            return deser;
        }
        auto status = cross_shard::coordinator::status_from_raw(raw);
        if(!status.has_value()) {
            deser.invalidate();
            return deser;
        }
        s = status.value();
        return deser;
    }

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_transmit& msg)
        -> serializer& {
        return ser << msg.m_transaction_id << msg.m_source_shard_id
                   << msg.m_target_shard_id << msg.m_transaction;
    }
    auto
    operator>>(serializer& deser,
               cross_shard::coordinator::rpc::transaction_transmit& msg)
        -> serializer& {
        return deser >> msg.m_transaction_id >> msg.m_source_shard_id
            >> msg.m_target_shard_id >> msg.m_transaction;
    }

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_received& msg)
        -> serializer& {
        return ser << msg.m_transaction_id << msg.m_source_shard_id
                   << msg.m_target_shard_id;
    }
    auto
    operator>>(serializer& deser,
               cross_shard::coordinator::rpc::transaction_received& msg)
        -> serializer& {
        return deser >> msg.m_transaction_id >> msg.m_source_shard_id
            >> msg.m_target_shard_id;
    }

    auto
    operator<<(serializer& ser,
               const cross_shard::coordinator::rpc::transaction_commit& msg)
        -> serializer& {
        return ser << msg.m_transaction_id << msg.m_source_shard_id
                   << msg.m_target_shard_id << msg.m_status;
    }
    auto operator>>(serializer& deser,
                    cross_shard::coordinator::rpc::transaction_commit& msg)
        -> serializer& {
        return deser >> msg.m_transaction_id >> msg.m_source_shard_id
            >> msg.m_target_shard_id >> msg.m_status;
    }

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_acknowledge& msg)
        -> serializer& {
        return ser << msg.m_transaction_id << msg.m_source_shard_id
                   << msg.m_target_shard_id;
    }
    auto
    operator>>(serializer& deser,
               cross_shard::coordinator::rpc::transaction_acknowledge& msg)
        -> serializer& {
        return deser >> msg.m_transaction_id >> msg.m_source_shard_id
            >> msg.m_target_shard_id;
    }

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_status_query& msg)
        -> serializer& {
        return ser << msg.m_transaction_id << msg.m_source_shard_id
                   << msg.m_target_shard_id;
    }
    auto
    operator>>(serializer& deser,
               cross_shard::coordinator::rpc::transaction_status_query& msg)
        -> serializer& {
        return deser >> msg.m_transaction_id >> msg.m_source_shard_id
            >> msg.m_target_shard_id;
    }

    auto operator<<(
        serializer& ser,
        const cross_shard::coordinator::rpc::transaction_status_response& msg)
        -> serializer& {
        return ser << msg.m_transaction_id << msg.m_source_shard_id
                   << msg.m_target_shard_id << msg.m_status;
    }
    auto operator>>(
        serializer& deser,
        cross_shard::coordinator::rpc::transaction_status_response& msg)
        -> serializer& {
        return deser >> msg.m_transaction_id >> msg.m_source_shard_id
            >> msg.m_target_shard_id >> msg.m_status;
    }
}
