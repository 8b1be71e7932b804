// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "router.hpp"

#include "format.hpp"
#include "util/common/variant_overloaded.hpp"
#include "util/serialization/buffer_serializer.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

namespace shardx::cross_shard::coordinator::rpc {
    auto encode(const message& msg) -> buffer {
        return make_buffer(msg);
    }

    auto decode(buffer& buf) -> std::optional<message> {
        auto deser = buffer_serializer(buf);
        auto msg = message();
        if(!(deser >> msg)) {
            return std::nullopt;
        }
        if(!deser.end_of_buffer()) {
            return std::nullopt;
        }
        return msg;
    }

    auto handle_message(interface& handler, message msg)
        -> std::optional<error_code> {
        return std::visit(
            overloaded{
                [&](transaction_transmit& m) {
                    return handler.receive_transaction(
                        m.m_transaction_id,
                        std::move(m.m_transaction),
                        m.m_source_shard_id,
                        m.m_target_shard_id);
                },
                [&](transaction_received& m) {
                    return handler.on_received_ack(m.m_transaction_id,
                                                   m.m_source_shard_id,
                                                   m.m_target_shard_id);
                },
                [&](transaction_commit& m) {
                    return handler.on_commit(m.m_transaction_id,
                                             m.m_source_shard_id,
                                             m.m_target_shard_id,
                                             m.m_status);
                },
                [&](transaction_acknowledge& m) {
                    return handler.on_acknowledge(m.m_transaction_id,
                                                  m.m_source_shard_id,
                                                  m.m_target_shard_id);
                },
                [&](transaction_status_query& m) {
                    return handler.on_status_query(m.m_transaction_id,
                                                   m.m_source_shard_id,
                                                   m.m_target_shard_id);
                },
                [&](transaction_status_response& m) {
                    return handler.on_status_response(m.m_transaction_id,
                                                      m.m_source_shard_id,
                                                      m.m_target_shard_id,
                                                      m.m_status);
                }},
            msg);
    }

    auto handle_buffer(interface& handler, buffer& buf)
        -> std::optional<error_code> {
        auto msg = decode(buf);
        if(!msg.has_value()) {
            return error_code::serialization_error;
        }
        return handle_message(handler, std::move(msg.value()));
    }
}
