// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_ROUTER_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_ROUTER_H_

#include "interface.hpp"
#include "messages.hpp"

#include <optional>

namespace shardx::cross_shard::coordinator::rpc {
    /// Serializes a coordinator message for the transport.
    /// \param msg message to serialize.
    /// \return serialized message.
    auto encode(const message& msg) -> buffer;

    /// Deserializes a coordinator message. Rejects unknown message tags,
    /// out-of-range status values, truncated input and trailing bytes.
    /// \param buf serialized message.
    /// \return message, or std::nullopt if the buffer is malformed.
    auto decode(buffer& buf) -> std::optional<message>;

    /// Passes a message to the matching handler of the coordinator.
    /// \param handler coordinator handling the message.
    /// \param msg message to handle.
    /// \return result of the handler.
    auto handle_message(interface& handler, message msg)
        -> std::optional<error_code>;

    /// Deserializes a message and passes it to the coordinator.
    /// \param handler coordinator handling the message.
    /// \param buf serialized message.
    /// \return result of the handler, or error_code::serialization_error if
    ///         the buffer is malformed.
    auto handle_buffer(interface& handler, buffer& buf)
        -> std::optional<error_code>;
}

#endif
