// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_SERIALIZATION_UTIL_H_
#define SHARDX_SRC_SERIALIZATION_UTIL_H_

#include "buffer_serializer.hpp"
#include "format.hpp"

#include <optional>

namespace shardx {
    /// Serializes an object into a new buffer.
    /// \tparam T type of object to serialize.
    /// \param obj object to serialize.
    /// \return buffer containing the serialized object.
    template<typename T>
    auto make_buffer(const T& obj) -> buffer {
        auto pkt = buffer();
        auto ser = buffer_serializer(pkt);
        ser << obj;
        return pkt;
    }

    /// Deserializes an object from a buffer.
    /// \tparam T type of object to deserialize.
    /// \param buf buffer containing the serialized object.
    /// \return the object, or std::nullopt if deserialization failed.
    template<typename T>
    auto from_buffer(buffer& buf) -> std::optional<T> {
        auto deser = buffer_serializer(buf);
        auto ret = T();
        if(!(deser >> ret)) {
            return std::nullopt;
        }
        return ret;
    }
}

#endif
