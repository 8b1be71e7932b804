// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_SERIALIZATION_FORMAT_H_
#define SHARDX_SRC_SERIALIZATION_FORMAT_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace shardx {
    /// Serializes an integral value in its native fixed-width
    /// representation.
    template<typename T>
    auto operator<<(serializer& ser, T t)
        -> std::enable_if_t<std::is_integral_v<T>, serializer&> {
        ser.write(&t, sizeof(T));
        return ser;
    }

    /// Deserializes an integral value.
    template<typename T>
    auto operator>>(serializer& deser, T& t)
        -> std::enable_if_t<std::is_integral_v<T>, serializer&> {
        deser.read(&t, sizeof(T));
        return deser;
    }

    /// Serializes an enum as its underlying type.
    template<typename T>
    auto operator<<(serializer& ser, T e)
        -> std::enable_if_t<std::is_enum_v<T>, serializer&> {
        return ser << static_cast<std::underlying_type_t<T>>(e);
    }

    /// Deserializes an enum from its underlying type. Does not check the
    /// value is a declared enumerator.
    template<typename T>
    auto operator>>(serializer& deser, T& e)
        -> std::enable_if_t<std::is_enum_v<T>, serializer&> {
        auto raw = std::underlying_type_t<T>();
        if(deser >> raw) {
            e = static_cast<T>(raw);
        }
        return deser;
    }

    /// Serializes a buffer as a length-prefixed byte sequence.
    auto operator<<(serializer& ser, const buffer& b) -> serializer&;
    /// Deserializes a length-prefixed buffer.
    auto operator>>(serializer& deser, buffer& b) -> serializer&;

    /// Serializes a string as a length-prefixed byte sequence.
    auto operator<<(serializer& ser, const std::string& s) -> serializer&;
    /// Deserializes a length-prefixed string.
    auto operator>>(serializer& deser, std::string& s) -> serializer&;

    /// Serializes a fixed-size byte array.
    template<size_t S>
    auto operator<<(serializer& ser, const std::array<unsigned char, S>& arr)
        -> serializer& {
        ser.write(arr.data(), arr.size());
        return ser;
    }

    /// Deserializes a fixed-size byte array.
    template<size_t S>
    auto operator>>(serializer& deser, std::array<unsigned char, S>& arr)
        -> serializer& {
        deser.read(arr.data(), arr.size());
        return deser;
    }

    template<typename A, typename B>
    auto operator<<(serializer& ser, const std::pair<A, B>& p)
        -> serializer& {
        return ser << p.first << p.second;
    }

    template<typename A, typename B>
    auto operator>>(serializer& deser, std::pair<A, B>& p) -> serializer& {
        return deser >> p.first >> p.second;
    }

    /// Serializes an optional as a presence flag followed by the value, if
    /// any.
    template<typename T>
    auto operator<<(serializer& ser, const std::optional<T>& o)
        -> serializer& {
        auto has_value = o.has_value();
        if(!(ser << has_value)) {
            return ser;
        }
        if(has_value) {
            ser << o.value();
        }
        return ser;
    }

    template<typename T>
    auto operator>>(serializer& deser, std::optional<T>& o) -> serializer& {
        auto has_value = false;
        if(!(deser >> has_value)) {
            return deser;
        }
        if(has_value) {
            auto val = T();
            if(deser >> val) {
                o = std::move(val);
            }
        } else {
            o = std::nullopt;
        }
        return deser;
    }

    /// Serializes a vector as a 64-bit element count followed by each
    /// element.
    template<typename T>
    auto operator<<(serializer& ser, const std::vector<T>& vec)
        -> serializer& {
        auto len = static_cast<uint64_t>(vec.size());
        if(!(ser << len)) {
            return ser;
        }
        for(const auto& elem : vec) {
            if(!(ser << elem)) {
                break;
            }
        }
        return ser;
    }

    template<typename T>
    auto operator>>(serializer& deser, std::vector<T>& vec) -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }
        vec.clear();
        for(uint64_t i = 0; i < len; i++) {
            auto elem = T();
            if(!(deser >> elem)) {
                break;
            }
            vec.emplace_back(std::move(elem));
        }
        return deser;
    }

    /// Serializes a map as a 64-bit entry count followed by each key-value
    /// pair.
    template<typename K, typename V, typename... Ts>
    auto operator<<(serializer& ser, const std::map<K, V, Ts...>& map)
        -> serializer& {
        auto len = static_cast<uint64_t>(map.size());
        if(!(ser << len)) {
            return ser;
        }
        for(const auto& [key, val] : map) {
            if(!(ser << key << val)) {
                break;
            }
        }
        return ser;
    }

    template<typename K, typename V, typename... Ts>
    auto operator>>(serializer& deser, std::map<K, V, Ts...>& map)
        -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }
        map.clear();
        for(uint64_t i = 0; i < len; i++) {
            auto key = K();
            auto val = V();
            if(!(deser >> key >> val)) {
                break;
            }
            map.emplace(std::move(key), std::move(val));
        }
        return deser;
    }

    template<typename K, typename V, typename... Ts>
    auto operator<<(serializer& ser,
                    const std::unordered_map<K, V, Ts...>& map)
        -> serializer& {
        auto len = static_cast<uint64_t>(map.size());
        if(!(ser << len)) {
            return ser;
        }
        for(const auto& [key, val] : map) {
            if(!(ser << key << val)) {
                break;
            }
        }
        return ser;
    }

    template<typename K, typename V, typename... Ts>
    auto operator>>(serializer& deser, std::unordered_map<K, V, Ts...>& map)
        -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }
        map.clear();
        for(uint64_t i = 0; i < len; i++) {
            auto key = K();
            auto val = V();
            if(!(deser >> key >> val)) {
                break;
            }
            map.emplace(std::move(key), std::move(val));
        }
        return deser;
    }

    /// Serializes a variant as its 64-bit alternative index followed by the
    /// held value.
    template<typename... Ts>
    auto operator<<(serializer& ser, const std::variant<Ts...>& var)
        -> serializer& {
        auto idx = static_cast<uint64_t>(var.index());
        if(!(ser << idx)) {
            return ser;
        }
        std::visit(
            [&](auto&& arg) {
                ser << arg;
            },
            var);
        return ser;
    }

    namespace detail {
        template<typename V, size_t I>
        void read_alternative(serializer& deser, V& var) {
            auto val = std::variant_alternative_t<I, V>();
            if(deser >> val) {
                var.template emplace<I>(std::move(val));
            }
        }

        template<typename V, size_t... Is>
        void read_variant(serializer& deser,
                          V& var,
                          uint64_t idx,
                          std::index_sequence<Is...> /* unused */) {
            using reader_type = void (*)(serializer&, V&);
            static constexpr std::array<reader_type, sizeof...(Is)> readers{
                &read_alternative<V, Is>...};
            readers[idx](deser, var);
        }
    }

    /// Deserializes a variant. Fails if the stored index does not name an
    /// alternative of the variant.
    template<typename... Ts>
    auto operator>>(serializer& deser, std::variant<Ts...>& var)
        -> serializer& {
        auto idx = uint64_t();
        if(!(deser >> idx)) {
            return deser;
        }
        if(idx >= sizeof...(Ts)) {
            deser.invalidate();
            return deser;
        }
        detail::read_variant(deser,
                             var,
                             idx,
                             std::index_sequence_for<Ts...>{});
        return deser;
    }
}

#endif
