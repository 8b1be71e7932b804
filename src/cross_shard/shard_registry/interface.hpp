// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_SHARD_REGISTRY_INTERFACE_H_
#define SHARDX_SRC_CROSS_SHARD_SHARD_REGISTRY_INTERFACE_H_

#include "cross_shard/types.hpp"

#include <optional>

namespace shardx::cross_shard::shard_registry {
    /// Operating state of a shard.
    enum class shard_status : uint8_t {
        active,
        inactive,
        syncing
    };

    /// Topology information about a shard.
    struct shard_info {
        /// Shard ID.
        shard_id_type m_id;
        /// Human-readable shard name.
        std::string m_name;
        /// Network endpoint of the shard's coordinator, in host:port form.
        std::string m_endpoint;
        /// Operating state.
        shard_status m_status{shard_status::active};
    };

    /// Interface to the registry of shards in the network.
    class interface {
      public:
        interface() = default;
        virtual ~interface() = default;

        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Indicates whether the shard is part of the network.
        /// \param shard_id shard to look up.
        /// \return true if the shard is registered.
        [[nodiscard]] virtual auto shard_exists(const shard_id_type& shard_id)
            const -> bool = 0;

        /// Returns information about a shard.
        /// \param shard_id shard to look up.
        /// \return shard information, or std::nullopt if the shard is not
        ///         registered.
        [[nodiscard]] virtual auto
        get_shard_info(const shard_id_type& shard_id) const
            -> std::optional<shard_info> = 0;
    };
}

#endif
