// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_SHARD_REGISTRY_IMPL_H_
#define SHARDX_SRC_CROSS_SHARD_SHARD_REGISTRY_IMPL_H_

#include "interface.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace shardx::cross_shard::shard_registry {
    /// In-memory shard registry, usually populated from configuration.
    class impl : public interface {
      public:
        impl() = default;

        /// Constructor.
        /// \param shards initial set of registered shards.
        explicit impl(const std::vector<shard_info>& shards);

        /// Registers a shard, replacing any previous entry with the same ID.
        /// \param info shard to register.
        void add_shard(shard_info info);

        /// Removes a shard from the registry.
        /// \param shard_id shard to remove.
        /// \return true if the shard was registered.
        auto remove_shard(const shard_id_type& shard_id) -> bool;

        [[nodiscard]] auto shard_exists(const shard_id_type& shard_id) const
            -> bool override;

        [[nodiscard]] auto get_shard_info(const shard_id_type& shard_id) const
            -> std::optional<shard_info> override;

      private:
        mutable std::mutex m_mut;
        std::unordered_map<shard_id_type, shard_info> m_shards;
    };
}

#endif
