// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "impl.hpp"

namespace shardx::cross_shard::shard_registry {
    impl::impl(const std::vector<shard_info>& shards) {
        for(const auto& info : shards) {
            m_shards.insert_or_assign(info.m_id, info);
        }
    }

    void impl::add_shard(shard_info info) {
        std::unique_lock l(m_mut);
        auto id = info.m_id;
        m_shards.insert_or_assign(std::move(id), std::move(info));
    }

    auto impl::remove_shard(const shard_id_type& shard_id) -> bool {
        std::unique_lock l(m_mut);
        return m_shards.erase(shard_id) != 0;
    }

    auto impl::shard_exists(const shard_id_type& shard_id) const -> bool {
        std::unique_lock l(m_mut);
        return m_shards.find(shard_id) != m_shards.end();
    }

    auto impl::get_shard_info(const shard_id_type& shard_id) const
        -> std::optional<shard_info> {
        std::unique_lock l(m_mut);
        auto it = m_shards.find(shard_id);
        if(it == m_shards.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}
