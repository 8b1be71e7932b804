// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "record_store.hpp"

namespace shardx::cross_shard::coordinator {
    auto record_store::insert_pending(cross_shard_transaction tx) -> bool {
        if(contains(tx.m_id)) {
            return false;
        }
        auto id = tx.m_id;
        m_pending.emplace(std::move(id), std::move(tx));
        return true;
    }

    auto record_store::find_pending(const transaction_id_type& id)
        -> cross_shard_transaction* {
        auto it = m_pending.find(id);
        if(it == m_pending.end()) {
            return nullptr;
        }
        return &it->second;
    }

    auto record_store::find_completed(const transaction_id_type& id) const
        -> const cross_shard_transaction* {
        auto it = m_completed.find(id);
        if(it == m_completed.end()) {
            return nullptr;
        }
        return &it->second;
    }

    auto record_store::find(const transaction_id_type& id) const
        -> const cross_shard_transaction* {
        if(auto it = m_pending.find(id); it != m_pending.end()) {
            return &it->second;
        }
        return find_completed(id);
    }

    auto record_store::contains(const transaction_id_type& id) const -> bool {
        return m_pending.find(id) != m_pending.end()
            || m_completed.find(id) != m_completed.end();
    }

    auto record_store::complete(const transaction_id_type& id) -> bool {
        auto node = m_pending.extract(id);
        if(node.empty()) {
            return false;
        }
        m_completed.insert(std::move(node));
        return true;
    }

    auto record_store::purge_completed_before(timestamp_type cutoff)
        -> size_t {
        size_t removed{0};
        for(auto it = m_completed.begin(); it != m_completed.end();) {
            const auto& completed_at = it->second.m_completed_at;
            if(completed_at.has_value() && completed_at.value() < cutoff) {
                it = m_completed.erase(it);
                removed++;
            } else {
                it++;
            }
        }
        return removed;
    }

    auto record_store::pending() const -> const map_type& {
        return m_pending;
    }

    auto record_store::pending() -> map_type& {
        return m_pending;
    }

    auto record_store::completed() const -> const map_type& {
        return m_completed;
    }
}
