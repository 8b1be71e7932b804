// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "outbound_queue.hpp"

#include <algorithm>

namespace shardx::cross_shard::coordinator {
    auto outbound_queue::push_back(const transaction_id_type& id) -> bool {
        if(!m_queued.insert(id).second) {
            return false;
        }
        m_queue.push_back(id);
        return true;
    }

    auto outbound_queue::push_front(const transaction_id_type& id) -> bool {
        if(!m_queued.insert(id).second) {
            return false;
        }
        m_queue.push_front(id);
        return true;
    }

    auto outbound_queue::pop_front() -> std::optional<transaction_id_type> {
        if(m_queue.empty()) {
            return std::nullopt;
        }
        auto id = std::move(m_queue.front());
        m_queue.pop_front();
        m_queued.erase(id);
        return id;
    }

    auto outbound_queue::erase(const transaction_id_type& id) -> bool {
        if(m_queued.erase(id) == 0) {
            return false;
        }
        m_queue.erase(std::find(m_queue.begin(), m_queue.end(), id));
        return true;
    }

    auto outbound_queue::contains(const transaction_id_type& id) const
        -> bool {
        return m_queued.find(id) != m_queued.end();
    }

    auto outbound_queue::size() const -> size_t {
        return m_queue.size();
    }

    auto outbound_queue::empty() const -> bool {
        return m_queue.empty();
    }
}
