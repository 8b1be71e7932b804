// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "impl.hpp"

namespace shardx::cross_shard::metrics {
    void impl::increment_counter(const std::string& name) {
        std::unique_lock l(m_mut);
        m_counters[name]++;
    }

    auto impl::get_counter(const std::string& name) const -> uint64_t {
        std::unique_lock l(m_mut);
        auto it = m_counters.find(name);
        if(it == m_counters.end()) {
            return 0;
        }
        return it->second;
    }
}
