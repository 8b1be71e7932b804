// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "types.hpp"

namespace shardx::cross_shard {
    auto to_string(error_code ec) -> std::string {
        switch(ec) {
            case error_code::not_found:
                return "not_found";
            case error_code::invalid_input:
                return "invalid_input";
            case error_code::invalid_state:
                return "invalid_state";
            case error_code::serialization_error:
                return "serialization_error";
            case error_code::consensus_failure:
                return "consensus_failure";
            case error_code::transport_failure:
                return "transport_failure";
        }
        return "unknown";
    }

    auto ledger_transaction::operator==(const ledger_transaction& rhs) const
        -> bool {
        return m_id == rhs.m_id && m_parent_ids == rhs.m_parent_ids
            && m_timestamp == rhs.m_timestamp && m_payload == rhs.m_payload
            && m_signature == rhs.m_signature && m_status == rhs.m_status;
    }
}
