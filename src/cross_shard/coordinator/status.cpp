// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "status.hpp"

namespace shardx::cross_shard::coordinator {
    auto status_priority(transaction_status status) -> uint8_t {
        switch(status) {
            case transaction_status::initialized:
                return 1;
            case transaction_status::source_committed:
                return 2;
            case transaction_status::transmitted:
                return 3;
            case transaction_status::target_received:
                return 4;
            case transaction_status::target_committed:
                return 5;
            case transaction_status::source_acknowledged:
                return 6;
            case transaction_status::completed:
                return 7;
            case transaction_status::failed:
                return 8;
            case transaction_status::timed_out:
                return 9;
            case transaction_status::cancelled:
                return 10;
        }
        return 0;
    }

    auto is_terminal(transaction_status status) -> bool {
        switch(status) {
            case transaction_status::completed:
            case transaction_status::failed:
            case transaction_status::timed_out:
            case transaction_status::cancelled:
                return true;
            default:
                return false;
        }
    }

    auto to_string(transaction_status status) -> std::string {
        switch(status) {
            case transaction_status::initialized:
                return "initialized";
            case transaction_status::source_committed:
                return "source_committed";
            case transaction_status::transmitted:
                return "transmitted";
            case transaction_status::target_received:
                return "target_received";
            case transaction_status::target_committed:
                return "target_committed";
            case transaction_status::source_acknowledged:
                return "source_acknowledged";
            case transaction_status::completed:
                return "completed";
            case transaction_status::failed:
                return "failed";
            case transaction_status::timed_out:
                return "timed_out";
            case transaction_status::cancelled:
                return "cancelled";
        }
        return "unknown";
    }

    auto status_from_raw(uint8_t raw) -> std::optional<transaction_status> {
        if(raw >= transaction_status_count) {
            return std::nullopt;
        }
        return static_cast<transaction_status>(raw);
    }
}
