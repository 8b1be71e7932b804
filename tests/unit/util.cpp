// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "cross_shard/coordinator/router.hpp"

namespace shardx::test {
    manual_clock::manual_clock()
        : m_now(std::chrono::system_clock::time_point(
            std::chrono::seconds(1700000000))) {}

    auto manual_clock::now() const -> cross_shard::timestamp_type {
        std::unique_lock l(m_mut);
        return m_now;
    }

    void manual_clock::advance(std::chrono::seconds secs) {
        std::unique_lock l(m_mut);
        m_now += secs;
    }

    auto scripted_consensus::submit_transaction(
        const cross_shard::ledger_transaction& tx)
        -> std::optional<cross_shard::error_code> {
        auto callback = std::function<void()>();
        {
            std::unique_lock l(m_mut);
            if(m_fail) {
                return cross_shard::error_code::consensus_failure;
            }
            m_submitted.push_back(tx);
            std::swap(callback, m_on_submit);
        }
        if(callback) {
            callback();
        }
        return std::nullopt;
    }

    void scripted_consensus::set_fail(bool fail) {
        std::unique_lock l(m_mut);
        m_fail = fail;
    }

    void scripted_consensus::set_on_submit(std::function<void()> callback) {
        std::unique_lock l(m_mut);
        m_on_submit = std::move(callback);
    }

    auto scripted_consensus::submissions() const -> size_t {
        std::unique_lock l(m_mut);
        return m_submitted.size();
    }

    auto scripted_consensus::last_submission() const
        -> std::optional<cross_shard::ledger_transaction> {
        std::unique_lock l(m_mut);
        if(m_submitted.empty()) {
            return std::nullopt;
        }
        return m_submitted.back();
    }

    loopback_transport::loopback_transport(loopback_network& net)
        : m_net(net) {}

    auto loopback_transport::send(const cross_shard::shard_id_type& shard_id,
                                  buffer msg) -> bool {
        return m_net.enqueue(shard_id, std::move(msg));
    }

    auto loopback_network::make_transport()
        -> std::shared_ptr<loopback_transport> {
        return std::make_shared<loopback_transport>(*this);
    }

    void
    loopback_network::attach(const cross_shard::shard_id_type& shard_id,
                             cross_shard::coordinator::interface* handler) {
        std::unique_lock l(m_mut);
        m_handlers[shard_id] = handler;
    }

    void loopback_network::set_fail_sends(bool fail) {
        std::unique_lock l(m_mut);
        m_fail = fail;
    }

    auto loopback_network::enqueue(const cross_shard::shard_id_type& shard_id,
                                   buffer msg) -> bool {
        std::unique_lock l(m_mut);
        if(m_fail) {
            return false;
        }
        m_packets.push_back(packet{shard_id, std::move(msg)});
        return true;
    }

    auto loopback_network::deliver_one() -> bool {
        auto [pkt, handler] = [&]() {
            std::unique_lock l(m_mut);
            auto ret = std::pair<std::optional<packet>,
                                 cross_shard::coordinator::interface*>();
            if(m_packets.empty()) {
                return ret;
            }
            ret.first = std::move(m_packets.front());
            m_packets.pop_front();
            auto it = m_handlers.find(ret.first->m_destination);
            if(it != m_handlers.end()) {
                ret.second = it->second;
            }
            return ret;
        }();
        if(!pkt.has_value()) {
            return false;
        }
        if(handler == nullptr) {
            return true;
        }
        // Handlers may send replies, so the lock is not held here
        auto err = cross_shard::coordinator::rpc::handle_buffer(*handler,
                                                                pkt->m_data);
        if(err.has_value()) {
            std::unique_lock l(m_mut);
            m_errors.push_back(err.value());
        }
        return true;
    }

    auto loopback_network::deliver_all() -> size_t {
        static constexpr size_t max_deliveries = 10000;
        size_t count{};
        while(count < max_deliveries && deliver_one()) {
            count++;
        }
        return count;
    }

    auto loopback_network::drop_all() -> size_t {
        std::unique_lock l(m_mut);
        auto count = m_packets.size();
        m_packets.clear();
        return count;
    }

    auto loopback_network::peek() const
        -> std::vector<cross_shard::coordinator::rpc::message> {
        auto ret = std::vector<cross_shard::coordinator::rpc::message>();
        std::unique_lock l(m_mut);
        for(const auto& pkt : m_packets) {
            auto data = pkt.m_data;
            auto msg = cross_shard::coordinator::rpc::decode(data);
            if(msg.has_value()) {
                ret.push_back(std::move(msg.value()));
            }
        }
        return ret;
    }

    auto loopback_network::pending() const -> size_t {
        std::unique_lock l(m_mut);
        return m_packets.size();
    }

    auto loopback_network::errors() const
        -> std::vector<cross_shard::error_code> {
        std::unique_lock l(m_mut);
        return m_errors;
    }

    auto make_ledger_transaction(const std::string& id)
        -> cross_shard::ledger_transaction {
        auto tx = cross_shard::ledger_transaction();
        tx.m_id = id;
        tx.m_parent_ids = {"parent-a", "parent-b"};
        tx.m_timestamp = 1700000000000;
        tx.m_payload.append("transfer", 8);
        tx.m_signature.append("sig", 3);
        tx.m_status = cross_shard::ledger_status::pending;
        return tx;
    }
}
