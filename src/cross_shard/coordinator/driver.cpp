// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "driver.hpp"

#include "router.hpp"

namespace shardx::cross_shard::coordinator {
    driver::driver(std::shared_ptr<impl> coordinator,
                   std::shared_ptr<logging::log> logger,
                   std::chrono::milliseconds tick_interval)
        : m_coordinator(std::move(coordinator)),
          m_log(std::move(logger)),
          m_tick_interval(tick_interval) {
        m_tick_thread = std::thread([&]() {
            std::unique_lock l(m_tick_mut);
            while(m_running) {
                if(m_tick_cv.wait_for(l, m_tick_interval, [&]() {
                       return !m_running;
                   })) {
                    break;
                }
                l.unlock();
                m_coordinator->process();
                l.lock();
            }
        });
        m_inbound_thread = std::thread([&]() {
            auto pkt = buffer();
            while(m_inbound.pop(pkt)) {
                auto err = rpc::handle_buffer(*m_coordinator, pkt);
                if(err.has_value()) {
                    m_log->warn("Dropped inbound message:",
                                to_string(err.value()));
                }
            }
        });
        m_log->debug("Started coordinator driver for shard",
                     m_coordinator->get_local_shard_id());
    }

    driver::~driver() {
        stop();
    }

    void driver::receive(buffer pkt) {
        m_inbound.push(std::move(pkt));
    }

    void driver::stop() {
        {
            std::unique_lock l(m_tick_mut);
            m_running = false;
        }
        m_tick_cv.notify_all();
        m_inbound.clear();
        if(m_tick_thread.joinable()) {
            m_tick_thread.join();
        }
        if(m_inbound_thread.joinable()) {
            m_inbound_thread.join();
        }
    }
}
