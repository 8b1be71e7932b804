// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_TESTS_UNIT_CROSS_SHARD_FIXTURE_H_
#define SHARDX_TESTS_UNIT_CROSS_SHARD_FIXTURE_H_

#include "../util.hpp"
#include "cross_shard/coordinator/impl.hpp"
#include "cross_shard/metrics/impl.hpp"
#include "cross_shard/shard_registry/impl.hpp"

#include <gtest/gtest.h>

/// Two coordinators, shard-1 and shard-2, connected by a loopback network
/// and sharing a manual clock.
class cross_shard_fixture : public ::testing::Test {
  protected:
    void SetUp() override {
        m_net.attach(m_shard1, m_source.get());
        m_net.attach(m_shard2, m_target.get());
    }

    auto make_coordinator(
        const shardx::cross_shard::shard_id_type& shard_id,
        std::shared_ptr<shardx::test::scripted_consensus> consensus,
        std::shared_ptr<shardx::cross_shard::metrics::impl> metrics,
        const shardx::cross_shard::options& opts
        = shardx::cross_shard::options())
        -> std::shared_ptr<shardx::cross_shard::coordinator::impl> {
        return std::make_shared<shardx::cross_shard::coordinator::impl>(
            shard_id,
            m_log,
            m_registry,
            std::move(consensus),
            m_net.make_transport(),
            std::move(metrics),
            opts,
            [this]() {
                return m_clock.now();
            });
    }

    /// Creates a transaction on shard-1 targeting shard-2.
    auto create(shardx::cross_shard::coordinator::impl& coordinator)
        -> shardx::cross_shard::transaction_id_type {
        auto res = coordinator.create_transaction(
            shardx::test::make_ledger_transaction("ltx-1"),
            m_shard2);
        EXPECT_TRUE(
            std::holds_alternative<shardx::cross_shard::transaction_id_type>(
                res));
        return std::get<shardx::cross_shard::transaction_id_type>(res);
    }

    auto create() -> shardx::cross_shard::transaction_id_type {
        return create(*m_source);
    }

    /// Drives a transaction until both coordinators hold it as
    /// target_committed and the source has queued its acknowledgement.
    void commit_on_both(const shardx::cross_shard::transaction_id_type& id) {
        ASSERT_FALSE(m_source->transmit(id).has_value());
        m_net.deliver_all();
        ASSERT_FALSE(m_target
                         ->confirm_target_commit(
                             id,
                             shardx::cross_shard::ledger_status::confirmed)
                         .has_value());
        m_net.deliver_all();
        ASSERT_EQ(status_of(*m_source, id),
                  shardx::cross_shard::coordinator::transaction_status::
                      target_committed);
        ASSERT_EQ(status_of(*m_target, id),
                  shardx::cross_shard::coordinator::transaction_status::
                      target_committed);
    }

    static auto status_of(shardx::cross_shard::coordinator::impl& coordinator,
                          const shardx::cross_shard::transaction_id_type& id)
        -> std::optional<
            shardx::cross_shard::coordinator::transaction_status> {
        auto tx = coordinator.get_transaction(id);
        if(!tx.has_value()) {
            return std::nullopt;
        }
        return tx->m_status;
    }

    const shardx::cross_shard::shard_id_type m_shard1{"shard-1"};
    const shardx::cross_shard::shard_id_type m_shard2{"shard-2"};

    std::shared_ptr<shardx::logging::log> m_log{
        std::make_shared<shardx::logging::log>(
            shardx::logging::log_level::trace)};
    shardx::test::manual_clock m_clock;
    shardx::test::loopback_network m_net;
    std::shared_ptr<shardx::cross_shard::shard_registry::impl> m_registry{
        std::make_shared<shardx::cross_shard::shard_registry::impl>(
            std::vector<shardx::cross_shard::shard_registry::shard_info>{
                {"shard-1", "first", "127.0.0.1:5001"},
                {"shard-2", "second", "127.0.0.1:5002"}})};

    std::shared_ptr<shardx::test::scripted_consensus> m_consensus1{
        std::make_shared<shardx::test::scripted_consensus>()};
    std::shared_ptr<shardx::test::scripted_consensus> m_consensus2{
        std::make_shared<shardx::test::scripted_consensus>()};
    std::shared_ptr<shardx::cross_shard::metrics::impl> m_metrics1{
        std::make_shared<shardx::cross_shard::metrics::impl>()};
    std::shared_ptr<shardx::cross_shard::metrics::impl> m_metrics2{
        std::make_shared<shardx::cross_shard::metrics::impl>()};

    std::shared_ptr<shardx::cross_shard::coordinator::impl> m_source{
        make_coordinator(m_shard1, m_consensus1, m_metrics1)};
    std::shared_ptr<shardx::cross_shard::coordinator::impl> m_target{
        make_coordinator(m_shard2, m_consensus2, m_metrics2)};
};

#endif
