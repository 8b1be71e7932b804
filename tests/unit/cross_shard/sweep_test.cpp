// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fixture.hpp"

#include <gtest/gtest.h>

using shardx::cross_shard::error_code;
using shardx::cross_shard::ledger_status;
using shardx::cross_shard::coordinator::transaction_status;
namespace rpc = shardx::cross_shard::coordinator::rpc;

class sweep_test : public cross_shard_fixture {};

TEST_F(sweep_test, timeout_transmitted) {
    auto id = create();
    ASSERT_FALSE(m_source->transmit(id).has_value());
    ASSERT_EQ(m_net.drop_all(), 1UL);

    // Exactly at the timeout nothing happens yet
    m_clock.advance(std::chrono::seconds(300));
    m_source->process();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::transmitted);

    m_clock.advance(std::chrono::seconds(1));
    m_source->process();
    auto tx = m_source->get_transaction(id);
    ASSERT_TRUE(tx.has_value());
    ASSERT_EQ(tx->m_status, transaction_status::timed_out);
    ASSERT_TRUE(tx->m_completed_at.has_value());
    ASSERT_EQ(tx->m_metadata.at("timed_out_in"), "transmitted");
    ASSERT_TRUE(m_source->get_pending_source_transactions().empty());
    ASSERT_EQ(m_source->get_completed_transactions().size(), 1UL);
    ASSERT_EQ(m_metrics1->get_counter("cross_shard_transactions_timed_out"),
              1UL);
}

TEST_F(sweep_test, timeout_skips_local_commit) {
    m_source->set_timeout(std::chrono::seconds(10));
    auto id = create();
    m_consensus1->set_on_submit([&]() {
        m_clock.advance(std::chrono::seconds(11));
        m_source->process();
    });
    ASSERT_FALSE(m_source->transmit(id).has_value());
    ASSERT_EQ(status_of(*m_source, id), transaction_status::transmitted);
    ASSERT_EQ(m_net.pending(), 1UL);
    ASSERT_EQ(m_metrics1->get_counter("cross_shard_transactions_timed_out"),
              0UL);
}

TEST_F(sweep_test, timeout_clears_queues) {
    m_net.set_fail_sends(true);
    auto id = create();
    m_source->process();
    ASSERT_EQ(m_source->transmit_queue_size(), 1UL);

    m_source->set_timeout(std::chrono::seconds(10));
    m_clock.advance(std::chrono::seconds(11));
    m_source->process();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::timed_out);
    ASSERT_EQ(m_source->transmit_queue_size(), 0UL);

    // Late messages for the timed out transaction are ignored
    ASSERT_FALSE(
        m_source->on_received_ack(id, m_shard1, m_shard2).has_value());
    ASSERT_EQ(status_of(*m_source, id), transaction_status::timed_out);
}

TEST_F(sweep_test, retry_acknowledge) {
    auto id = create();
    commit_on_both(id);

    // First tick sends the acknowledgement, which is lost
    m_source->process();
    ASSERT_EQ(m_source->acknowledge_queue_size(), 0UL);
    ASSERT_EQ(m_net.drop_all(), 1UL);

    m_clock.advance(std::chrono::seconds(31));
    m_source->process();
    auto tx = m_source->get_transaction(id);
    ASSERT_EQ(tx->m_status, transaction_status::target_committed);
    ASSERT_EQ(tx->m_retry_count, 1U);
    ASSERT_EQ(m_source->acknowledge_queue_size(), 1UL);
    ASSERT_EQ(m_metrics1->get_counter("cross_shard_transactions_retried"),
              1UL);

    // The next tick resends it and the handshake finishes
    m_source->process();
    m_net.deliver_all();
    tx = m_source->get_transaction(id);
    ASSERT_EQ(tx->m_status, transaction_status::completed);
    ASSERT_EQ(tx->m_confirmations, 2U);
    ASSERT_EQ(status_of(*m_target, id), transaction_status::completed);
}

TEST_F(sweep_test, retry_waits_for_interval) {
    auto id = create();
    ASSERT_FALSE(m_source->transmit(id).has_value());
    m_net.drop_all();

    m_clock.advance(std::chrono::seconds(30));
    m_source->process();
    ASSERT_EQ(m_source->get_transaction(id)->m_retry_count, 0U);
    ASSERT_EQ(m_source->transmit_queue_size(), 0UL);

    m_clock.advance(std::chrono::seconds(1));
    m_source->process();
    ASSERT_EQ(m_source->get_transaction(id)->m_retry_count, 1U);
    ASSERT_EQ(m_source->transmit_queue_size(), 1UL);

    // Queued retransmission goes out on the next tick
    m_source->process();
    auto msgs = m_net.peek();
    ASSERT_EQ(msgs.size(), 1UL);
    ASSERT_TRUE(std::holds_alternative<rpc::transaction_transmit>(msgs[0]));
    m_net.deliver_all();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::target_received);
    ASSERT_EQ(status_of(*m_target, id), transaction_status::target_received);
}

TEST_F(sweep_test, retry_interval_setting) {
    m_source->set_retry_interval(std::chrono::seconds(5));
    auto id = create();
    ASSERT_FALSE(m_source->transmit(id).has_value());
    m_net.drop_all();

    m_clock.advance(std::chrono::seconds(6));
    m_source->process();
    ASSERT_EQ(m_source->get_transaction(id)->m_retry_count, 1U);
}

TEST_F(sweep_test, retry_ceiling) {
    m_source->set_max_retries(2);
    auto id = create();
    ASSERT_FALSE(m_source->transmit(id).has_value());
    m_net.drop_all();

    m_clock.advance(std::chrono::seconds(31));
    for(int i = 0; i < 5; i++) {
        m_source->process();
        m_net.drop_all();
    }
    auto tx = m_source->get_transaction(id);
    ASSERT_EQ(tx->m_retry_count, 2U);
    ASSERT_EQ(tx->m_max_retries, 2U);
    ASSERT_EQ(tx->m_status, transaction_status::transmitted);
    ASSERT_EQ(m_metrics1->get_counter("cross_shard_transactions_retried"),
              2UL);

    // Left pending until the timeout reaps it
    m_clock.advance(std::chrono::seconds(270));
    m_source->process();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::timed_out);
}

TEST_F(sweep_test, retry_target_resubmits) {
    auto id = create();
    ASSERT_FALSE(m_source->transmit(id).has_value());
    m_net.deliver_all();
    ASSERT_EQ(m_consensus2->submissions(), 1UL);

    m_clock.advance(std::chrono::seconds(31));
    m_target->process();
    ASSERT_EQ(m_consensus2->submissions(), 2UL);
    ASSERT_EQ(m_consensus2->last_submission()->m_id, "ltx-1");
    ASSERT_EQ(m_target->get_transaction(id)->m_retry_count, 1U);
    ASSERT_EQ(m_net.pending(), 0UL);
}

TEST_F(sweep_test, retry_target_resends_commit) {
    auto id = create();
    commit_on_both(id);

    m_clock.advance(std::chrono::seconds(31));
    m_target->process();
    auto msgs = m_net.peek();
    ASSERT_EQ(msgs.size(), 1UL);
    auto* commit = std::get_if<rpc::transaction_commit>(&msgs[0]);
    ASSERT_NE(commit, nullptr);
    ASSERT_EQ(commit->m_transaction_id, id);
    ASSERT_EQ(commit->m_status, ledger_status::confirmed);

    // Source already holds the commit, the duplicate is a no-op
    m_net.deliver_all();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::target_committed);
    ASSERT_EQ(m_source->acknowledge_queue_size(), 1UL);
}

TEST_F(sweep_test, retry_source_queries_status) {
    auto id = create();
    ASSERT_FALSE(m_source->transmit(id).has_value());
    m_net.deliver_all();
    ASSERT_FALSE(
        m_target->confirm_target_commit(id, ledger_status::confirmed)
            .has_value());
    // The commit never reaches the source
    ASSERT_EQ(m_net.drop_all(), 1UL);
    ASSERT_EQ(status_of(*m_source, id), transaction_status::target_received);

    m_clock.advance(std::chrono::seconds(31));
    m_source->process();
    auto msgs = m_net.peek();
    ASSERT_EQ(msgs.size(), 1UL);
    ASSERT_TRUE(
        std::holds_alternative<rpc::transaction_status_query>(msgs[0]));

    // Reconciliation moves the source forward and the handshake completes
    m_net.deliver_all();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::target_committed);
    ASSERT_EQ(m_source->get_transaction(id)->m_metadata.at("reconciled_from"),
              "target_received");
    ASSERT_EQ(m_source->acknowledge_queue_size(), 1UL);
    m_source->process();
    m_net.deliver_all();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::completed);
    ASSERT_EQ(status_of(*m_target, id), transaction_status::completed);
}

TEST_F(sweep_test, lost_received_recovered_by_retransmit) {
    auto id = create();
    ASSERT_FALSE(m_source->transmit(id).has_value());
    ASSERT_TRUE(m_net.deliver_one());
    // The received reply is lost
    ASSERT_EQ(m_net.drop_all(), 1UL);

    m_clock.advance(std::chrono::seconds(31));
    m_source->process();
    m_source->process();
    m_net.deliver_all();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::target_received);
    ASSERT_EQ(m_consensus2->submissions(), 1UL);
}

TEST_F(sweep_test, cleanup_purges_old_completed) {
    m_source->set_cleanup_interval(std::chrono::seconds(10));
    m_source->set_retention_period(std::chrono::seconds(60));
    auto id = create();
    ASSERT_FALSE(m_source->cancel(id).has_value());

    m_clock.advance(std::chrono::seconds(30));
    m_source->process();
    ASSERT_TRUE(m_source->get_transaction(id).has_value());

    m_clock.advance(std::chrono::seconds(31));
    m_source->process();
    ASSERT_FALSE(m_source->get_transaction(id).has_value());
    ASSERT_TRUE(m_source->get_completed_transactions().empty());
}

TEST_F(sweep_test, cleanup_respects_interval) {
    m_source->set_retention_period(std::chrono::seconds(1));
    auto id = create();
    ASSERT_FALSE(m_source->cancel(id).has_value());

    // Default interval is an hour
    m_clock.advance(std::chrono::seconds(600));
    m_source->process();
    ASSERT_TRUE(m_source->get_transaction(id).has_value());

    m_clock.advance(std::chrono::seconds(3000));
    m_source->process();
    ASSERT_FALSE(m_source->get_transaction(id).has_value());
}

TEST_F(sweep_test, cleanup_keeps_pending) {
    m_source->set_cleanup_interval(std::chrono::seconds(1));
    m_source->set_retention_period(std::chrono::seconds(1));
    m_source->set_timeout(std::chrono::seconds(100000));
    auto id = create();
    ASSERT_FALSE(m_source->transmit(id).has_value());
    m_net.drop_all();

    m_clock.advance(std::chrono::seconds(5000));
    m_source->process();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::transmitted);
}

TEST_F(sweep_test, transmit_drain_batch_limit) {
    auto opts = shardx::cross_shard::options();
    opts.m_batch_size = 2;
    auto source = make_coordinator(m_shard1, m_consensus1, m_metrics1, opts);
    m_net.attach(m_shard1, source.get());

    for(int i = 0; i < 5; i++) {
        create(*source);
    }
    ASSERT_EQ(source->transmit_queue_size(), 5UL);

    source->process();
    ASSERT_EQ(m_net.pending(), 2UL);
    ASSERT_EQ(source->transmit_queue_size(), 3UL);

    source->process();
    source->process();
    ASSERT_EQ(m_net.pending(), 5UL);
    ASSERT_EQ(source->transmit_queue_size(), 0UL);
}

TEST_F(sweep_test, transmit_drain_stops_on_failure) {
    auto first = create();
    auto second = create();
    auto third = create();

    m_net.set_fail_sends(true);
    m_source->process();
    // Only the first was attempted; it is back at the front
    ASSERT_EQ(status_of(*m_source, first), transaction_status::transmitted);
    ASSERT_EQ(status_of(*m_source, second), transaction_status::initialized);
    ASSERT_EQ(status_of(*m_source, third), transaction_status::initialized);
    ASSERT_EQ(m_source->transmit_queue_size(), 3UL);

    m_net.set_fail_sends(false);
    m_source->process();
    auto msgs = m_net.peek();
    ASSERT_EQ(msgs.size(), 3UL);
    auto ids = std::vector<shardx::cross_shard::transaction_id_type>();
    for(const auto& msg : msgs) {
        const auto& transmit = std::get<rpc::transaction_transmit>(msg);
        ids.push_back(transmit.m_transaction_id);
    }
    ASSERT_EQ(ids,
              (std::vector<shardx::cross_shard::transaction_id_type>{first,
                                                                     second,
                                                                     third}));
}

TEST_F(sweep_test, transmit_drain_consensus_failure) {
    auto id = create();
    m_consensus1->set_fail(true);
    m_source->process();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::initialized);
    ASSERT_EQ(m_source->transmit_queue_size(), 1UL);
    ASSERT_EQ(m_net.pending(), 0UL);
}

TEST_F(sweep_test, acknowledge_drain_stops_on_failure) {
    auto id = create();
    commit_on_both(id);

    m_net.set_fail_sends(true);
    m_source->process();
    ASSERT_EQ(m_source->acknowledge_queue_size(), 1UL);
    ASSERT_EQ(m_source->get_transaction(id)->m_confirmations, 1U);

    // The source's acknowledgement is only counted once
    m_net.set_fail_sends(false);
    m_source->process();
    ASSERT_EQ(m_source->acknowledge_queue_size(), 0UL);
    ASSERT_EQ(m_source->get_transaction(id)->m_confirmations, 1U);
    m_net.deliver_all();
    ASSERT_EQ(status_of(*m_source, id), transaction_status::completed);
}

TEST_F(sweep_test, required_confirmations_setting) {
    m_source->set_required_confirmations(1);
    m_target->set_required_confirmations(1);
    auto id = create();
    commit_on_both(id);
    m_source->process();
    ASSERT_EQ(m_source->get_transaction(id)->m_confirmations, 0U);
    m_net.deliver_all();
    for(const auto& coordinator : {m_source, m_target}) {
        auto tx = coordinator->get_transaction(id);
        ASSERT_EQ(tx->m_status, transaction_status::completed);
        ASSERT_EQ(tx->m_confirmations, 1U);
    }
}
