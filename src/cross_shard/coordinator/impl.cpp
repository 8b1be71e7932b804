// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "impl.hpp"

#include "format.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"

#include <sstream>

namespace shardx::cross_shard::coordinator {
    namespace {
        constexpr auto counter_prefix = "cross_shard_transactions_";
        constexpr auto messages_sent_counter = "cross_shard_messages_sent";

        auto counter_name(const std::string& event) -> std::string {
            return counter_prefix + event;
        }
    }

    impl::impl(shard_id_type local_shard_id,
               std::shared_ptr<logging::log> logger,
               std::shared_ptr<shard_registry::interface> registry,
               std::shared_ptr<local_consensus::interface> consensus,
               std::shared_ptr<transport::interface> transport,
               std::shared_ptr<metrics::interface> metrics,
               const options& opts,
               clock_type clock)
        : m_local_shard_id(std::move(local_shard_id)),
          m_log(std::move(logger)),
          m_registry(std::move(registry)),
          m_consensus(std::move(consensus)),
          m_transport(std::move(transport)),
          m_metrics(std::move(metrics)),
          m_clock(clock ? std::move(clock) : clock_type([]() {
              return std::chrono::system_clock::now();
          })),
          m_opts(opts),
          m_last_cleanup(m_clock()) {}

    auto impl::create_transaction(ledger_transaction payload,
                                  const shard_id_type& target_shard_id)
        -> create_return_type {
        if(target_shard_id == m_local_shard_id) {
            m_log->warn("Refusing cross-shard transaction to local shard",
                        target_shard_id);
            return error_code::invalid_input;
        }
        if(!m_registry->shard_exists(target_shard_id)) {
            m_log->warn("Refusing cross-shard transaction to unknown shard",
                        target_shard_id);
            return error_code::invalid_input;
        }

        auto id = [&]() {
            std::unique_lock l(m_mut);
            auto now = m_clock();
            auto tx = cross_shard_transaction();
            do {
                tx.m_id = make_transaction_id(now);
            } while(m_store.contains(tx.m_id));
            tx.m_payload = std::move(payload);
            tx.m_source_shard_id = m_local_shard_id;
            tx.m_target_shard_id = target_shard_id;
            tx.m_status = transaction_status::initialized;
            tx.m_created_at = now;
            tx.m_updated_at = now;
            tx.m_required_confirmations = m_opts.m_required_confirmations;
            tx.m_max_retries = m_opts.m_max_retries;
            auto tx_id = tx.m_id;
            m_store.insert_pending(std::move(tx));
            m_transmit_queue.push_back(tx_id);
            m_metrics->increment_counter(counter_name("created"));
            return tx_id;
        }();

        m_log->info("Created cross-shard transaction",
                    id,
                    "to shard",
                    target_shard_id);
        return id;
    }

    auto impl::transmit(const transaction_id_type& id)
        -> std::optional<error_code> {
        auto err = do_transmit(id, false);
        if(err.has_value() && err.value() != error_code::not_found
           && err.value() != error_code::invalid_state) {
            // Leave the transaction for the next drain of the queue
            std::unique_lock l(m_mut);
            if(m_store.find_pending(id) != nullptr) {
                m_transmit_queue.push_back(id);
            }
        }
        return err;
    }

    auto impl::do_transmit(const transaction_id_type& id, bool retransmit)
        -> std::optional<error_code> {
        auto to_commit = std::optional<ledger_transaction>();
        auto err = [&]() -> std::optional<error_code> {
            std::unique_lock l(m_mut);
            auto* tx = m_store.find_pending(id);
            if(tx == nullptr) {
                if(m_store.contains(id)) {
                    return error_code::invalid_state;
                }
                return error_code::not_found;
            }
            if(!is_source(*tx)
               || m_committing.find(id) != m_committing.end()) {
                return error_code::invalid_state;
            }
            switch(tx->m_status) {
                case transaction_status::initialized:
                    to_commit = tx->m_payload;
                    m_committing.insert(id);
                    break;
                case transaction_status::source_committed:
                    break;
                case transaction_status::transmitted:
                    if(!retransmit) {
                        return error_code::invalid_state;
                    }
                    break;
                default:
                    return error_code::invalid_state;
            }
            m_transmit_queue.erase(id);
            return std::nullopt;
        }();
        if(err.has_value()) {
            m_log->debug("Cannot transmit", id, ":", to_string(err.value()));
            return err;
        }

        if(to_commit.has_value()) {
            auto cerr = m_consensus->submit_transaction(to_commit.value());
            if(cerr.has_value()) {
                {
                    std::unique_lock l(m_mut);
                    m_committing.erase(id);
                }
                m_log->warn("Local consensus did not accept",
                            id,
                            ":",
                            to_string(cerr.value()));
                return cerr;
            }
        }

        auto result = std::optional<error_code>();
        auto msg = [&]() -> std::optional<rpc::transaction_transmit> {
            std::unique_lock l(m_mut);
            if(to_commit.has_value()) {
                m_committing.erase(id);
            }
            auto* tx = m_store.find_pending(id);
            if(tx == nullptr) {
                // Finished by the peer while local consensus ran
                result = error_code::invalid_state;
                return std::nullopt;
            }
            auto now = m_clock();
            if(tx->m_status == transaction_status::initialized) {
                tx->m_status = transaction_status::source_committed;
                tx->m_updated_at = now;
                m_metrics->increment_counter(
                    counter_name(to_string(tx->m_status)));
            }
            if(tx->m_status == transaction_status::source_committed) {
                // Marked before sending so an early reply finds the record
                // in the state it expects
                tx->m_status = transaction_status::transmitted;
                tx->m_updated_at = now;
                m_metrics->increment_counter(
                    counter_name(to_string(tx->m_status)));
            } else if(tx->m_status != transaction_status::transmitted) {
                return std::nullopt;
            }
            return rpc::transaction_transmit{tx->m_id,
                                             tx->m_source_shard_id,
                                             tx->m_target_shard_id,
                                             tx->m_payload};
        }();
        if(!msg.has_value()) {
            return result;
        }

        auto target = msg->m_target_shard_id;
        if(auto serr = send_message(target, msg.value())) {
            return serr;
        }
        m_log->debug("Transmitted", id, "to shard", target);
        return std::nullopt;
    }

    auto impl::receive_transaction(const transaction_id_type& id,
                                   ledger_transaction payload,
                                   const shard_id_type& source_shard_id,
                                   const shard_id_type& target_shard_id)
        -> std::optional<error_code> {
        if(target_shard_id != m_local_shard_id) {
            m_log->warn("Refusing transaction",
                        id,
                        "addressed to shard",
                        target_shard_id);
            return error_code::invalid_input;
        }
        if(source_shard_id == m_local_shard_id) {
            m_log->warn("Refusing transaction",
                        id,
                        "sent from the local shard");
            return error_code::invalid_input;
        }
        if(!m_registry->shard_exists(source_shard_id)) {
            m_log->warn("Refusing transaction", id, "from unknown shard");
            return error_code::not_found;
        }

        auto msgs = std::vector<outbound_message>();
        auto to_submit = std::optional<ledger_transaction>();
        {
            std::unique_lock l(m_mut);
            if(auto* tx = m_store.find_pending(id); tx != nullptr) {
                m_log->debug("Duplicate transmit for", id);
                // Repeat the replies in case the earlier ones were lost
                if(!is_source(*tx) && tx->m_source_shard_id == source_shard_id
                   && (tx->m_status == transaction_status::target_received
                       || tx->m_status
                              == transaction_status::target_committed)) {
                    msgs.push_back(
                        {source_shard_id,
                         rpc::transaction_received{id,
                                                   source_shard_id,
                                                   m_local_shard_id}});
                    if(tx->m_status == transaction_status::target_committed) {
                        msgs.push_back({source_shard_id,
                                        rpc::transaction_commit{
                                            id,
                                            source_shard_id,
                                            m_local_shard_id,
                                            tx->m_payload.m_status}});
                    }
                }
            } else if(m_store.contains(id)) {
                m_log->debug("Duplicate transmit for finished", id);
            } else {
                auto now = m_clock();
                auto tx = cross_shard_transaction();
                tx.m_id = id;
                tx.m_payload = std::move(payload);
                tx.m_source_shard_id = source_shard_id;
                tx.m_target_shard_id = m_local_shard_id;
                tx.m_status = transaction_status::target_received;
                tx.m_created_at = now;
                tx.m_updated_at = now;
                tx.m_required_confirmations
                    = m_opts.m_required_confirmations;
                tx.m_max_retries = m_opts.m_max_retries;
                to_submit = tx.m_payload;
                m_store.insert_pending(std::move(tx));
                m_metrics->increment_counter(counter_name("received"));
                msgs.push_back({source_shard_id,
                                rpc::transaction_received{id,
                                                          source_shard_id,
                                                          m_local_shard_id}});
                m_log->info("Received cross-shard transaction",
                            id,
                            "from shard",
                            source_shard_id);
            }
        }

        auto err = send_all(std::move(msgs));
        if(to_submit.has_value()) {
            auto cerr = m_consensus->submit_transaction(to_submit.value());
            if(cerr.has_value()) {
                m_log->warn("Local consensus did not accept",
                            id,
                            ":",
                            to_string(cerr.value()));
                return cerr;
            }
        }
        return err;
    }

    auto impl::on_received_ack(const transaction_id_type& id,
                               const shard_id_type& source_shard_id,
                               const shard_id_type& target_shard_id)
        -> std::optional<error_code> {
        std::unique_lock l(m_mut);
        auto* tx = m_store.find_pending(id);
        if(tx == nullptr) {
            return check_stale(id, source_shard_id, target_shard_id);
        }
        if(!matches(*tx, source_shard_id, target_shard_id)) {
            m_log->warn("Shard mismatch in received for", id);
            return error_code::invalid_input;
        }
        if(!is_source(*tx)) {
            m_log->warn("Received reply for", id, "on target shard");
            return error_code::invalid_state;
        }
        if(tx->m_status != transaction_status::transmitted) {
            m_log->trace("Ignoring received for", id);
            return std::nullopt;
        }
        tx->m_status = transaction_status::target_received;
        tx->m_updated_at = m_clock();
        m_metrics->increment_counter(counter_name(to_string(tx->m_status)));
        m_log->debug("Shard", target_shard_id, "received", id);
        return std::nullopt;
    }

    auto impl::on_commit(const transaction_id_type& id,
                         const shard_id_type& source_shard_id,
                         const shard_id_type& target_shard_id,
                         ledger_status status) -> std::optional<error_code> {
        auto msgs = std::vector<outbound_message>();
        auto result = [&]() -> std::optional<error_code> {
            std::unique_lock l(m_mut);
            auto* tx = m_store.find_pending(id);
            if(tx == nullptr) {
                return check_stale(id, source_shard_id, target_shard_id);
            }
            if(!matches(*tx, source_shard_id, target_shard_id)) {
                m_log->warn("Shard mismatch in commit for", id);
                return error_code::invalid_input;
            }
            if(tx->m_status != transaction_status::target_received) {
                m_log->trace("Ignoring commit for",
                             id,
                             "in",
                             to_string(tx->m_status));
                return std::nullopt;
            }

            if(!is_source(*tx)) {
                // Local consensus finalized the payload
                tx->m_payload.m_status = status;
                msgs.push_back({tx->m_source_shard_id,
                                rpc::transaction_commit{id,
                                                        source_shard_id,
                                                        target_shard_id,
                                                        status}});
            } else {
                m_acknowledge_queue.push_back(id);
            }
            tx->m_status = transaction_status::target_committed;
            tx->m_updated_at = m_clock();
            m_metrics->increment_counter(
                counter_name(to_string(tx->m_status)));
            m_log->debug("Transaction",
                         id,
                         "committed on shard",
                         target_shard_id);
            return std::nullopt;
        }();
        if(result.has_value()) {
            return result;
        }
        return send_all(std::move(msgs));
    }

    auto impl::on_acknowledge(const transaction_id_type& id,
                              const shard_id_type& source_shard_id,
                              const shard_id_type& target_shard_id)
        -> std::optional<error_code> {
        auto msgs = std::vector<outbound_message>();
        auto result = [&]() -> std::optional<error_code> {
            std::unique_lock l(m_mut);
            auto* tx = m_store.find_pending(id);
            if(tx == nullptr) {
                auto err = check_stale(id, source_shard_id, target_shard_id);
                if(err.has_value()) {
                    return err;
                }
                // The source missed our acknowledgement
                const auto* done = m_store.find_completed(id);
                if(done->m_target_shard_id == m_local_shard_id
                   && done->m_status == transaction_status::completed) {
                    msgs.push_back({done->m_source_shard_id,
                                    rpc::transaction_acknowledge{
                                        id,
                                        source_shard_id,
                                        target_shard_id}});
                }
                return std::nullopt;
            }
            if(!matches(*tx, source_shard_id, target_shard_id)) {
                m_log->warn("Shard mismatch in acknowledge for", id);
                return error_code::invalid_input;
            }
            if(tx->m_status != transaction_status::target_committed) {
                m_log->trace("Ignoring acknowledge for",
                             id,
                             "in",
                             to_string(tx->m_status));
                return std::nullopt;
            }

            auto now = m_clock();
            if(is_source(*tx)) {
                tx->m_status = transaction_status::source_acknowledged;
                tx->m_updated_at = now;
                add_confirmation(*tx);
                m_metrics->increment_counter(
                    counter_name(to_string(tx->m_status)));
            } else {
                msgs.push_back(
                    {tx->m_source_shard_id,
                     rpc::transaction_acknowledge{id,
                                                  source_shard_id,
                                                  target_shard_id}});
                if(tx->m_confirmations != 0) {
                    m_log->trace("Repeating acknowledge for", id);
                    return std::nullopt;
                }
                // One for the source's acknowledgement, one for ours
                add_confirmation(*tx);
                add_confirmation(*tx);
                tx->m_updated_at = now;
            }

            if(tx->m_confirmations >= tx->m_required_confirmations) {
                finish(*tx, transaction_status::completed, now);
                m_log->info("Completed cross-shard transaction", id);
            }
            return std::nullopt;
        }();
        if(result.has_value()) {
            return result;
        }
        return send_all(std::move(msgs));
    }

    auto impl::on_status_query(const transaction_id_type& id,
                               const shard_id_type& source_shard_id,
                               const shard_id_type& target_shard_id)
        -> std::optional<error_code> {
        auto msgs = std::vector<outbound_message>();
        auto result = [&]() -> std::optional<error_code> {
            std::unique_lock l(m_mut);
            const auto* tx = m_store.find(id);
            if(tx == nullptr) {
                m_log->debug("Status query for unknown transaction", id);
                return error_code::not_found;
            }
            if(!matches(*tx, source_shard_id, target_shard_id)) {
                m_log->warn("Shard mismatch in status query for", id);
                return error_code::invalid_input;
            }
            auto peer = is_source(*tx) ? tx->m_target_shard_id
                                       : tx->m_source_shard_id;
            msgs.push_back({std::move(peer),
                            rpc::transaction_status_response{
                                id,
                                source_shard_id,
                                target_shard_id,
                                tx->m_status}});
            return std::nullopt;
        }();
        if(result.has_value()) {
            return result;
        }
        return send_all(std::move(msgs));
    }

    auto impl::on_status_response(const transaction_id_type& id,
                                  const shard_id_type& source_shard_id,
                                  const shard_id_type& target_shard_id,
                                  transaction_status status)
        -> std::optional<error_code> {
        std::unique_lock l(m_mut);
        auto* tx = m_store.find_pending(id);
        if(tx == nullptr) {
            return check_stale(id, source_shard_id, target_shard_id);
        }
        if(!matches(*tx, source_shard_id, target_shard_id)) {
            m_log->warn("Shard mismatch in status response for", id);
            return error_code::invalid_input;
        }

        auto now = m_clock();
        if(status != tx->m_status
           && (status == transaction_status::completed
               || status == transaction_status::failed
               || status_priority(status) > status_priority(tx->m_status))) {
            tx->m_metadata["reconciled_from"] = to_string(tx->m_status);
        }
        if(status == transaction_status::completed) {
            tx->m_confirmations = tx->m_required_confirmations;
            finish(*tx, status, now);
            m_log->info("Completed cross-shard transaction",
                        id,
                        "reported by peer");
            return std::nullopt;
        }
        if(status == transaction_status::failed) {
            finish(*tx, status, now);
            m_log->warn("Cross-shard transaction", id, "failed on peer");
            return std::nullopt;
        }

        if(status_priority(status) <= status_priority(tx->m_status)) {
            m_log->trace("Keeping status",
                         to_string(tx->m_status),
                         "for",
                         id,
                         "over reported",
                         to_string(status));
            return std::nullopt;
        }

        m_log->debug("Adopting status",
                     to_string(status),
                     "for",
                     id,
                     "from peer");
        if(is_terminal(status)) {
            finish(*tx, status, now);
            return std::nullopt;
        }
        tx->m_status = status;
        tx->m_updated_at = now;
        if(status == transaction_status::target_committed && is_source(*tx)) {
            m_acknowledge_queue.push_back(id);
        }
        return std::nullopt;
    }

    auto impl::confirm_target_commit(const transaction_id_type& id,
                                     ledger_status status)
        -> std::optional<error_code> {
        auto source = shard_id_type();
        auto target = shard_id_type();
        auto err = [&]() -> std::optional<error_code> {
            std::unique_lock l(m_mut);
            const auto* tx = m_store.find(id);
            if(tx == nullptr) {
                return error_code::not_found;
            }
            if(tx->m_target_shard_id != m_local_shard_id) {
                return error_code::invalid_state;
            }
            source = tx->m_source_shard_id;
            target = tx->m_target_shard_id;
            return std::nullopt;
        }();
        if(err.has_value()) {
            m_log->warn("Cannot confirm commit of",
                        id,
                        ":",
                        to_string(err.value()));
            return err;
        }
        return on_commit(id, source, target, status);
    }

    auto impl::query_status(const transaction_id_type& id)
        -> std::optional<error_code> {
        auto msg = std::optional<outbound_message>();
        auto err = [&]() -> std::optional<error_code> {
            std::unique_lock l(m_mut);
            const auto* tx = m_store.find_pending(id);
            if(tx == nullptr) {
                if(m_store.contains(id)) {
                    return error_code::invalid_state;
                }
                return error_code::not_found;
            }
            auto peer = is_source(*tx) ? tx->m_target_shard_id
                                       : tx->m_source_shard_id;
            msg = outbound_message{
                std::move(peer),
                rpc::transaction_status_query{id,
                                              tx->m_source_shard_id,
                                              tx->m_target_shard_id}};
            return std::nullopt;
        }();
        if(err.has_value()) {
            return err;
        }
        return send_message(msg->m_destination, msg->m_message);
    }

    auto impl::cancel(const transaction_id_type& id)
        -> std::optional<error_code> {
        std::unique_lock l(m_mut);
        auto* tx = m_store.find_pending(id);
        if(tx == nullptr) {
            if(m_store.contains(id)) {
                return error_code::invalid_state;
            }
            return error_code::not_found;
        }
        if(!is_source(*tx) || tx->m_status != transaction_status::initialized
           || m_committing.find(id) != m_committing.end()) {
            m_log->warn("Cannot cancel",
                        id,
                        "in",
                        to_string(tx->m_status));
            return error_code::invalid_state;
        }
        finish(*tx, transaction_status::cancelled, m_clock());
        m_log->info("Cancelled cross-shard transaction", id);
        return std::nullopt;
    }

    void impl::process() {
        std::unique_lock l(m_process_mut);
        drain_transmit_queue();
        drain_acknowledge_queue();
        timeout_sweep();
        retry_sweep();
        cleanup_sweep();
    }

    void impl::drain_transmit_queue() {
        auto batch_size = [&]() {
            std::unique_lock l(m_mut);
            return m_opts.m_batch_size;
        }();
        for(size_t i = 0; i < batch_size; i++) {
            auto id = [&]() {
                std::unique_lock l(m_mut);
                return m_transmit_queue.pop_front();
            }();
            if(!id.has_value()) {
                break;
            }
            auto err = do_transmit(id.value(), true);
            if(!err.has_value()) {
                continue;
            }
            if(err.value() == error_code::not_found
               || err.value() == error_code::invalid_state) {
                m_log->trace("Dropping stale transmit entry", id.value());
                continue;
            }
            {
                std::unique_lock l(m_mut);
                if(m_store.find_pending(id.value()) != nullptr) {
                    m_transmit_queue.push_front(id.value());
                }
            }
            m_log->warn("Deferring transmit queue after failure on",
                        id.value());
            break;
        }
    }

    void impl::drain_acknowledge_queue() {
        auto batch_size = [&]() {
            std::unique_lock l(m_mut);
            return m_opts.m_batch_size;
        }();
        for(size_t i = 0; i < batch_size; i++) {
            auto msg = std::optional<outbound_message>();
            auto id = [&]() -> std::optional<transaction_id_type> {
                std::unique_lock l(m_mut);
                auto next = m_acknowledge_queue.pop_front();
                if(!next.has_value()) {
                    return std::nullopt;
                }
                auto* tx = m_store.find_pending(next.value());
                if(tx == nullptr || !is_source(*tx)
                   || tx->m_status != transaction_status::target_committed) {
                    m_log->trace("Dropping stale acknowledge entry",
                                 next.value());
                    return next;
                }
                // The source's own acknowledgement is counted once
                if(tx->m_confirmations == 0
                   && tx->m_required_confirmations > 1) {
                    tx->m_confirmations++;
                }
                msg = outbound_message{
                    tx->m_target_shard_id,
                    rpc::transaction_acknowledge{tx->m_id,
                                                 tx->m_source_shard_id,
                                                 tx->m_target_shard_id}};
                return next;
            }();
            if(!id.has_value()) {
                break;
            }
            if(!msg.has_value()) {
                continue;
            }
            auto err = send_message(msg->m_destination, msg->m_message);
            if(!err.has_value()) {
                continue;
            }
            if(err.value() != error_code::transport_failure) {
                m_log->warn("Dropping acknowledge for", id.value());
                continue;
            }
            {
                std::unique_lock l(m_mut);
                if(m_store.find_pending(id.value()) != nullptr) {
                    m_acknowledge_queue.push_front(id.value());
                }
            }
            m_log->warn("Deferring acknowledge queue after failure on",
                        id.value());
            break;
        }
    }

    void impl::timeout_sweep() {
        auto expired = std::vector<transaction_id_type>();
        {
            std::unique_lock l(m_mut);
            auto now = m_clock();
            for(const auto& [id, tx] : m_store.pending()) {
                if(!is_terminal(tx.m_status)
                   && now - tx.m_updated_at > m_opts.m_timeout
                   && m_committing.find(id) == m_committing.end()) {
                    expired.push_back(id);
                }
            }
            for(const auto& id : expired) {
                auto* tx = m_store.find_pending(id);
                tx->m_metadata["timed_out_in"] = to_string(tx->m_status);
                finish(*tx, transaction_status::timed_out, now);
            }
        }
        for(const auto& id : expired) {
            m_log->warn("Cross-shard transaction", id, "timed out");
        }
    }

    void impl::retry_sweep() {
        auto msgs = std::vector<outbound_message>();
        auto resubmit = std::vector<ledger_transaction>();
        {
            std::unique_lock l(m_mut);
            auto now = m_clock();
            for(auto& [id, tx] : m_store.pending()) {
                if(is_terminal(tx.m_status)
                   || now - tx.m_updated_at <= m_opts.m_retry_interval
                   || tx.m_retry_count >= tx.m_max_retries) {
                    continue;
                }
                tx.m_retry_count++;
                m_metrics->increment_counter(counter_name("retried"));
                m_log->debug("Retrying",
                             id,
                             "in",
                             to_string(tx.m_status),
                             "attempt",
                             tx.m_retry_count);

                auto source = is_source(tx);
                auto query = outbound_message{
                    tx.m_target_shard_id,
                    rpc::transaction_status_query{id,
                                                  tx.m_source_shard_id,
                                                  tx.m_target_shard_id}};
                switch(tx.m_status) {
                    case transaction_status::initialized:
                    case transaction_status::source_committed:
                    case transaction_status::transmitted:
                        if(source) {
                            m_transmit_queue.push_back(id);
                        }
                        break;
                    case transaction_status::target_received:
                        if(source) {
                            msgs.push_back(std::move(query));
                        } else {
                            resubmit.push_back(tx.m_payload);
                        }
                        break;
                    case transaction_status::target_committed:
                        if(source) {
                            m_acknowledge_queue.push_back(id);
                        } else {
                            msgs.push_back(
                                {tx.m_source_shard_id,
                                 rpc::transaction_commit{
                                     id,
                                     tx.m_source_shard_id,
                                     tx.m_target_shard_id,
                                     tx.m_payload.m_status}});
                        }
                        break;
                    case transaction_status::source_acknowledged:
                        if(source) {
                            msgs.push_back(std::move(query));
                        }
                        break;
                    default:
                        break;
                }
            }
        }

        for(const auto& payload : resubmit) {
            auto err = m_consensus->submit_transaction(payload);
            if(err.has_value()) {
                m_log->warn("Local consensus did not accept resubmitted",
                            payload.m_id,
                            ":",
                            to_string(err.value()));
            }
        }
        if(auto err = send_all(std::move(msgs))) {
            m_log->debug("Some retry messages were not sent:",
                         to_string(err.value()));
        }
    }

    void impl::cleanup_sweep() {
        std::unique_lock l(m_mut);
        auto now = m_clock();
        if(now - m_last_cleanup < m_opts.m_cleanup_interval) {
            return;
        }
        m_last_cleanup = now;
        auto removed
            = m_store.purge_completed_before(now - m_opts.m_retention_period);
        if(removed > 0) {
            m_log->info("Purged",
                        removed,
                        "completed cross-shard transactions");
        }
    }

    auto impl::get_transaction(const transaction_id_type& id) const
        -> std::optional<cross_shard_transaction> {
        std::unique_lock l(m_mut);
        const auto* tx = m_store.find(id);
        if(tx == nullptr) {
            return std::nullopt;
        }
        return *tx;
    }

    auto impl::get_pending_source_transactions() const
        -> std::vector<cross_shard_transaction> {
        auto ret = std::vector<cross_shard_transaction>();
        std::unique_lock l(m_mut);
        for(const auto& [id, tx] : m_store.pending()) {
            if(is_source(tx)) {
                ret.push_back(tx);
            }
        }
        return ret;
    }

    auto impl::get_pending_target_transactions() const
        -> std::vector<cross_shard_transaction> {
        auto ret = std::vector<cross_shard_transaction>();
        std::unique_lock l(m_mut);
        for(const auto& [id, tx] : m_store.pending()) {
            if(tx.m_target_shard_id == m_local_shard_id) {
                ret.push_back(tx);
            }
        }
        return ret;
    }

    auto impl::get_completed_transactions() const
        -> std::vector<cross_shard_transaction> {
        auto ret = std::vector<cross_shard_transaction>();
        std::unique_lock l(m_mut);
        ret.reserve(m_store.completed().size());
        for(const auto& [id, tx] : m_store.completed()) {
            ret.push_back(tx);
        }
        return ret;
    }

    auto impl::transmit_queue_size() const -> size_t {
        std::unique_lock l(m_mut);
        return m_transmit_queue.size();
    }

    auto impl::acknowledge_queue_size() const -> size_t {
        std::unique_lock l(m_mut);
        return m_acknowledge_queue.size();
    }

    auto impl::get_local_shard_id() const -> const shard_id_type& {
        return m_local_shard_id;
    }

    void impl::set_timeout(std::chrono::seconds timeout) {
        std::unique_lock l(m_mut);
        m_opts.m_timeout = timeout;
    }

    void impl::set_retry_interval(std::chrono::seconds interval) {
        std::unique_lock l(m_mut);
        m_opts.m_retry_interval = interval;
    }

    void impl::set_max_retries(uint32_t max_retries) {
        std::unique_lock l(m_mut);
        m_opts.m_max_retries = max_retries;
    }

    void impl::set_required_confirmations(uint32_t confirmations) {
        if(confirmations == 0) {
            m_log->warn("Ignoring zero required confirmations");
            return;
        }
        std::unique_lock l(m_mut);
        m_opts.m_required_confirmations = confirmations;
    }

    void impl::set_cleanup_interval(std::chrono::seconds interval) {
        std::unique_lock l(m_mut);
        m_opts.m_cleanup_interval = interval;
    }

    void impl::set_retention_period(std::chrono::seconds period) {
        std::unique_lock l(m_mut);
        m_opts.m_retention_period = period;
    }

    auto impl::is_source(const cross_shard_transaction& tx) const -> bool {
        return tx.m_source_shard_id == m_local_shard_id;
    }

    auto impl::make_transaction_id(timestamp_type now) -> transaction_id_type {
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         now.time_since_epoch())
                         .count();
        auto ss = std::stringstream();
        ss << "cstx_" << m_local_shard_id << "_" << nanos << "_"
           << m_next_sequence++;
        return ss.str();
    }

    auto impl::send_message(const shard_id_type& destination,
                            const rpc::message& msg)
        -> std::optional<error_code> {
        if(!m_registry->get_shard_info(destination).has_value()) {
            m_log->warn("No route to shard", destination);
            return error_code::not_found;
        }
        auto buf = make_buffer(msg);
        if(!m_transport->send(destination, std::move(buf))) {
            m_log->warn("Failed to send message type",
                        msg.index(),
                        "to shard",
                        destination);
            return error_code::transport_failure;
        }
        m_metrics->increment_counter(messages_sent_counter);
        m_log->trace("Sent message type", msg.index(), "to", destination);
        return std::nullopt;
    }

    auto impl::send_all(std::vector<outbound_message> msgs)
        -> std::optional<error_code> {
        auto ret = std::optional<error_code>();
        for(auto& msg : msgs) {
            auto err = send_message(msg.m_destination, msg.m_message);
            if(err.has_value() && !ret.has_value()) {
                ret = err;
            }
        }
        return ret;
    }

    auto impl::check_stale(const transaction_id_type& id,
                           const shard_id_type& source_shard_id,
                           const shard_id_type& target_shard_id) const
        -> std::optional<error_code> {
        const auto* tx = m_store.find_completed(id);
        if(tx == nullptr) {
            m_log->debug("Message for unknown transaction", id);
            return error_code::not_found;
        }
        if(!matches(*tx, source_shard_id, target_shard_id)) {
            m_log->warn("Shard mismatch in message for finished", id);
            return error_code::invalid_input;
        }
        m_log->trace("Ignoring message for finished", id);
        return std::nullopt;
    }

    auto impl::matches(const cross_shard_transaction& tx,
                       const shard_id_type& source_shard_id,
                       const shard_id_type& target_shard_id) -> bool {
        return tx.m_source_shard_id == source_shard_id
            && tx.m_target_shard_id == target_shard_id;
    }

    void impl::finish(cross_shard_transaction& tx,
                      transaction_status status,
                      timestamp_type now) {
        auto id = tx.m_id;
        tx.m_status = status;
        tx.m_updated_at = now;
        tx.m_completed_at = now;
        m_transmit_queue.erase(id);
        m_acknowledge_queue.erase(id);
        if(!m_store.complete(id)) {
            m_log->error("Failed to move", id, "to completed transactions");
        }
        m_metrics->increment_counter(counter_name(to_string(status)));
    }

    void impl::add_confirmation(cross_shard_transaction& tx) {
        if(tx.m_confirmations < tx.m_required_confirmations) {
            tx.m_confirmations++;
        }
    }
}
