// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_CROSS_SHARD_COORDINATOR_IMPL_H_
#define SHARDX_SRC_CROSS_SHARD_COORDINATOR_IMPL_H_

#include "cross_shard/local_consensus/interface.hpp"
#include "cross_shard/metrics/interface.hpp"
#include "cross_shard/shard_registry/interface.hpp"
#include "cross_shard/transport/interface.hpp"
#include "cross_shard/util.hpp"
#include "interface.hpp"
#include "messages.hpp"
#include "outbound_queue.hpp"
#include "record_store.hpp"
#include "util/common/logging.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <variant>
#include <vector>

namespace shardx::cross_shard::coordinator {
    /// Cross-shard transaction coordinator of one shard. Acts as the source
    /// for transactions created locally and as the target for transactions
    /// received from peers. Thread-safe. Consensus submissions and network
    /// sends are never performed while holding the internal lock.
    class impl : public interface {
      public:
        /// Source of the current time.
        using clock_type = std::function<timestamp_type()>;
        /// Return type of create_transaction.
        using create_return_type
            = std::variant<transaction_id_type, error_code>;

        /// Constructor.
        /// \param local_shard_id shard served by this coordinator.
        /// \param logger log instance.
        /// \param registry shard registry used to validate targets and
        ///                 message destinations.
        /// \param consensus local consensus engine.
        /// \param transport transport used to reach peer coordinators.
        /// \param metrics counter sink.
        /// \param opts coordinator options.
        /// \param clock time source, defaults to the system clock.
        impl(shard_id_type local_shard_id,
             std::shared_ptr<logging::log> logger,
             std::shared_ptr<shard_registry::interface> registry,
             std::shared_ptr<local_consensus::interface> consensus,
             std::shared_ptr<transport::interface> transport,
             std::shared_ptr<metrics::interface> metrics,
             const options& opts = options(),
             clock_type clock = nullptr);

        /// Creates a cross-shard transaction with this shard as the source
        /// and queues it for transmission.
        /// \param payload ledger transaction to relay.
        /// \param target_shard_id shard which should receive the
        ///                        transaction.
        /// \return new transaction ID, or error_code::invalid_input if the
        ///         target is the local shard or is not registered.
        auto create_transaction(ledger_transaction payload,
                                const shard_id_type& target_shard_id)
            -> create_return_type;

        /// Commits the transaction locally if needed and sends it to the
        /// target shard. Removes the transaction from the transmit queue;
        /// on consensus or transport failure it is queued again.
        /// \param id transaction ID.
        /// \return std::nullopt on success, error_code::invalid_state unless
        ///         the transaction is initialized or source_committed with
        ///         no local submission in flight, or the consensus or
        ///         transport error.
        auto transmit(const transaction_id_type& id)
            -> std::optional<error_code>;

        auto receive_transaction(const transaction_id_type& id,
                                 ledger_transaction payload,
                                 const shard_id_type& source_shard_id,
                                 const shard_id_type& target_shard_id)
            -> std::optional<error_code> override;

        auto on_received_ack(const transaction_id_type& id,
                             const shard_id_type& source_shard_id,
                             const shard_id_type& target_shard_id)
            -> std::optional<error_code> override;

        auto on_commit(const transaction_id_type& id,
                       const shard_id_type& source_shard_id,
                       const shard_id_type& target_shard_id,
                       ledger_status status)
            -> std::optional<error_code> override;

        auto on_acknowledge(const transaction_id_type& id,
                            const shard_id_type& source_shard_id,
                            const shard_id_type& target_shard_id)
            -> std::optional<error_code> override;

        auto on_status_query(const transaction_id_type& id,
                             const shard_id_type& source_shard_id,
                             const shard_id_type& target_shard_id)
            -> std::optional<error_code> override;

        auto on_status_response(const transaction_id_type& id,
                                const shard_id_type& source_shard_id,
                                const shard_id_type& target_shard_id,
                                transaction_status status)
            -> std::optional<error_code> override;

        /// Reports that local consensus finalized a received transaction.
        /// Only valid on the target shard.
        /// \param id transaction ID.
        /// \param status ledger status assigned by local consensus.
        /// \return std::nullopt on success.
        auto confirm_target_commit(const transaction_id_type& id,
                                   ledger_status status)
            -> std::optional<error_code>;

        /// Asks the peer shard for its view of a pending transaction.
        /// \param id transaction ID.
        /// \return std::nullopt if the query was sent.
        auto query_status(const transaction_id_type& id)
            -> std::optional<error_code>;

        /// Cancels a locally created transaction whose payload has not been
        /// submitted to local consensus.
        /// \param id transaction ID.
        /// \return std::nullopt on success, error_code::invalid_state if the
        ///         payload was already submitted or the transaction
        ///         finished.
        auto cancel(const transaction_id_type& id)
            -> std::optional<error_code>;

        /// Runs one scheduler tick: drains the transmit and acknowledge
        /// queues, times out stalled transactions, retries transactions
        /// waiting longer than the retry interval and purges old completed
        /// transactions.
        void process();

        /// Returns a copy of a pending or completed transaction.
        [[nodiscard]] auto get_transaction(const transaction_id_type& id) const
            -> std::optional<cross_shard_transaction>;

        /// Returns copies of the pending transactions created by this shard.
        [[nodiscard]] auto get_pending_source_transactions() const
            -> std::vector<cross_shard_transaction>;

        /// Returns copies of the pending transactions received by this
        /// shard.
        [[nodiscard]] auto get_pending_target_transactions() const
            -> std::vector<cross_shard_transaction>;

        /// Returns copies of the completed transactions still retained.
        [[nodiscard]] auto get_completed_transactions() const
            -> std::vector<cross_shard_transaction>;

        [[nodiscard]] auto transmit_queue_size() const -> size_t;
        [[nodiscard]] auto acknowledge_queue_size() const -> size_t;
        [[nodiscard]] auto get_local_shard_id() const -> const shard_id_type&;

        void set_timeout(std::chrono::seconds timeout);
        void set_retry_interval(std::chrono::seconds interval);
        /// Applies to transactions created or received afterwards.
        void set_max_retries(uint32_t max_retries);
        /// Applies to transactions created or received afterwards.
        void set_required_confirmations(uint32_t confirmations);
        void set_cleanup_interval(std::chrono::seconds interval);
        void set_retention_period(std::chrono::seconds period);

      private:
        /// Message to send once the lock is released.
        struct outbound_message {
            shard_id_type m_destination;
            rpc::message m_message;
        };

        shard_id_type m_local_shard_id;
        std::shared_ptr<logging::log> m_log;
        std::shared_ptr<shard_registry::interface> m_registry;
        std::shared_ptr<local_consensus::interface> m_consensus;
        std::shared_ptr<transport::interface> m_transport;
        std::shared_ptr<metrics::interface> m_metrics;
        clock_type m_clock;

        mutable std::mutex m_mut;
        options m_opts;
        record_store m_store;
        outbound_queue m_transmit_queue;
        outbound_queue m_acknowledge_queue;
        /// Transactions whose payload is with local consensus.
        std::unordered_set<transaction_id_type> m_committing;
        uint64_t m_next_sequence{0};
        timestamp_type m_last_cleanup;

        std::mutex m_process_mut;

        [[nodiscard]] auto is_source(const cross_shard_transaction& tx) const
            -> bool;

        auto make_transaction_id(timestamp_type now) -> transaction_id_type;

        auto do_transmit(const transaction_id_type& id, bool retransmit)
            -> std::optional<error_code>;

        auto send_message(const shard_id_type& destination,
                          const rpc::message& msg)
            -> std::optional<error_code>;

        auto send_all(std::vector<outbound_message> msgs)
            -> std::optional<error_code>;

        auto check_stale(const transaction_id_type& id,
                         const shard_id_type& source_shard_id,
                         const shard_id_type& target_shard_id) const
            -> std::optional<error_code>;

        [[nodiscard]] static auto
        matches(const cross_shard_transaction& tx,
                const shard_id_type& source_shard_id,
                const shard_id_type& target_shard_id) -> bool;

        void finish(cross_shard_transaction& tx,
                    transaction_status status,
                    timestamp_type now);

        void add_confirmation(cross_shard_transaction& tx);

        void drain_transmit_queue();
        void drain_acknowledge_queue();
        void timeout_sweep();
        void retry_sweep();
        void cleanup_sweep();
    };
}

#endif
