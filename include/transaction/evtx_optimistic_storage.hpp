#ifndef EVTX_OPTIMISTIC_STORAGE_HPP
#define EVTX_OPTIMISTIC_STORAGE_HPP

#include "evtx_storage_base.hpp"
#include <algorithm>
#include <unordered_map>

namespace evtx {

// 乐观策略：prepare只保存在内存中，提交时把所有事件按主流版本号原子追加
template<typename TState>
class OptimisticEventLogStorage : public EventLogStorageBase<TState> {
    using Base = EventLogStorageBase<TState>;

public:
    // 内存中的事务记录，只存在于prepare与commit/abort之间
    struct TransactionRecord {
        TransactionId transaction_id;
        SequenceId sequence_id = 0;
        std::vector<DomainEvent> events;
        TState working_state;
        Timestamp timestamp;
    };

    OptimisticEventLogStorage(std::shared_ptr<EventLogClient> client, StreamLayout layout,
                              ReplayPolicy policy = ReplayPolicy::LENIENT)
        : Base(std::move(client), std::move(layout), policy) {}

    StorageStrategy strategy() const override { return StorageStrategy::OPTIMISTIC; }

    size_t pendingTransactionCount() const { return pending_transactions_.size(); }

    bool hasPendingTransaction(const TransactionId& transaction_id) const {
        return pending_transactions_.find(transaction_id) != pending_transactions_.end();
    }

    TransactionalStorageLoadResponse<TState> load() override {
        try {
            pending_transactions_.clear();
            this->replayMainStream();
            this->loadMetadata();
            this->mintETag();

            EVTX_LOG_INFOF("Loaded optimistic transactional state for stream {}. CommittedSeq={}, Revision={}",
                           this->layout_.main, this->committed_sequence_id_, this->committed_revision_);

            // 乐观模式下没有可恢复的pending状态
            return this->makeLoadResponse();
        } catch (const std::exception& e) {
            EVTX_LOG_ERROR("Error loading optimistic transactional state from ", this->layout_.main, ": ", e.what());
            throw;
        }
    }

    std::string store(const std::string& expected_etag,
                      const TransactionalStateMetadata& metadata,
                      const std::vector<PendingTransactionState<TState>>& states_to_prepare,
                      std::optional<SequenceId> commit_up_to,
                      std::optional<SequenceId> abort_after) override {
        this->checkETag(expected_etag);

        for (const auto& pending : states_to_prepare) {
            prepare(pending);
        }

        if (commit_up_to) {
            commit(*commit_up_to, metadata);
        }

        if (abort_after) {
            abort(*abort_after);
        }

        return this->current_etag_;
    }

private:
    // 只在内存中记录，不产生I/O
    void prepare(const PendingTransactionState<TState>& pending) {
        TransactionRecord record;
        record.transaction_id = pending.transaction_id;
        record.sequence_id = pending.sequence_id;
        record.events = this->adapter_.computeDomainEvents(this->committed_state_, pending.state);
        record.working_state = pending.state;
        record.timestamp = pending.timestamp;
        EventAdapter<TState>::resetPendingEvents(record.working_state);

        EVTX_LOG_DEBUG("Prepared transaction ", pending.transaction_id, " in-memory with ",
                       record.events.size(), " events");
        pending_transactions_[pending.transaction_id] = std::move(record);
    }

    void commit(SequenceId commit_up_to, const TransactionalStateMetadata& metadata) {
        std::vector<const TransactionRecord*> to_commit;
        for (const auto& entry : pending_transactions_) {
            if (entry.second.sequence_id <= commit_up_to) {
                to_commit.push_back(&entry.second);
            }
        }

        if (to_commit.empty()) {
            EVTX_LOG_WARNINGF("No transactions to commit for sequence {} in stream {}",
                              commit_up_to, this->layout_.main);
            return;
        }

        std::sort(to_commit.begin(), to_commit.end(),
                  [](const TransactionRecord* a, const TransactionRecord* b) {
                      return a->sequence_id < b->sequence_id;
                  });

        // 主流中的事件不携带事务元数据
        std::vector<EventData> batch;
        for (const auto* record : to_commit) {
            for (const auto& event : record->events) {
                batch.push_back(EventAdapter<TState>::toEventData(event));
            }
        }

        Revision new_revision = this->committed_revision_;
        if (!batch.empty()) {
            try {
                new_revision = this->client_->appendToStream(
                    this->layout_.main, ExpectedRevision::exact(this->committed_revision_), batch);
            } catch (const WrongExpectedVersionException& e) {
                EVTX_LOG_WARNINGF("Optimistic concurrency conflict on stream {}. Expected revision: {}, actual: {}",
                                  this->layout_.main, e.expected(), e.actual());
                // 所有prepare都基于过期的已提交状态计算，全部作废
                pending_transactions_.clear();
                throw TransactionAbortedException("Optimistic concurrency conflict on stream " +
                                                  this->layout_.main + ": " + e.what());
            }
        }

        this->committed_revision_ = new_revision;
        this->advanceSequence(commit_up_to);
        this->committed_state_ = to_commit.back()->working_state;
        EventAdapter<TState>::resetPendingEvents(this->committed_state_);

        size_t tx_count = to_commit.size();
        std::vector<TransactionId> resolved;
        for (const auto* record : to_commit) {
            resolved.push_back(record->transaction_id);
        }
        for (const auto& id : resolved) {
            pending_transactions_.erase(id);
        }

        this->saveMetadata(metadata);
        this->mintETag();

        EVTX_LOG_INFOF("Committed {} transactions ({} events) atomically to stream {}. New revision: {}",
                       tx_count, batch.size(), this->layout_.main, this->committed_revision_);
    }

    // 丢弃序号大于abort_after的事务，不产生I/O
    void abort(SequenceId abort_after) {
        for (auto it = pending_transactions_.begin(); it != pending_transactions_.end();) {
            if (it->second.sequence_id > abort_after) {
                EVTX_LOG_DEBUG("Aborted transaction ", it->first, " (in-memory only)");
                it = pending_transactions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::unordered_map<TransactionId, TransactionRecord> pending_transactions_;
};

} // namespace evtx

#endif // EVTX_OPTIMISTIC_STORAGE_HPP
