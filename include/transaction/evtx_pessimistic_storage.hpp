#ifndef EVTX_PESSIMISTIC_STORAGE_HPP
#define EVTX_PESSIMISTIC_STORAGE_HPP

#include "evtx_storage_base.hpp"
#include "../codec/evtx_record_fields.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace evtx {

// 悲观策略：prepare写入共享的pending流（预写日志），提交时把符合条件的事件
// 去掉事务元数据后拷贝到主流，然后删除整个pending流
// 拷贝到主流的事件沿用pending事件的ID。提交在写主流之后中断时，
// 主流中尚未被元数据快照确认的事件按ID识别，恢复时不会再次拷贝。
template<typename TState>
class PessimisticEventLogStorage : public EventLogStorageBase<TState> {
    using Base = EventLogStorageBase<TState>;

public:
    PessimisticEventLogStorage(std::shared_ptr<EventLogClient> client, StreamLayout layout,
                               ReplayPolicy policy = ReplayPolicy::LENIENT)
        : Base(std::move(client), std::move(layout), policy) {}

    StorageStrategy strategy() const override { return StorageStrategy::PESSIMISTIC; }

    TransactionalStorageLoadResponse<TState> load() override {
        try {
            this->replayMainStream();
            Revision confirmed = this->loadMetadata();
            loadUnconfirmedEventIds(confirmed);
            this->mintETag();

            EVTX_LOG_INFOF("Loaded transactional state for stream {}. CommittedSeq={}, Revision={}",
                           this->layout_.main, this->committed_sequence_id_, this->committed_revision_);

            auto response = this->makeLoadResponse();
            response.pending_states = loadPendingStates();
            response.skipped_events = this->adapter_.skippedEvents();
            return response;
        } catch (const std::exception& e) {
            EVTX_LOG_ERROR("Error loading transactional state from ", this->layout_.main, ": ", e.what());
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
            deletePendingStream();
            EVTX_LOG_INFOF("Aborted transactions after sequence {} for stream {}",
                           *abort_after, this->layout_.main);
        }

        return this->current_etag_;
    }

private:
    // pending流中一条事件携带的事务标记
    struct PendingTag {
        TransactionId transaction_id;
        SequenceId sequence_id = 0;
        std::string transaction_manager;
        Timestamp timestamp;
    };

    static std::string encodeTag(const PendingTransactionState<TState>& pending) {
        RecordFields fields;
        fields.set("transaction_id", pending.transaction_id)
              .setInt("sequence_id", pending.sequence_id)
              .set("transaction_manager", pending.transaction_manager)
              .setTimestamp("timestamp", pending.timestamp);
        return fields.encode();
    }

    static PendingTag decodeTag(const std::string& metadata) {
        RecordFields fields = RecordFields::decode(metadata);
        PendingTag tag;
        tag.transaction_id = fields.get("transaction_id");
        tag.sequence_id = fields.getInt("sequence_id");
        tag.transaction_manager = fields.getOr("transaction_manager", "");
        tag.timestamp = fields.has("timestamp") ? fields.getTimestamp("timestamp") : Utils::getCurrentTime();
        return tag;
    }

    void prepare(const PendingTransactionState<TState>& pending) {
        std::vector<DomainEvent> events = this->adapter_.computeDomainEvents(this->committed_state_, pending.state);
        const std::string tag = encodeTag(pending);

        std::vector<EventData> to_write;
        to_write.reserve(events.size());
        for (const auto& event : events) {
            to_write.push_back(EventAdapter<TState>::toEventData(event, tag));
        }

        // 并发的事务在共享pending流中自由交错
        this->client_->appendToStream(this->layout_.pending, ExpectedRevision::any(), to_write);

        EVTX_LOG_DEBUG("Prepared transaction ", pending.transaction_id, " with ", events.size(),
                       " events in shared pending stream");
    }

    void commit(SequenceId commit_up_to, const TransactionalStateMetadata& metadata) {
        std::vector<RecordedEvent> pending_events;
        try {
            pending_events = this->client_->readStreamForward(this->layout_.pending);
        } catch (const StreamNotFoundException&) {
            // 没有需要拷贝的事件（例如事务没有产生任何事件），序号与元数据照常推进
            EVTX_LOG_WARNING("No pending stream found for commit on ", this->layout_.main);
        }

        std::vector<std::pair<SequenceId, EventData>> to_commit;
        for (const auto& record : pending_events) {
            PendingTag tag = decodeTag(record.event.metadata);
            if (tag.sequence_id <= this->committed_sequence_id_ || tag.sequence_id > commit_up_to) {
                continue;
            }
            if (unconfirmed_event_ids_.count(record.event.event_id) != 0) {
                EVTX_LOG_INFO("Event ", record.event.event_id, " of transaction ", tag.transaction_id,
                              " already copied to ", this->layout_.main);
                continue;
            }
            // 写入主流的事件去掉事务元数据
            to_commit.emplace_back(tag.sequence_id,
                                   EventData(record.event.event_id, record.event.event_type, record.event.data));
        }

        std::stable_sort(to_commit.begin(), to_commit.end(),
                         [](const std::pair<SequenceId, EventData>& a, const std::pair<SequenceId, EventData>& b) {
                             return a.first < b.first;
                         });

        if (!to_commit.empty()) {
            std::vector<EventData> batch;
            batch.reserve(to_commit.size());
            for (const auto& entry : to_commit) {
                batch.push_back(entry.second);
            }
            this->committed_revision_ = this->client_->appendToStream(this->layout_.main, ExpectedRevision::any(), batch);

            // 逐个事件折叠进已提交状态
            for (const auto& event : batch) {
                this->adapter_.apply(this->committed_state_, event);
            }
            EventAdapter<TState>::resetPendingEvents(this->committed_state_);
        }

        this->advanceSequence(commit_up_to);
        this->saveMetadata(metadata);
        unconfirmed_event_ids_.clear();

        // pending流中的工作已经全部读出，整体删除，下次prepare时重建
        deletePendingStream();
        this->mintETag();

        EVTX_LOG_INFOF("Committed {} events up to sequence {} for stream {}",
                       to_commit.size(), commit_up_to, this->layout_.main);
    }

    std::vector<PendingTransactionState<TState>> loadPendingStates() {
        std::vector<PendingTransactionState<TState>> states;
        std::unordered_map<TransactionId, size_t> index;

        std::vector<RecordedEvent> events;
        try {
            events = this->client_->readStreamForward(this->layout_.pending);
        } catch (const StreamNotFoundException&) {
            EVTX_LOG_DEBUG("No pending stream found for ", this->layout_.main);
            return states;
        }

        for (const auto& record : events) {
            PendingTag tag;
            try {
                tag = decodeTag(record.event.metadata);
            } catch (const CodecException& e) {
                if (this->adapter_.policy() == ReplayPolicy::STRICT) {
                    throw;
                }
                EVTX_LOG_WARNING("Skipping pending event at revision ", record.revision,
                                 " with unreadable transaction metadata: ", e.what());
                continue;
            }
            if (tag.sequence_id <= this->committed_sequence_id_) {
                continue;
            }

            // 已经拷贝到主流的事件包含在已提交状态中，事务本身仍需按决定完成
            auto it = index.find(tag.transaction_id);
            if (it == index.end()) {
                PendingTransactionState<TState> pending;
                pending.transaction_id = tag.transaction_id;
                pending.sequence_id = tag.sequence_id;
                pending.timestamp = tag.timestamp;
                pending.transaction_manager = tag.transaction_manager;
                pending.state = this->committed_state_;
                it = index.emplace(tag.transaction_id, states.size()).first;
                states.push_back(std::move(pending));
            }

            // 回放而不是append，恢复出的状态不再携带待提交事件
            if (unconfirmed_event_ids_.count(record.event.event_id) == 0) {
                this->adapter_.apply(states[it->second].state, record.event);
            }
        }

        EVTX_LOG_INFO("Recovered ", states.size(), " pending transactions from ", this->layout_.pending);
        return states;
    }

    // 收集主流中版本大于confirmed的事件ID
    void loadUnconfirmedEventIds(Revision confirmed) {
        unconfirmed_event_ids_.clear();
        if (this->committed_revision_ <= confirmed) {
            return;
        }

        for (const auto& record : this->client_->readStreamForward(this->layout_.main, confirmed + 1)) {
            unconfirmed_event_ids_.insert(record.event.event_id);
        }
        EVTX_LOG_WARNING("Stream ", this->layout_.main, " has ", unconfirmed_event_ids_.size(),
                         " events after revision ", confirmed, " not confirmed by a metadata snapshot");
    }

    void deletePendingStream() {
        try {
            this->client_->deleteStream(this->layout_.pending);
            EVTX_LOG_DEBUG("Deleted shared pending stream ", this->layout_.pending);
        } catch (const StreamNotFoundException&) {
            EVTX_LOG_DEBUG("Pending stream ", this->layout_.pending, " not found (already deleted)");
        }
    }

    std::unordered_set<std::string> unconfirmed_event_ids_;
};

} // namespace evtx

#endif // EVTX_PESSIMISTIC_STORAGE_HPP
