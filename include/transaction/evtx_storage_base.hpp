#ifndef EVTX_STORAGE_BASE_HPP
#define EVTX_STORAGE_BASE_HPP

#include "evtx_transactional_storage.hpp"
#include "../log/evtx_event_log.hpp"
#include "../state/evtx_event_adapter.hpp"
#include "../state/evtx_metadata_store.hpp"
#include "../evtx_errors.hpp"
#include "../evtx_logger.hpp"
#include <memory>

namespace evtx {

// 两种存储策略共用的部分：主流回放、元数据读写与ETag管理
// 存储实例内部不加锁，依赖宿主对同一实例的顺序调用
template<typename TState>
class EventLogStorageBase : public TransactionalStateStorage<TState> {
public:
    const StreamLayout& layout() const override { return layout_; }
    SequenceId committedSequenceId() const override { return committed_sequence_id_; }
    Revision committedRevision() const override { return committed_revision_; }

    const TState& committedState() const { return committed_state_; }
    const std::string& currentETag() const { return current_etag_; }

protected:
    EventLogStorageBase(std::shared_ptr<EventLogClient> client, StreamLayout layout, ReplayPolicy policy)
        : client_(std::move(client)), layout_(std::move(layout)), adapter_(policy), metadata_store_(*client_) {}

    void checkETag(const std::string& expected_etag) const {
        if (expected_etag != current_etag_) {
            throw ETagMismatchException(expected_etag, current_etag_);
        }
    }

    void mintETag() {
        current_etag_ = Utils::generateUuid();
    }

    // 从头回放主流，重建已提交状态并记录最后一个事件的版本
    void replayMainStream() {
        committed_state_ = TState();
        committed_revision_ = NO_REVISION;
        adapter_.resetSkippedEvents();

        std::vector<RecordedEvent> events;
        try {
            events = client_->readStreamForward(layout_.main);
        } catch (const StreamNotFoundException&) {
            EVTX_LOG_INFO("Stream ", layout_.main, " not found, initializing new state");
            return;
        }

        for (const auto& record : events) {
            adapter_.apply(committed_state_, record.event);
            committed_revision_ = record.revision;
        }
    }

    // 返回快照确认过的主流版本
    Revision loadMetadata() {
        MetadataSnapshot snapshot = metadata_store_.load(layout_.metadata);
        committed_sequence_id_ = snapshot.sequence_id;
        committed_metadata_ = snapshot.metadata;
        return snapshot.committed_revision;
    }

    void saveMetadata(const TransactionalStateMetadata& metadata) {
        metadata_store_.save(layout_.metadata, committed_sequence_id_, metadata, committed_revision_);
        committed_metadata_ = metadata;
    }

    // 推进已提交序号，保持单调不减
    void advanceSequence(SequenceId commit_up_to) {
        if (commit_up_to > committed_sequence_id_) {
            committed_sequence_id_ = commit_up_to;
        }
    }

    TransactionalStorageLoadResponse<TState> makeLoadResponse() const {
        TransactionalStorageLoadResponse<TState> response;
        response.etag = current_etag_;
        response.committed_state = committed_state_;
        response.committed_sequence_id = committed_sequence_id_;
        response.metadata = committed_metadata_;
        response.skipped_events = adapter_.skippedEvents();
        return response;
    }

    std::shared_ptr<EventLogClient> client_;
    StreamLayout layout_;
    EventAdapter<TState> adapter_;
    MetadataStore metadata_store_;

    TState committed_state_;
    Revision committed_revision_ = NO_REVISION;
    SequenceId committed_sequence_id_ = 0;
    TransactionalStateMetadata committed_metadata_;
    std::string current_etag_;
};

} // namespace evtx

#endif // EVTX_STORAGE_BASE_HPP
