#ifndef EVTX_TRANSACTIONAL_PARTICIPANT_HPP
#define EVTX_TRANSACTIONAL_PARTICIPANT_HPP

#include "../transaction/evtx_transactional_storage.hpp"
#include "../state/evtx_event_adapter.hpp"
#include "../evtx_logger.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <unordered_map>

namespace evtx {

// 一个事务在参与者侧可见的信息
struct TransactionInfo {
    TransactionId transaction_id;
    Timestamp timestamp;
    std::string transaction_manager;
};

// 协调者驱动的两阶段提交参与者
class TransactionParticipant {
public:
    virtual ~TransactionParticipant() = default;

    virtual const std::string& name() const = 0;

    virtual void prepare(const TransactionInfo& info) = 0;
    virtual void commit(const TransactionInfo& info) = 0;
    virtual void abort(const TransactionInfo& info) = 0;
};

// 持有一个命名状态的参与者：首次使用时通过load激活，
// 事务在私有的工作副本上修改状态，经prepare/commit写入存储
// 同一实例的调用必须是顺序的
template<typename TState>
class TransactionalParticipant : public TransactionParticipant {
public:
    // 恢复出的未决事务是否已由协调者决定提交
    using Resolver = std::function<bool(const TransactionId&)>;

    explicit TransactionalParticipant(std::unique_ptr<TransactionalStateStorage<TState>> storage,
                                      Resolver resolver = Resolver())
        : storage_(std::move(storage)), resolver_(std::move(resolver)) {}

    const std::string& name() const override { return storage_->layout().main; }

    bool isActive() const { return active_; }

    // 丢弃内存中的全部状态，下次使用时重新load
    void deactivate() {
        if (active_) {
            EVTX_LOG_DEBUG("Deactivating participant ", name());
        }
        active_ = false;
        working_.clear();
    }

    void activate() {
        if (active_) {
            return;
        }

        adopt(storage_->load());
        if (!recovered_.empty()) {
            resolveRecovered();
        }
        active_ = true;
    }

    // 读取已提交状态
    template<typename F>
    auto performRead(F&& fn) {
        activate();
        return fn(static_cast<const TState&>(committed_state_));
    }

    // 读取事务内可见的状态：有工作副本时读工作副本
    template<typename F>
    auto performRead(const TransactionInfo& info, F&& fn) {
        activate();
        auto it = working_.find(info.transaction_id);
        if (it == working_.end()) {
            return fn(static_cast<const TState&>(committed_state_));
        }
        return fn(static_cast<const TState&>(it->second.state));
    }

    // 在事务的工作副本上执行修改，第一次修改时分配序号
    template<typename F>
    auto performUpdate(const TransactionInfo& info, F&& fn) {
        activate();
        auto it = working_.find(info.transaction_id);
        if (it == working_.end()) {
            WorkingCopy copy;
            copy.sequence_id = ++last_sequence_id_;
            copy.state = committed_state_;
            it = working_.emplace(info.transaction_id, std::move(copy)).first;
        }
        return fn(it->second.state);
    }

    void prepare(const TransactionInfo& info) override {
        auto it = working_.find(info.transaction_id);
        if (it == working_.end()) {
            // 只读参与者无需持久化
            return;
        }

        PendingTransactionState<TState> pending;
        pending.transaction_id = info.transaction_id;
        pending.sequence_id = it->second.sequence_id;
        pending.timestamp = info.timestamp;
        pending.transaction_manager = info.transaction_manager;
        pending.state = it->second.state;

        try {
            etag_ = storage_->store(etag_, metadata_, {pending}, std::nullopt, std::nullopt);
            it->second.prepared = true;
        } catch (const std::exception& e) {
            EVTX_LOG_ERROR("Prepare of transaction ", info.transaction_id, " failed on ", name(), ": ", e.what());
            deactivate();
            throw;
        }
    }

    void commit(const TransactionInfo& info) override {
        auto it = working_.find(info.transaction_id);
        if (it == working_.end()) {
            return;
        }

        WorkingCopy copy = std::move(it->second);
        working_.erase(it);

        TransactionalStateMetadata metadata = metadata_;
        metadata.timestamp = info.timestamp;
        metadata.commit_records["last_transaction_id"] = info.transaction_id;
        metadata.commit_records["transaction_manager"] = info.transaction_manager;

        try {
            etag_ = storage_->store(etag_, metadata, {}, copy.sequence_id, std::nullopt);
        } catch (const std::exception& e) {
            // 内存状态已不可信，下次使用时从日志恢复
            EVTX_LOG_ERROR("Commit of transaction ", info.transaction_id, " failed on ", name(), ": ", e.what());
            deactivate();
            throw;
        }

        committed_state_ = std::move(copy.state);
        EventAdapter<TState>::resetPendingEvents(committed_state_);
        committed_sequence_id_ = std::max(committed_sequence_id_, copy.sequence_id);
        metadata_ = metadata;
    }

    void abort(const TransactionInfo& info) override {
        auto it = working_.find(info.transaction_id);
        if (it == working_.end()) {
            return;
        }

        bool prepared = it->second.prepared;
        working_.erase(it);
        if (!prepared) {
            return;
        }

        try {
            etag_ = storage_->store(etag_, metadata_, {}, std::nullopt, committed_sequence_id_);
        } catch (const std::exception& e) {
            EVTX_LOG_ERROR("Abort of transaction ", info.transaction_id, " failed on ", name(), ": ", e.what());
            deactivate();
            throw;
        }
    }

    SequenceId committedSequenceId() const { return committed_sequence_id_; }
    const TransactionalStateMetadata& metadata() const { return metadata_; }
    const std::string& etag() const { return etag_; }

    // 最近一次load中被跳过的事件数
    size_t skippedEvents() const { return skipped_events_; }

    // 最近一次激活时恢复出的未决事务
    const std::vector<TransactionId>& recoveredCommitted() const { return recovered_committed_; }
    const std::vector<TransactionId>& recoveredAborted() const { return recovered_aborted_; }

    TransactionalStateStorage<TState>& storage() { return *storage_; }

private:
    struct WorkingCopy {
        SequenceId sequence_id = 0;
        TState state;
        bool prepared = false;
    };

    void adopt(TransactionalStorageLoadResponse<TState> response) {
        etag_ = std::move(response.etag);
        committed_state_ = std::move(response.committed_state);
        committed_sequence_id_ = response.committed_sequence_id;
        metadata_ = std::move(response.metadata);
        skipped_events_ = response.skipped_events;
        recovered_ = std::move(response.pending_states);
        last_sequence_id_ = committed_sequence_id_;
        for (const auto& pending : recovered_) {
            last_sequence_id_ = std::max(last_sequence_id_, pending.sequence_id);
        }
        working_.clear();

        if (skipped_events_ > 0) {
            EVTX_LOG_WARNING("Participant ", name(), " recovered with ", skipped_events_, " skipped events");
        }
    }

    // 已决定提交的未决事务补做提交，其余按推定中止处理
    void resolveRecovered() {
        recovered_committed_.clear();
        recovered_aborted_.clear();

        SequenceId commit_up_to = committed_sequence_id_;
        for (const auto& pending : recovered_) {
            if (resolver_ && resolver_(pending.transaction_id)) {
                commit_up_to = std::max(commit_up_to, pending.sequence_id);
                recovered_committed_.push_back(pending.transaction_id);
            } else {
                recovered_aborted_.push_back(pending.transaction_id);
            }
        }

        TransactionalStateMetadata metadata = metadata_;
        std::optional<SequenceId> commit;
        if (!recovered_committed_.empty()) {
            metadata.timestamp = Utils::getCurrentTime();
            metadata.commit_records["last_transaction_id"] = recovered_committed_.back();
            commit = commit_up_to;
        }

        EVTX_LOG_INFO("Participant ", name(), " resolving recovered transactions: ",
                      recovered_committed_.size(), " committed, ", recovered_aborted_.size(), " aborted");

        storage_->store(etag_, metadata, {}, commit, commit_up_to);
        adopt(storage_->load());
    }

    std::unique_ptr<TransactionalStateStorage<TState>> storage_;
    Resolver resolver_;

    bool active_ = false;
    std::string etag_;
    TState committed_state_;
    SequenceId committed_sequence_id_ = 0;
    SequenceId last_sequence_id_ = 0;
    TransactionalStateMetadata metadata_;
    size_t skipped_events_ = 0;

    std::vector<PendingTransactionState<TState>> recovered_;
    std::vector<TransactionId> recovered_committed_;
    std::vector<TransactionId> recovered_aborted_;
    std::unordered_map<TransactionId, WorkingCopy> working_;
};

} // namespace evtx

#endif // EVTX_TRANSACTIONAL_PARTICIPANT_HPP
