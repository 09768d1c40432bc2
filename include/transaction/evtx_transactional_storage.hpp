#ifndef EVTX_TRANSACTIONAL_STORAGE_HPP
#define EVTX_TRANSACTIONAL_STORAGE_HPP

#include "../evtx_core.hpp"
#include "../state/evtx_metadata_store.hpp"
#include "../state/evtx_stream_layout.hpp"
#include <optional>
#include <string>
#include <vector>

namespace evtx {

// 已prepare但尚未提交的事务状态
template<typename TState>
struct PendingTransactionState {
    TransactionId transaction_id;
    SequenceId sequence_id = 0;
    Timestamp timestamp;
    std::string transaction_manager;
    TState state;
};

// Load的返回结果
template<typename TState>
struct TransactionalStorageLoadResponse {
    std::string etag;
    TState committed_state;
    SequenceId committed_sequence_id = 0;
    TransactionalStateMetadata metadata;
    std::vector<PendingTransactionState<TState>> pending_states;
    size_t skipped_events = 0;   // 宽松回放策略下被跳过的历史事件数，非零表示恢复结果不完整
};

// 一个参与者一个命名状态的持久化契约，由协调者顺序调用
template<typename TState>
class TransactionalStateStorage {
public:
    virtual ~TransactionalStateStorage() = default;

    // 恢复已提交状态与进行中的事务
    virtual TransactionalStorageLoadResponse<TState> load() = 0;

    // 处理prepare/commit/abort，返回下一次调用需要出示的ETag
    // 同一次调用中依次处理prepare、commit、abort
    virtual std::string store(const std::string& expected_etag,
                              const TransactionalStateMetadata& metadata,
                              const std::vector<PendingTransactionState<TState>>& states_to_prepare,
                              std::optional<SequenceId> commit_up_to,
                              std::optional<SequenceId> abort_after) = 0;

    virtual StorageStrategy strategy() const = 0;
    virtual const StreamLayout& layout() const = 0;
    virtual SequenceId committedSequenceId() const = 0;
    virtual Revision committedRevision() const = 0;
};

} // namespace evtx

#endif // EVTX_TRANSACTIONAL_STORAGE_HPP
