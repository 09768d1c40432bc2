#include "host/evtx_local_coordinator.hpp"
#include "evtx_errors.hpp"
#include <algorithm>

namespace evtx {

LocalTransactionCoordinator::LocalTransactionCoordinator(const std::string& name) : name_(name) {}

TransactionId LocalTransactionCoordinator::runTransaction(const TransactionBody& body) {
    TransactionInfo info;
    info.transaction_id = Utils::generateUuid();
    info.timestamp = Utils::getCurrentTime();
    info.transaction_manager = name_;

    TransactionScope scope(info);
    EVTX_LOG_DEBUG("Starting transaction ", info.transaction_id);

    // 第一阶段：执行事务体并prepare全部参与者
    try {
        body(scope);
        for (auto* participant : scope.participants()) {
            participant->prepare(info);
        }
    } catch (const std::exception& e) {
        EVTX_LOG_WARNING("Transaction ", info.transaction_id, " aborted: ", e.what());
        abortAll(scope);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            decisions_[info.transaction_id] = false;
        }
        throw TransactionAbortedException("Transaction " + info.transaction_id + " aborted: " + e.what());
    }

    recordCommitDecision(info.transaction_id);

    // 第二阶段：决定已经记录，每个参与者都要尝试提交
    std::string first_error;
    for (auto* participant : scope.participants()) {
        try {
            participant->commit(info);
        } catch (const std::exception& e) {
            EVTX_LOG_ERROR("Participant ", participant->name(), " failed to commit transaction ",
                           info.transaction_id, ": ", e.what());
            if (first_error.empty()) {
                first_error = e.what();
            }
        }
    }

    if (!first_error.empty()) {
        throw TransactionAbortedException("Transaction " + info.transaction_id +
                                          " failed during commit: " + first_error);
    }

    EVTX_LOG_DEBUG("Committed transaction ", info.transaction_id, " on ",
                   scope.participants().size(), " participants");
    return info.transaction_id;
}

void LocalTransactionCoordinator::abortAll(const TransactionScope& scope) {
    for (auto* participant : scope.participants()) {
        try {
            participant->abort(scope.info());
        } catch (const std::exception& e) {
            // 参与者已自行失活，下次激活时按推定中止恢复
            EVTX_LOG_ERROR("Participant ", participant->name(), " failed to abort transaction ",
                           scope.info().transaction_id, ": ", e.what());
        }
    }
}

bool LocalTransactionCoordinator::isCommitted(const TransactionId& transaction_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = decisions_.find(transaction_id);
    return it != decisions_.end() && it->second;
}

void LocalTransactionCoordinator::recordCommitDecision(const TransactionId& transaction_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    decisions_[transaction_id] = true;
}

size_t LocalTransactionCoordinator::committedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(decisions_.begin(), decisions_.end(),
        [](const std::pair<const TransactionId, bool>& d) { return d.second; }));
}

size_t LocalTransactionCoordinator::abortedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(decisions_.begin(), decisions_.end(),
        [](const std::pair<const TransactionId, bool>& d) { return !d.second; }));
}

} // namespace evtx
