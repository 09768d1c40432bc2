#ifndef EVTX_LOCAL_COORDINATOR_HPP
#define EVTX_LOCAL_COORDINATOR_HPP

#include "evtx_transactional_participant.hpp"
#include <algorithm>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace evtx {

// 一个事务的执行范围，记录参与修改的参与者
class TransactionScope {
public:
    explicit TransactionScope(TransactionInfo info) : info_(std::move(info)) {}

    const TransactionInfo& info() const { return info_; }

    // 在参与者的工作副本上执行修改，并把参与者加入事务
    template<typename TState, typename F>
    auto update(TransactionalParticipant<TState>& participant, F&& fn) {
        enlist(participant);
        return participant.performUpdate(info_, std::forward<F>(fn));
    }

    // 读取事务内可见的状态
    template<typename TState, typename F>
    auto read(TransactionalParticipant<TState>& participant, F&& fn) {
        return participant.performRead(info_, std::forward<F>(fn));
    }

    const std::vector<TransactionParticipant*>& participants() const { return participants_; }

private:
    void enlist(TransactionParticipant& participant) {
        if (std::find(participants_.begin(), participants_.end(), &participant) == participants_.end()) {
            participants_.push_back(&participant);
        }
    }

    TransactionInfo info_;
    std::vector<TransactionParticipant*> participants_;
};

// 进程内的两阶段提交协调者
// 先让所有参与者prepare，记录提交决定后再逐个commit；决定之前的任何失败都会中止全部参与者
class LocalTransactionCoordinator {
public:
    using TransactionBody = std::function<void(TransactionScope&)>;

    explicit LocalTransactionCoordinator(const std::string& name = "local-tm");

    const std::string& name() const { return name_; }

    // 执行一个事务，返回事务ID；事务被中止时抛出TransactionAbortedException
    TransactionId runTransaction(const TransactionBody& body);

    // 事务是否已决定提交，未知事务视为中止
    bool isCommitted(const TransactionId& transaction_id) const;

    // 记录提交决定，恢复测试也用它模拟决定之后的崩溃
    void recordCommitDecision(const TransactionId& transaction_id);

    size_t committedCount() const;
    size_t abortedCount() const;

private:
    void abortAll(const TransactionScope& scope);

    std::string name_;
    mutable std::mutex mutex_;
    std::unordered_map<TransactionId, bool> decisions_;
};

} // namespace evtx

#endif // EVTX_LOCAL_COORDINATOR_HPP
