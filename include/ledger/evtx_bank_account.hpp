#ifndef EVTX_BANK_ACCOUNT_HPP
#define EVTX_BANK_ACCOUNT_HPP

#include "../host/evtx_local_coordinator.hpp"
#include "../transaction/evtx_storage_factory.hpp"
#include "../state/evtx_event_sourced_state.hpp"
#include "../evtx_errors.hpp"
#include <memory>
#include <string>

namespace evtx {

// 账户事件，金额以最小货币单位表示
class AccountCreatedEvent : public Event {
public:
    static constexpr const char* TYPE = "AccountCreated";

    explicit AccountCreatedEvent(const std::string& account_id, Timestamp occurred_at = Utils::getCurrentTime())
        : Event(occurred_at), account_id_(account_id) {}

    std::string typeName() const override { return TYPE; }
    const std::string& accountId() const { return account_id_; }

    static EventPtr decode(const std::string& payload);

protected:
    void encodeFields(RecordFields& fields) const override;

private:
    std::string account_id_;
};

class MoneyDepositedEvent : public Event {
public:
    static constexpr const char* TYPE = "MoneyDeposited";

    explicit MoneyDepositedEvent(int64_t amount, Timestamp occurred_at = Utils::getCurrentTime())
        : Event(occurred_at), amount_(amount) {}

    std::string typeName() const override { return TYPE; }
    int64_t amount() const { return amount_; }

    static EventPtr decode(const std::string& payload);

protected:
    void encodeFields(RecordFields& fields) const override;

private:
    int64_t amount_;
};

class MoneyWithdrawnEvent : public Event {
public:
    static constexpr const char* TYPE = "MoneyWithdrawn";

    explicit MoneyWithdrawnEvent(int64_t amount, Timestamp occurred_at = Utils::getCurrentTime())
        : Event(occurred_at), amount_(amount) {}

    std::string typeName() const override { return TYPE; }
    int64_t amount() const { return amount_; }

    static EventPtr decode(const std::string& payload);

protected:
    void encodeFields(RecordFields& fields) const override;

private:
    int64_t amount_;
};

// 余额不足，在追加任何事件之前抛出
class InsufficientFundsException : public EvtxException {
public:
    InsufficientFundsException(int64_t balance, int64_t requested, int64_t minimum_balance)
        : EvtxException("Insufficient funds. Balance: " + std::to_string(balance) +
                        ", Requested: " + std::to_string(requested) +
                        ", Minimum balance: " + std::to_string(minimum_balance)) {}
};

// 账户状态，完全由事件推导
class BankAccountState : public EventSourcedState {
public:
    static std::string typeName() { return "BankAccountState"; }
    static EventPtr decodeEvent(const std::string& type, const std::string& payload);

    void apply(const Event& event) override;

    // 业务操作：先校验，再追加事件
    void open(const std::string& account_id);
    void deposit(int64_t amount);
    void withdraw(int64_t amount, int64_t minimum_balance);

    const std::string& accountId() const { return account_id_; }
    int64_t balance() const { return balance_; }
    int64_t transactionCount() const { return transaction_count_; }
    Timestamp lastUpdate() const { return last_update_; }

private:
    std::string account_id_;
    int64_t balance_ = 0;
    int64_t transaction_count_ = 0;
    Timestamp last_update_;
};

// 账户参与者，状态名为"account"
class BankAccount {
public:
    static constexpr const char* PARTICIPANT_TYPE = "bankaccount";
    static constexpr const char* STATE_NAME = "account";

    BankAccount(const std::string& account_id,
                LocalTransactionCoordinator& coordinator,
                const TransactionalStorageFactory& factory,
                int64_t minimum_balance = 0);

    const std::string& id() const { return account_id_; }
    int64_t minimumBalance() const { return minimum_balance_; }

    // 各自在独立事务中执行
    void open();
    void deposit(int64_t amount);
    void withdraw(int64_t amount);

    // 在调用方的事务中执行
    void deposit(TransactionScope& scope, int64_t amount);
    void withdraw(TransactionScope& scope, int64_t amount);

    int64_t balance();
    int64_t transactionCount();

    TransactionalParticipant<BankAccountState>& participant() { return participant_; }

    // 丢弃内存状态，下次访问时从事件日志恢复
    void deactivate() { participant_.deactivate(); }

    // 在一个事务中从from转账到to
    static TransactionId transfer(LocalTransactionCoordinator& coordinator,
                                  BankAccount& from, BankAccount& to, int64_t amount);

private:
    std::string account_id_;
    LocalTransactionCoordinator& coordinator_;
    int64_t minimum_balance_;
    TransactionalParticipant<BankAccountState> participant_;
};

} // namespace evtx

#endif // EVTX_BANK_ACCOUNT_HPP
