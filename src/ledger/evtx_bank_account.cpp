#include "ledger/evtx_bank_account.hpp"
#include <stdexcept>

namespace evtx {

EventPtr AccountCreatedEvent::decode(const std::string& payload) {
    RecordFields fields = RecordFields::decode(payload);
    return std::make_shared<const AccountCreatedEvent>(fields.get("account_id"), occurredAtOf(fields));
}

void AccountCreatedEvent::encodeFields(RecordFields& fields) const {
    fields.set("account_id", account_id_);
}

EventPtr MoneyDepositedEvent::decode(const std::string& payload) {
    RecordFields fields = RecordFields::decode(payload);
    return std::make_shared<const MoneyDepositedEvent>(fields.getInt("amount"), occurredAtOf(fields));
}

void MoneyDepositedEvent::encodeFields(RecordFields& fields) const {
    fields.setInt("amount", amount_);
}

EventPtr MoneyWithdrawnEvent::decode(const std::string& payload) {
    RecordFields fields = RecordFields::decode(payload);
    return std::make_shared<const MoneyWithdrawnEvent>(fields.getInt("amount"), occurredAtOf(fields));
}

void MoneyWithdrawnEvent::encodeFields(RecordFields& fields) const {
    fields.setInt("amount", amount_);
}

EventPtr BankAccountState::decodeEvent(const std::string& type, const std::string& payload) {
    if (type == MoneyDepositedEvent::TYPE) {
        return MoneyDepositedEvent::decode(payload);
    } else if (type == MoneyWithdrawnEvent::TYPE) {
        return MoneyWithdrawnEvent::decode(payload);
    } else if (type == AccountCreatedEvent::TYPE) {
        return AccountCreatedEvent::decode(payload);
    }
    return nullptr;
}

void BankAccountState::apply(const Event& event) {
    if (auto deposited = dynamic_cast<const MoneyDepositedEvent*>(&event)) {
        balance_ += deposited->amount();
        ++transaction_count_;
        last_update_ = deposited->occurredAt();
    } else if (auto withdrawn = dynamic_cast<const MoneyWithdrawnEvent*>(&event)) {
        balance_ -= withdrawn->amount();
        ++transaction_count_;
        last_update_ = withdrawn->occurredAt();
    } else if (auto created = dynamic_cast<const AccountCreatedEvent*>(&event)) {
        account_id_ = created->accountId();
        balance_ = 0;
        transaction_count_ = 0;
        last_update_ = created->occurredAt();
    } else {
        throw std::invalid_argument("Unknown event type: " + event.typeName());
    }
}

void BankAccountState::open(const std::string& account_id) {
    if (!account_id_.empty()) {
        throw std::logic_error("Account " + account_id_ + " is already open");
    }
    append(std::make_shared<const AccountCreatedEvent>(account_id));
}

void BankAccountState::deposit(int64_t amount) {
    if (amount < 0) {
        throw std::invalid_argument("Deposit amount must be positive or zero");
    }
    append(std::make_shared<const MoneyDepositedEvent>(amount));
}

void BankAccountState::withdraw(int64_t amount, int64_t minimum_balance) {
    if (amount <= 0) {
        throw std::invalid_argument("Withdraw amount must be positive");
    }
    if (balance_ - amount < minimum_balance) {
        throw InsufficientFundsException(balance_, amount, minimum_balance);
    }
    append(std::make_shared<const MoneyWithdrawnEvent>(amount));
}

BankAccount::BankAccount(const std::string& account_id,
                         LocalTransactionCoordinator& coordinator,
                         const TransactionalStorageFactory& factory,
                         int64_t minimum_balance)
    : account_id_(account_id),
      coordinator_(coordinator),
      minimum_balance_(minimum_balance),
      participant_(factory.create<BankAccountState>(STATE_NAME, ParticipantContext(PARTICIPANT_TYPE, account_id)),
                   [tm = &coordinator](const TransactionId& id) { return tm->isCommitted(id); }) {}

void BankAccount::open() {
    coordinator_.runTransaction([this](TransactionScope& scope) {
        scope.update(participant_, [this](BankAccountState& state) { state.open(account_id_); });
    });
}

void BankAccount::deposit(int64_t amount) {
    coordinator_.runTransaction([this, amount](TransactionScope& scope) { deposit(scope, amount); });
}

void BankAccount::withdraw(int64_t amount) {
    coordinator_.runTransaction([this, amount](TransactionScope& scope) { withdraw(scope, amount); });
}

void BankAccount::deposit(TransactionScope& scope, int64_t amount) {
    scope.update(participant_, [amount](BankAccountState& state) { state.deposit(amount); });
}

void BankAccount::withdraw(TransactionScope& scope, int64_t amount) {
    int64_t minimum_balance = minimum_balance_;
    scope.update(participant_, [amount, minimum_balance](BankAccountState& state) {
        state.withdraw(amount, minimum_balance);
    });
}

int64_t BankAccount::balance() {
    return participant_.performRead([](const BankAccountState& state) { return state.balance(); });
}

int64_t BankAccount::transactionCount() {
    return participant_.performRead([](const BankAccountState& state) { return state.transactionCount(); });
}

TransactionId BankAccount::transfer(LocalTransactionCoordinator& coordinator,
                                    BankAccount& from, BankAccount& to, int64_t amount) {
    if (amount <= 0) {
        throw std::invalid_argument("Transfer amount must be positive");
    }
    if (from.id() == to.id()) {
        throw std::invalid_argument("Cannot transfer to same account");
    }

    return coordinator.runTransaction([&from, &to, amount](TransactionScope& scope) {
        from.withdraw(scope, amount);
        to.deposit(scope, amount);
    });
}

} // namespace evtx
