#include <gtest/gtest.h>
#include "transaction/evtx_pessimistic_storage.hpp"
#include "log/evtx_memory_event_log.hpp"
#include "ledger/evtx_bank_account.hpp"
#include "test_common.h"

using namespace evtx;

class PessimisticStorageTest : public ::testing::Test {
protected:
    using Storage = PessimisticEventLogStorage<BankAccountState>;

    void SetUp() override {
        log_ = std::make_shared<MemoryEventLog>();
        layout_ = StreamLayout::forParticipant("bankaccount", "bob", "account");
        storage_ = makeStorage();
    }

    std::unique_ptr<Storage> makeStorage(ReplayPolicy policy = ReplayPolicy::LENIENT) {
        return std::make_unique<Storage>(log_, layout_, policy);
    }

    static PendingTransactionState<BankAccountState> deposit(const BankAccountState& base, const std::string& tx,
                                                             SequenceId seq, int64_t amount) {
        PendingTransactionState<BankAccountState> pending;
        pending.transaction_id = tx;
        pending.sequence_id = seq;
        pending.timestamp = test::millisNow();
        pending.transaction_manager = "tm-" + tx;
        pending.state = base;
        pending.state.clearPendingEvents();
        pending.state.deposit(amount);
        return pending;
    }

    // 按持久化格式构造pending流中的事务标记
    static std::string tag(const std::string& tx, SequenceId seq) {
        RecordFields fields;
        fields.set("transaction_id", tx)
              .setInt("sequence_id", seq)
              .set("transaction_manager", "tm")
              .setTimestamp("timestamp", test::millisNow());
        return fields.encode();
    }

    TransactionalStateMetadata metadata(const std::string& value) {
        TransactionalStateMetadata md;
        md.timestamp = test::millisNow();
        md.commit_records["tag"] = value;
        return md;
    }

    std::shared_ptr<MemoryEventLog> log_;
    StreamLayout layout_;
    std::unique_ptr<Storage> storage_;
};

// prepare写入pending流并携带事务元数据，主流不变
TEST_F(PessimisticStorageTest, PrepareWritesTaggedPendingEvents) {
    auto response = storage_->load();
    auto pending = deposit(response.committed_state, "tx-a", 1, 25);
    pending.state.withdraw(5, 0);

    std::string etag = storage_->store(response.etag, response.metadata, {pending}, std::nullopt, std::nullopt);
    EXPECT_EQ(etag, response.etag);
    EXPECT_EQ(storage_->strategy(), StorageStrategy::PESSIMISTIC);

    EXPECT_FALSE(log_->streamExists(layout_.main));
    auto events = log_->readStreamForward(layout_.pending);
    ASSERT_EQ(events.size(), 2u);
    for (const auto& event : events) {
        RecordFields fields = RecordFields::decode(event.event.metadata);
        EXPECT_EQ(fields.get("transaction_id"), "tx-a");
        EXPECT_EQ(fields.getInt("sequence_id"), 1);
        EXPECT_EQ(fields.get("transaction_manager"), "tm-tx-a");
        EXPECT_EQ(fields.getTimestamp("timestamp"), pending.timestamp);
    }
}

// 重新加载时按事务分组恢复未决状态，保持首次出现的顺序
TEST_F(PessimisticStorageTest, LoadRecoversPendingTransactions) {
    auto response = storage_->load();
    auto a = deposit(response.committed_state, "tx-a", 2, 10);
    auto b = deposit(response.committed_state, "tx-b", 1, 20);
    auto a_more = a;
    a_more.state.clearPendingEvents();
    a_more.state.deposit(5);

    std::string etag = storage_->store(response.etag, response.metadata, {a, b}, std::nullopt, std::nullopt);
    storage_->store(etag, response.metadata, {a_more}, std::nullopt, std::nullopt);

    auto recovered = makeStorage()->load();
    ASSERT_EQ(recovered.pending_states.size(), 2u);

    EXPECT_EQ(recovered.pending_states[0].transaction_id, "tx-a");
    EXPECT_EQ(recovered.pending_states[0].sequence_id, 2);
    EXPECT_EQ(recovered.pending_states[0].transaction_manager, "tm-tx-a");
    EXPECT_EQ(recovered.pending_states[0].timestamp, a.timestamp);
    EXPECT_EQ(recovered.pending_states[0].state.balance(), 15);
    EXPECT_TRUE(recovered.pending_states[0].state.pendingEvents().empty());

    EXPECT_EQ(recovered.pending_states[1].transaction_id, "tx-b");
    EXPECT_EQ(recovered.pending_states[1].state.balance(), 20);

    // 未决事务对已提交状态不可见
    EXPECT_EQ(recovered.committed_state.balance(), 0);
}

// 序号不大于已提交序号的pending条目不会被恢复
TEST_F(PessimisticStorageTest, RecoveryIgnoresResolvedSequences) {
    MetadataStore(*log_).save(layout_.metadata, 3, TransactionalStateMetadata());
    log_->appendToStream(layout_.pending, ExpectedRevision::any(),
                         {EventData("1", MoneyDepositedEvent::TYPE, MoneyDepositedEvent(1).encode(), tag("old", 3)),
                          EventData("2", MoneyDepositedEvent::TYPE, MoneyDepositedEvent(4).encode(), tag("new", 4))});

    auto response = storage_->load();
    EXPECT_EQ(response.committed_sequence_id, 3);
    ASSERT_EQ(response.pending_states.size(), 1u);
    EXPECT_EQ(response.pending_states[0].transaction_id, "new");
    EXPECT_EQ(response.pending_states[0].state.balance(), 4);
}

// 提交时按序号稳定排序，去掉元数据后写入主流，并删除pending流
TEST_F(PessimisticStorageTest, CommitCopiesOrderedEventsAndDropsPending) {
    auto response = storage_->load();
    auto later = deposit(response.committed_state, "tx-late", 2, 200);
    auto earlier = deposit(response.committed_state, "tx-early", 1, 100);

    std::string etag = storage_->store(response.etag, response.metadata, {later, earlier}, std::nullopt, std::nullopt);
    auto md = metadata("commit");
    std::string committed_etag = storage_->store(etag, md, {}, 2, std::nullopt);

    EXPECT_NE(committed_etag, etag);
    EXPECT_FALSE(log_->streamExists(layout_.pending));
    EXPECT_EQ(storage_->committedSequenceId(), 2);
    EXPECT_EQ(storage_->committedRevision(), 2u);
    EXPECT_EQ(storage_->committedState().balance(), 300);
    EXPECT_EQ(storage_->committedState().transactionCount(), 2);

    auto events = log_->readStreamForward(layout_.main);
    ASSERT_EQ(events.size(), 2u);
    auto first = std::dynamic_pointer_cast<const MoneyDepositedEvent>(MoneyDepositedEvent::decode(events[0].event.data));
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->amount(), 100);
    for (const auto& event : events) {
        EXPECT_TRUE(event.event.metadata.empty());
    }

    MetadataSnapshot snapshot = MetadataStore(*log_).load(layout_.metadata);
    EXPECT_EQ(snapshot.sequence_id, 2);
    EXPECT_EQ(snapshot.committed_revision, 2u);
    EXPECT_EQ(snapshot.metadata, md);
}

// 主流事件沿用pending事件的ID
TEST_F(PessimisticStorageTest, CommitKeepsPendingEventIds) {
    auto response = storage_->load();
    auto pending = deposit(response.committed_state, "tx", 1, 10);
    pending.state.deposit(5);

    std::string etag = storage_->store(response.etag, response.metadata, {pending}, std::nullopt, std::nullopt);
    auto prepared = log_->readStreamForward(layout_.pending);
    storage_->store(etag, metadata("ids"), {}, 1, std::nullopt);

    auto committed = log_->readStreamForward(layout_.main);
    ASSERT_EQ(committed.size(), prepared.size());
    for (size_t i = 0; i < committed.size(); ++i) {
        EXPECT_EQ(committed[i].event.event_id, prepared[i].event.event_id);
    }
}

// 序号不大于已提交序号的残留条目不会再次写入主流
TEST_F(PessimisticStorageTest, CommitSkipsAlreadyCommittedSequences) {
    log_->appendToStream(layout_.pending, ExpectedRevision::any(),
                         {EventData("old", MoneyDepositedEvent::TYPE, MoneyDepositedEvent(30).encode(), tag("tx-old", 1))});
    MetadataStore(*log_).save(layout_.metadata, 1, TransactionalStateMetadata());

    auto response = storage_->load();
    EXPECT_TRUE(response.pending_states.empty());

    std::string etag = storage_->store(response.etag, response.metadata,
                                       {deposit(response.committed_state, "tx-new", 2, 1)}, 2, std::nullopt);
    EXPECT_NE(etag, response.etag);
    EXPECT_EQ(storage_->committedState().balance(), 1);
    EXPECT_EQ(log_->readStreamForward(layout_.main).size(), 1u);
}

// 主流中尚未被快照确认的事件在恢复时只计入一次
TEST_F(PessimisticStorageTest, UnconfirmedMainEventsAreNotCopiedAgain) {
    auto response = storage_->load();
    std::string etag = storage_->store(response.etag, response.metadata,
                                       {deposit(response.committed_state, "tx", 1, 30)}, std::nullopt, std::nullopt);
    auto prepared = log_->readStreamForward(layout_.pending);
    ASSERT_EQ(prepared.size(), 1u);

    // 模拟提交写完主流后、写元数据快照之前中断
    log_->appendToStream(layout_.main, ExpectedRevision::exact(0),
                         {EventData(prepared[0].event.event_id, prepared[0].event.event_type, prepared[0].event.data)});

    auto recovered_storage = makeStorage();
    auto recovered = recovered_storage->load();
    EXPECT_EQ(recovered.committed_state.balance(), 30);
    EXPECT_EQ(recovered.committed_sequence_id, 0);
    ASSERT_EQ(recovered.pending_states.size(), 1u);
    EXPECT_EQ(recovered.pending_states[0].state.balance(), 30);

    recovered_storage->store(recovered.etag, metadata("repair"), {}, 1, std::nullopt);
    EXPECT_EQ(recovered_storage->committedState().balance(), 30);
    EXPECT_EQ(log_->readStreamForward(layout_.main).size(), 1u);
    EXPECT_EQ(MetadataStore(*log_).load(layout_.metadata).committed_revision, 1u);
    EXPECT_EQ(makeStorage()->load().committed_state.balance(), 30);
}

// 只复制序号不超过commit_up_to的条目
TEST_F(PessimisticStorageTest, CommitUpToFiltersBySequence) {
    auto response = storage_->load();
    auto first = deposit(response.committed_state, "tx-1", 1, 10);
    auto second = deposit(response.committed_state, "tx-2", 2, 20);

    std::string etag = storage_->store(response.etag, response.metadata, {first, second}, std::nullopt, std::nullopt);
    storage_->store(etag, metadata("one"), {}, 1, std::nullopt);

    EXPECT_EQ(storage_->committedState().balance(), 10);
    EXPECT_EQ(log_->readStreamForward(layout_.main).size(), 1u);
}

TEST_F(PessimisticStorageTest, PrepareAndCommitInOneCall) {
    auto response = storage_->load();
    std::string etag = storage_->store(response.etag, metadata("single"),
                                       {deposit(response.committed_state, "tx", 1, 33)}, 1, std::nullopt);

    EXPECT_NE(etag, response.etag);
    EXPECT_EQ(storage_->committedState().balance(), 33);
    EXPECT_FALSE(log_->streamExists(layout_.pending));
}

// pending流不存在时没有可复制的事件，但序号与元数据照常推进
TEST_F(PessimisticStorageTest, CommitWithoutPendingStreamAdvancesSequence) {
    auto response = storage_->load();
    std::string etag = storage_->store(response.etag, metadata("empty"), {}, 3, std::nullopt);

    EXPECT_NE(etag, response.etag);
    EXPECT_EQ(storage_->committedSequenceId(), 3);
    EXPECT_FALSE(log_->streamExists(layout_.main));
    EXPECT_EQ(MetadataStore(*log_).load(layout_.metadata).sequence_id, 3);
}

TEST_F(PessimisticStorageTest, AbortDeletesPendingStream) {
    auto response = storage_->load();
    std::string etag = storage_->store(response.etag, response.metadata,
                                       {deposit(response.committed_state, "tx", 1, 10)}, std::nullopt, std::nullopt);
    ASSERT_TRUE(log_->streamExists(layout_.pending));

    etag = storage_->store(etag, response.metadata, {}, std::nullopt, 0);
    EXPECT_FALSE(log_->streamExists(layout_.pending));
    EXPECT_FALSE(log_->streamExists(layout_.main));

    // pending流已经不存在时再次中止也不会失败
    EXPECT_NO_THROW(storage_->store(etag, response.metadata, {}, std::nullopt, 0));
    EXPECT_TRUE(makeStorage()->load().pending_states.empty());
}

TEST_F(PessimisticStorageTest, StaleETagIsRejected) {
    auto response = storage_->load();
    EXPECT_THROW(storage_->store("stale", response.metadata, {deposit(response.committed_state, "tx", 1, 10)},
                                 std::nullopt, std::nullopt),
                 ETagMismatchException);
    EXPECT_FALSE(log_->streamExists(layout_.pending));
}

TEST_F(PessimisticStorageTest, ReloadReproducesCommittedState) {
    auto response = storage_->load();
    auto md = metadata("durable");
    std::string etag = storage_->store(response.etag, md, {deposit(response.committed_state, "tx-1", 1, 40)},
                                       1, std::nullopt);
    storage_->store(etag, md, {deposit(storage_->committedState(), "tx-2", 2, 2)}, 2, std::nullopt);

    auto reloaded = makeStorage()->load();
    EXPECT_EQ(reloaded.committed_state.balance(), 42);
    EXPECT_EQ(reloaded.committed_sequence_id, 2);
    EXPECT_EQ(reloaded.metadata, md);
    EXPECT_TRUE(reloaded.pending_states.empty());
}

// 无法解码的事务标记：宽松策略跳过，严格策略失败
TEST_F(PessimisticStorageTest, UnreadablePendingTag) {
    log_->appendToStream(layout_.pending, ExpectedRevision::any(),
                         {EventData("1", MoneyDepositedEvent::TYPE, MoneyDepositedEvent(1).encode(), "garbage"),
                          EventData("2", MoneyDepositedEvent::TYPE, MoneyDepositedEvent(2).encode(), tag("ok", 1))});

    RecordFields overflowing;
    overflowing.set("transaction_id", "huge").set("sequence_id", "99999999999999999999");
    log_->appendToStream(layout_.pending, ExpectedRevision::any(),
                         {EventData("3", MoneyDepositedEvent::TYPE, MoneyDepositedEvent(3).encode(),
                                    overflowing.encode())});

    auto lenient = storage_->load();
    ASSERT_EQ(lenient.pending_states.size(), 1u);
    EXPECT_EQ(lenient.pending_states[0].transaction_id, "ok");

    EXPECT_THROW(makeStorage(ReplayPolicy::STRICT)->load(), CodecException);
}
