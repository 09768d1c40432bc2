#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <limits>

namespace evtx {

// 基础类型定义
using Timestamp = std::chrono::system_clock::time_point;
using TransactionId = std::string;
using SequenceId = int64_t;
using Revision = uint64_t;

// 流版本号从1开始，0表示流为空或不存在
const Revision NO_REVISION = 0;
const Revision STREAM_START = 1;
const Revision STREAM_END = std::numeric_limits<Revision>::max();
const size_t READ_ALL = std::numeric_limits<size_t>::max();

// 存储策略枚举
enum class StorageStrategy {
    OPTIMISTIC = 0,   // 内存中prepare，提交时按版本号原子追加
    PESSIMISTIC = 1   // prepare写入共享的pending流，提交时拷贝到主流
};

// 回放失败处理策略
enum class ReplayPolicy {
    LENIENT = 0,      // 记录警告并跳过无法回放的事件
    STRICT = 1        // 直接失败
};

// 日志后端类型
enum class LogBackend {
    MEMORY = 0,
    FILE = 1
};

// 写入事件日志的事件
struct EventData {
    std::string event_id;
    std::string event_type;
    std::string data;
    std::string metadata;   // 事务元数据，主流中的事件必须为空

    EventData() = default;
    EventData(const std::string& id, const std::string& type, const std::string& d, const std::string& m = "")
        : event_id(id), event_type(type), data(d), metadata(m) {}
};

// 从事件日志读出的事件
struct RecordedEvent {
    std::string stream;
    Revision revision = NO_REVISION;
    Timestamp created;
    EventData event;
};

// 追加时的版本前置条件
class ExpectedRevision {
public:
    static ExpectedRevision any() { return ExpectedRevision(true, NO_REVISION); }
    static ExpectedRevision exact(Revision revision) { return ExpectedRevision(false, revision); }

    bool isAny() const { return any_; }
    Revision revision() const { return revision_; }

private:
    ExpectedRevision(bool any, Revision revision) : any_(any), revision_(revision) {}

    bool any_;
    Revision revision_;
};

// 参与者身份（对应宿主中的actor类型与主键）
struct ParticipantContext {
    std::string participant_type;
    std::string participant_key;

    ParticipantContext() = default;
    ParticipantContext(const std::string& type, const std::string& key)
        : participant_type(type), participant_key(key) {}
};

} // namespace evtx

#include "evtx_utils.hpp"
