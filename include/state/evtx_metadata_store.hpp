#pragma once

#include "../evtx_core.hpp"
#include "../log/evtx_event_log.hpp"
#include <map>
#include <string>

namespace evtx {

// 协调者提供的元数据，对存储层不透明
struct TransactionalStateMetadata {
    Timestamp timestamp;
    std::map<std::string, std::string> commit_records;

    std::string encode() const;
    static TransactionalStateMetadata decode(const std::string& data);

    bool operator==(const TransactionalStateMetadata& other) const {
        return timestamp == other.timestamp && commit_records == other.commit_records;
    }
    bool operator!=(const TransactionalStateMetadata& other) const { return !(*this == other); }
};

// 最后一次提交的标记
// committed_revision是写入快照时主流的版本，之后的主流事件尚未被快照确认
struct MetadataSnapshot {
    SequenceId sequence_id = 0;
    Revision committed_revision = NO_REVISION;
    TransactionalStateMetadata metadata;
};

// 元数据流：只追加，最新一条有效
class MetadataStore {
public:
    static constexpr const char* SNAPSHOT_EVENT_TYPE = "MetadataSnapshot";

    explicit MetadataStore(EventLogClient& client) : client_(client) {}

    // 读取最新快照，流不存在时返回{0, 空元数据}
    MetadataSnapshot load(const std::string& stream) const;

    // 追加一条快照
    void save(const std::string& stream, SequenceId sequence_id, const TransactionalStateMetadata& metadata,
              Revision committed_revision = NO_REVISION);

private:
    EventLogClient& client_;
};

} // namespace evtx
