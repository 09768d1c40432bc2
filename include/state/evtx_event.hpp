#pragma once

#include "../evtx_core.hpp"
#include "../codec/evtx_record_fields.hpp"
#include <memory>
#include <string>

namespace evtx {

// 领域事件基类，事件一旦创建即不可修改
class Event {
public:
    explicit Event(Timestamp occurred_at = Utils::getCurrentTime()) : occurred_at_(occurred_at) {}
    virtual ~Event() = default;

    // 回放时用于分派的事件类型名
    virtual std::string typeName() const = 0;

    Timestamp occurredAt() const { return occurred_at_; }

    // 编码为持久化负载，包含发生时间和子类字段
    std::string encode() const {
        RecordFields fields;
        fields.setTimestamp("occurred_at", occurred_at_);
        encodeFields(fields);
        return fields.encode();
    }

protected:
    virtual void encodeFields(RecordFields& fields) const = 0;

    // 子类解码时使用，旧数据没有时间字段时取纪元时间
    static Timestamp occurredAtOf(const RecordFields& fields) {
        return fields.has("occurred_at") ? fields.getTimestamp("occurred_at") : Timestamp();
    }

private:
    Timestamp occurred_at_;
};

using EventPtr = std::shared_ptr<const Event>;

// 待持久化的领域事件
struct DomainEvent {
    std::string event_type;
    EventPtr data;
    Timestamp occurred_at;

    DomainEvent() = default;
    explicit DomainEvent(EventPtr event)
        : event_type(event->typeName()), data(event), occurred_at(event->occurredAt()) {}
};

} // namespace evtx
