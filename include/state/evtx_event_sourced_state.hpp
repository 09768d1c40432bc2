#pragma once

#include "evtx_event.hpp"
#include <vector>

namespace evtx {

// 事件溯源状态基类
// 派生类需要：
//   - 实现 apply(const Event&)，按事件子类型更新字段
//   - 提供 static std::string typeName()
//   - 提供 static EventPtr decodeEvent(const std::string& type, const std::string& payload)
// 业务逻辑只通过 append 修改状态。
class EventSourcedState {
public:
    virtual ~EventSourcedState() = default;

    // 按事件类型更新状态，提交后回放与业务写入都经过这里
    virtual void apply(const Event& event) = 0;

    // 应用事件并记入待提交列表
    void append(EventPtr event) {
        apply(*event);
        pending_events_.push_back(std::move(event));
    }

    const std::vector<EventPtr>& pendingEvents() const { return pending_events_; }

    void clearPendingEvents() { pending_events_.clear(); }

protected:
    EventSourcedState() = default;
    EventSourcedState(const EventSourcedState&) = default;
    EventSourcedState(EventSourcedState&&) = default;
    EventSourcedState& operator=(const EventSourcedState&) = default;
    EventSourcedState& operator=(EventSourcedState&&) = default;

private:
    std::vector<EventPtr> pending_events_;
};

} // namespace evtx
