#pragma once

#include "evtx_event.hpp"
#include "evtx_event_sourced_state.hpp"
#include "../evtx_errors.hpp"
#include "../evtx_logger.hpp"
#include <type_traits>
#include <vector>

namespace evtx {

template<typename TState>
struct IsEventSourced : std::is_base_of<EventSourcedState, TState> {};

// 未使用事件溯源的状态类型的退化路径：整个新状态作为一个事件
// 状态类型需要提供 encode()、static decode() 与 copyFrom()
template<typename TState>
class StateChangedEvent : public Event {
public:
    explicit StateChangedEvent(const TState& new_state, Timestamp occurred_at = Utils::getCurrentTime())
        : Event(occurred_at), new_state_(new_state) {}

    static std::string eventTypeName() { return TState::typeName() + "Changed"; }

    std::string typeName() const override { return eventTypeName(); }

    const TState& newState() const { return new_state_; }

    static std::shared_ptr<const StateChangedEvent> decode(const std::string& payload) {
        RecordFields fields = RecordFields::decode(payload);
        return std::make_shared<const StateChangedEvent>(TState::decode(fields.get("state")), occurredAtOf(fields));
    }

protected:
    void encodeFields(RecordFields& fields) const override {
        fields.set("state", new_state_.encode());
    }

private:
    TState new_state_;
};

// 事件溯源适配器：把状态的待提交事件转换为持久化事件，并把持久化事件回放到状态上
template<typename TState>
class EventAdapter {
    static_assert(std::is_default_constructible<TState>::value, "state type must be default constructible");
    static_assert(std::is_copy_constructible<TState>::value, "state type must be copy constructible");

public:
    explicit EventAdapter(ReplayPolicy policy = ReplayPolicy::LENIENT) : policy_(policy) {}

    ReplayPolicy policy() const { return policy_; }

    // 自上次重置以来被跳过的事件数
    size_t skippedEvents() const { return skipped_events_; }
    void resetSkippedEvents() { skipped_events_ = 0; }

    // 计算proposed相对committed需要持久化的领域事件
    // 事件溯源状态直接取出待提交列表；其他状态退化为一个整体变更事件
    std::vector<DomainEvent> computeDomainEvents(const TState& /*committed*/, const TState& proposed) const {
        std::vector<DomainEvent> events;
        if constexpr (IsEventSourced<TState>::value) {
            events.reserve(proposed.pendingEvents().size());
            for (const auto& event : proposed.pendingEvents()) {
                events.emplace_back(event);
            }
        } else {
            events.emplace_back(std::make_shared<const StateChangedEvent<TState>>(proposed));
        }
        return events;
    }

    // 提交后清空状态上的待提交事件
    static void resetPendingEvents(TState& state) {
        if constexpr (IsEventSourced<TState>::value) {
            state.clearPendingEvents();
        } else {
            (void)state;
        }
    }

    // 生成写入日志的事件，metadata为空表示不携带事务元数据
    static EventData toEventData(const DomainEvent& event, const std::string& metadata = "") {
        return EventData(Utils::generateUuid(), event.event_type, event.data->encode(), metadata);
    }

    // 把一个持久化事件应用到状态上
    // 宽松策略下失败的事件记录警告后跳过并返回false；严格策略下抛出ReplayException
    bool apply(TState& state, const std::string& event_type, const std::string& payload) {
        try {
            applyOrThrow(state, event_type, payload);
            return true;
        } catch (const std::exception& e) {
            if (policy_ == ReplayPolicy::STRICT) {
                EVTX_LOG_ERROR("Failed to apply event ", event_type, ": ", e.what());
                throw ReplayException(event_type, e.what());
            }
            ++skipped_events_;
            EVTX_LOG_WARNING("Failed to apply event ", event_type, ", skipping: ", e.what());
            return false;
        }
    }

    bool apply(TState& state, const EventData& event) {
        return apply(state, event.event_type, event.data);
    }

private:
    static void applyOrThrow(TState& state, const std::string& event_type, const std::string& payload) {
        if constexpr (IsEventSourced<TState>::value) {
            EventPtr event = TState::decodeEvent(event_type, payload);
            if (!event) {
                throw CodecException("unknown event type '" + event_type + "' for " + TState::typeName());
            }
            state.apply(*event);
        } else {
            if (event_type != StateChangedEvent<TState>::eventTypeName()) {
                throw CodecException("unknown event type '" + event_type + "' for " + TState::typeName());
            }
            auto changed = StateChangedEvent<TState>::decode(payload);
            state.copyFrom(changed->newState());
        }
    }

    ReplayPolicy policy_;
    size_t skipped_events_ = 0;
};

} // namespace evtx
