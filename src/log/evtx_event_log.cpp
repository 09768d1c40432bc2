#include "log/evtx_event_log.hpp"
#include "evtx_errors.hpp"

namespace evtx {

std::vector<RecordedEvent> EventLogClient::sliceForward(const std::vector<RecordedEvent>& events,
                                                        Revision from, size_t max_count) {
    std::vector<RecordedEvent> result;
    if (from < STREAM_START) {
        from = STREAM_START;
    }
    // 版本与下标一一对应：revision = index + 1
    for (size_t i = static_cast<size_t>(from - 1); i < events.size() && result.size() < max_count; ++i) {
        result.push_back(events[i]);
    }
    return result;
}

std::vector<RecordedEvent> EventLogClient::sliceBackward(const std::vector<RecordedEvent>& events,
                                                         Revision from, size_t max_count) {
    std::vector<RecordedEvent> result;
    if (events.empty() || from < STREAM_START) {
        return result;
    }
    size_t start = from >= events.size() ? events.size() : static_cast<size_t>(from);
    for (size_t i = start; i > 0 && result.size() < max_count; --i) {
        result.push_back(events[i - 1]);
    }
    return result;
}

void EventLogClient::checkExpectedRevision(const std::string& stream, const ExpectedRevision& expected,
                                           Revision current) {
    if (!expected.isAny() && expected.revision() != current) {
        throw WrongExpectedVersionException(stream, expected.revision(), current);
    }
}

} // namespace evtx
