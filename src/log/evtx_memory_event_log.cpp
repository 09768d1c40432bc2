#include "log/evtx_memory_event_log.hpp"
#include "evtx_errors.hpp"
#include "evtx_logger.hpp"

namespace evtx {

std::vector<RecordedEvent> MemoryEventLog::readStreamForward(const std::string& stream,
                                                             Revision from, size_t max_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        throw StreamNotFoundException(stream);
    }
    return sliceForward(it->second, from, max_count);
}

std::vector<RecordedEvent> MemoryEventLog::readStreamBackward(const std::string& stream,
                                                              Revision from, size_t max_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    if (it == streams_.end()) {
        throw StreamNotFoundException(stream);
    }
    return sliceBackward(it->second, from, max_count);
}

Revision MemoryEventLog::appendToStream(const std::string& stream,
                                        const ExpectedRevision& expected,
                                        const std::vector<EventData>& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(stream);
    Revision current = (it == streams_.end()) ? NO_REVISION : it->second.size();

    checkExpectedRevision(stream, expected, current);
    if (events.empty()) {
        return current;
    }

    std::vector<RecordedEvent>& records = streams_[stream];
    Timestamp now = Utils::getCurrentTime();
    for (const auto& event : events) {
        RecordedEvent record;
        record.stream = stream;
        record.revision = records.size() + 1;
        record.created = now;
        record.event = event;
        records.push_back(std::move(record));
    }

    EVTX_LOG_DEBUG("Appended ", events.size(), " events to ", stream, ", revision ", records.size());
    return records.size();
}

void MemoryEventLog::deleteStream(const std::string& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (streams_.erase(stream) == 0) {
        throw StreamNotFoundException(stream);
    }
}

bool MemoryEventLog::streamExists(const std::string& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.find(stream) != streams_.end();
}

std::vector<std::string> MemoryEventLog::listStreams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(streams_.size());
    for (const auto& entry : streams_) {
        names.push_back(entry.first);
    }
    return names;
}

void MemoryEventLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.clear();
}

} // namespace evtx
