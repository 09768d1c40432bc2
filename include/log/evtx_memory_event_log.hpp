#pragma once

#include "evtx_event_log.hpp"
#include <unordered_map>
#include <mutex>

namespace evtx {

// 进程内事件日志，所有存储实例共享一份
class MemoryEventLog : public EventLogClient {
public:
    MemoryEventLog() = default;
    ~MemoryEventLog() override = default;

    std::vector<RecordedEvent> readStreamForward(const std::string& stream,
                                                 Revision from = STREAM_START,
                                                 size_t max_count = READ_ALL) override;
    std::vector<RecordedEvent> readStreamBackward(const std::string& stream,
                                                  Revision from = STREAM_END,
                                                  size_t max_count = READ_ALL) override;
    Revision appendToStream(const std::string& stream,
                            const ExpectedRevision& expected,
                            const std::vector<EventData>& events) override;
    void deleteStream(const std::string& stream) override;
    bool streamExists(const std::string& stream) override;

    // 所有流的名称
    std::vector<std::string> listStreams() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<RecordedEvent>> streams_;
};

} // namespace evtx
