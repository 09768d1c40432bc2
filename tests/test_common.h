#ifndef EVTX_TEST_COMMON_H
#define EVTX_TEST_COMMON_H

#include "log/evtx_event_log.hpp"
#include "codec/evtx_record_fields.hpp"
#include "evtx_errors.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace evtx {
namespace test {

// 不使用事件溯源的状态，走整体变更事件的退化路径
struct CounterState {
    int64_t value = 0;
    std::string label;

    static std::string typeName() { return "CounterState"; }

    std::string encode() const {
        RecordFields fields;
        fields.setInt("value", value).set("label", label);
        return fields.encode();
    }

    static CounterState decode(const std::string& data) {
        RecordFields fields = RecordFields::decode(data);
        CounterState state;
        state.value = fields.getInt("value");
        state.label = fields.get("label");
        return state;
    }

    void copyFrom(const CounterState& other) {
        value = other.value;
        label = other.label;
    }
};

// 包装真实日志，按需注入追加或删除失败，并统计各流的追加次数
class FaultyEventLog : public EventLogClient {
public:
    explicit FaultyEventLog(std::shared_ptr<EventLogClient> inner) : inner_(std::move(inner)) {}

    // 下一次向stream追加时抛出EventLogIOException
    void failNextAppend(const std::string& stream) { fail_next_append_ = stream; }

    // 下一次删除stream时抛出EventLogIOException
    void failNextDelete(const std::string& stream) { fail_next_delete_ = stream; }

    size_t appendCount(const std::string& stream) const {
        auto it = append_counts_.find(stream);
        return it == append_counts_.end() ? 0 : it->second;
    }

    std::vector<RecordedEvent> readStreamForward(const std::string& stream, Revision from = STREAM_START,
                                                 size_t max_count = READ_ALL) override {
        return inner_->readStreamForward(stream, from, max_count);
    }

    std::vector<RecordedEvent> readStreamBackward(const std::string& stream, Revision from = STREAM_END,
                                                  size_t max_count = READ_ALL) override {
        return inner_->readStreamBackward(stream, from, max_count);
    }

    Revision appendToStream(const std::string& stream, const ExpectedRevision& expected,
                            const std::vector<EventData>& events) override {
        if (!fail_next_append_.empty() && stream == fail_next_append_) {
            fail_next_append_.clear();
            throw EventLogIOException("injected append failure on " + stream);
        }
        ++append_counts_[stream];
        return inner_->appendToStream(stream, expected, events);
    }

    void deleteStream(const std::string& stream) override {
        if (!fail_next_delete_.empty() && stream == fail_next_delete_) {
            fail_next_delete_.clear();
            throw EventLogIOException("injected delete failure on " + stream);
        }
        inner_->deleteStream(stream);
    }

    bool streamExists(const std::string& stream) override { return inner_->streamExists(stream); }

private:
    std::shared_ptr<EventLogClient> inner_;
    std::string fail_next_append_;
    std::string fail_next_delete_;
    std::map<std::string, size_t> append_counts_;
};

// 截断到毫秒，与持久化后的时间戳精度一致
inline Timestamp millisNow() {
    return Utils::millisToTimestamp(Utils::timestampToMillis(Utils::getCurrentTime()));
}

// 每个测试使用独立的临时目录
inline std::string makeTempDir(const std::string& name) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                ("evtx_" + name + "_" + Utils::generateUuid());
    std::filesystem::create_directories(dir);
    return dir.string();
}

} // namespace test
} // namespace evtx

#endif // EVTX_TEST_COMMON_H
