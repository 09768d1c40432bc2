#pragma once

#include "evtx_event_log.hpp"
#include <mutex>
#include <string>

namespace evtx {

// 基于文件的只追加事件日志
// 每个流对应目录下的一个文件，文件内容为连续的RESP记录。
// 与AOF加载一样，尾部被截断的记录会被记录警告并忽略。
// 同一目录在一个进程内只应由一个实例访问。
class FileEventLog : public EventLogClient {
public:
    explicit FileEventLog(const std::string& directory);
    ~FileEventLog() override = default;

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

    const std::string& directory() const { return directory_; }

    // 流名到文件名的转换，非[A-Za-z0-9._-]字符编码为%XX
    static std::string streamFileName(const std::string& stream);

private:
    std::string directory_;
    std::mutex file_mutex_; // 保护文件操作

    std::string streamPath(const std::string& stream) const;

    // 读取流文件中的全部完整记录，文件不存在时抛出StreamNotFoundException
    std::vector<RecordedEvent> loadStream(const std::string& stream, size_t* valid_bytes = nullptr);

    static std::string serializeRecord(const RecordedEvent& record);
    static RecordedEvent parseRecord(const std::string& stream, const std::string& data, size_t& pos);
};

} // namespace evtx
