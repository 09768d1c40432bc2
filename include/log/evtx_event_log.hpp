#pragma once

#include "../evtx_core.hpp"
#include <string>
#include <vector>

namespace evtx {

// 远程只追加事件日志服务的客户端接口
// 约定：
//  - 读取或删除不存在的流抛出StreamNotFoundException
//  - 追加时版本不符抛出WrongExpectedVersionException
//  - ExpectedRevision::exact(0) 表示流必须为空或不存在
//  - 追加空批次不做任何修改，直接返回当前版本
//  - 删除后的流名可以复用，版本从1重新开始
class EventLogClient {
public:
    virtual ~EventLogClient() = default;

    // 从from开始正向读取最多max_count个事件
    virtual std::vector<RecordedEvent> readStreamForward(const std::string& stream,
                                                         Revision from = STREAM_START,
                                                         size_t max_count = READ_ALL) = 0;

    // 从from开始反向读取最多max_count个事件，结果按版本从新到旧排列
    virtual std::vector<RecordedEvent> readStreamBackward(const std::string& stream,
                                                          Revision from = STREAM_END,
                                                          size_t max_count = READ_ALL) = 0;

    // 原子地追加一批事件，返回流的新版本（最后一个事件的版本）
    virtual Revision appendToStream(const std::string& stream,
                                    const ExpectedRevision& expected,
                                    const std::vector<EventData>& events) = 0;

    // 删除整个流
    virtual void deleteStream(const std::string& stream) = 0;

    virtual bool streamExists(const std::string& stream) = 0;

protected:
    // 各实现共用的区间选择与版本检查
    static std::vector<RecordedEvent> sliceForward(const std::vector<RecordedEvent>& events,
                                                   Revision from, size_t max_count);
    static std::vector<RecordedEvent> sliceBackward(const std::vector<RecordedEvent>& events,
                                                    Revision from, size_t max_count);
    static void checkExpectedRevision(const std::string& stream, const ExpectedRevision& expected,
                                      Revision current);
};

} // namespace evtx
