#pragma once

#include "evtx_core.hpp"
#include <stdexcept>
#include <string>

namespace evtx {

// 所有存储异常的基类
class EvtxException : public std::runtime_error {
public:
    explicit EvtxException(const std::string& message) : std::runtime_error(message) {}
};

// 读取或删除不存在的流
class StreamNotFoundException : public EvtxException {
public:
    explicit StreamNotFoundException(const std::string& stream)
        : EvtxException("Stream not found: " + stream), stream_(stream) {}

    const std::string& stream() const { return stream_; }

private:
    std::string stream_;
};

// 追加时版本前置条件不满足
class WrongExpectedVersionException : public EvtxException {
public:
    WrongExpectedVersionException(const std::string& stream, Revision expected, Revision actual)
        : EvtxException("Wrong expected version on stream " + stream +
                        ": expected " + std::to_string(expected) + ", actual " + std::to_string(actual)),
          stream_(stream), expected_(expected), actual_(actual) {}

    const std::string& stream() const { return stream_; }
    Revision expected() const { return expected_; }
    Revision actual() const { return actual_; }

private:
    std::string stream_;
    Revision expected_;
    Revision actual_;
};

// 调用方传入了过期的ETag
class ETagMismatchException : public EvtxException {
public:
    ETagMismatchException(const std::string& expected, const std::string& current)
        : EvtxException("ETag mismatch. Expected: " + expected + ", Current: " + current) {}
};

// 通知协调者中止（并重试）整个事务
class TransactionAbortedException : public EvtxException {
public:
    explicit TransactionAbortedException(const std::string& message) : EvtxException(message) {}
};

// 严格回放策略下无法应用历史事件
class ReplayException : public EvtxException {
public:
    ReplayException(const std::string& event_type, const std::string& reason)
        : EvtxException("Failed to apply event " + event_type + ": " + reason), event_type_(event_type) {}

    const std::string& eventType() const { return event_type_; }

private:
    std::string event_type_;
};

// 记录格式错误
class CodecException : public EvtxException {
public:
    explicit CodecException(const std::string& message) : EvtxException("Codec error: " + message) {}
};

// 文件日志读写失败
class EventLogIOException : public EvtxException {
public:
    explicit EventLogIOException(const std::string& message) : EvtxException(message) {}
};

} // namespace evtx
