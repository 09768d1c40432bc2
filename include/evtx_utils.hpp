#pragma once

#include <string>
#include <chrono>
#include "evtx_core.hpp"

namespace evtx {

// 工具函数
class Utils {
public:
    // 获取当前时间戳
    static Timestamp getCurrentTime();

    // 时间戳与毫秒数互转（毫秒数从Unix纪元开始）
    static int64_t timestampToMillis(Timestamp ts);
    static Timestamp millisToTimestamp(int64_t millis);

    // 生成随机的UUID格式字符串，用于ETag、事件ID与事务ID
    static std::string generateUuid();

    // 检查字符串是否为数字
    static bool isNumeric(const std::string& str);

    // 字符串转整数，非法输入抛出std::invalid_argument
    static int64_t stringToInt(const std::string& str);

    // 整数转字符串
    static std::string intToString(int64_t value);

    // 枚举与字符串互转
    static std::string strategyToString(StorageStrategy strategy);
    static bool stringToStrategy(const std::string& str, StorageStrategy& strategy);
    static std::string replayPolicyToString(ReplayPolicy policy);
    static bool stringToReplayPolicy(const std::string& str, ReplayPolicy& policy);
    static bool stringToLogBackend(const std::string& str, LogBackend& backend);
};

} // namespace evtx
