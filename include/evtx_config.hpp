#pragma once

#include "evtx_core.hpp"
#include <string>

namespace evtx {

// 存储与命令行工具的配置
// 配置文件每行一个 "key value"，以#开头的行是注释
class StorageConfig {
public:
    StorageStrategy strategy = StorageStrategy::OPTIMISTIC;
    LogBackend log_backend = LogBackend::MEMORY;
    std::string log_dir = "evtx_data";
    ReplayPolicy replay_policy = ReplayPolicy::LENIENT;
    std::string log_level = "info";
    std::string log_file;          // 为空则只输出到控制台
    int64_t minimum_balance = 0;   // 账户余额下限，仅账本工具使用

    // 从文件加载，文件无法打开或取值非法时返回false
    bool loadFromFile(const std::string& config_file);

    // 设置单个配置项，未知的键记录警告后忽略
    bool set(const std::string& key, const std::string& value);
};

} // namespace evtx
