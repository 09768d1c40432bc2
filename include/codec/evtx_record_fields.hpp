#pragma once

#include "../evtx_core.hpp"
#include <map>
#include <string>

namespace evtx {

// 键值字段记录，编码为键与值交替排列的RESP数组
// 事件负载、事务元数据、元数据快照和文件日志记录都使用这种格式
class RecordFields {
public:
    RecordFields() = default;

    RecordFields& set(const std::string& key, const std::string& value);
    RecordFields& setInt(const std::string& key, int64_t value);
    RecordFields& setTimestamp(const std::string& key, Timestamp value);

    bool has(const std::string& key) const;

    // 字段缺失或格式错误时抛出CodecException
    const std::string& get(const std::string& key) const;
    int64_t getInt(const std::string& key) const;
    Timestamp getTimestamp(const std::string& key) const;

    std::string getOr(const std::string& key, const std::string& default_value) const;

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    const std::map<std::string, std::string>& entries() const { return fields_; }

    std::string encode() const;
    static RecordFields decode(const std::string& data);
    // 从pos处解码，成功后pos指向记录之后
    static RecordFields decode(const std::string& data, size_t& pos);

private:
    std::map<std::string, std::string> fields_;
};

} // namespace evtx
