#pragma once

#include "../evtx_core.hpp"
#include <string>
#include <vector>

namespace evtx {

// RESP协议类型
enum class RESPType {
    SIMPLE_STRING = '+',  // +
    ERROR = '-',          // -
    INTEGER = ':',        // :
    BULK_STRING = '$',    // $
    ARRAY = '*'           // *
};

// RESP编解码器，用于事件负载、事务元数据以及文件日志记录的分帧
// 解析失败抛出CodecException
class RESPCodec {
public:
    // 序列化整数
    static std::string serializeInteger(int64_t value);

    // 序列化批量字符串（长度前缀，可包含任意字节）
    static std::string serializeBulkString(const std::string& str);

    // 序列化由批量字符串组成的数组
    static std::string serializeArray(const std::vector<std::string>& array);

    // 从pos开始解析一个数组，成功后pos指向数组之后
    static std::vector<std::string> parseArray(const std::string& data, size_t& pos);
    static std::vector<std::string> parseArray(const std::string& data) {
        size_t pos = 0;
        return parseArray(data, pos);
    }

    // data[pos]之后是否存在一个完整的数组（用于检测文件尾部被截断的记录）
    static bool hasCompleteArray(const std::string& data, size_t pos);

private:
    // 解析批量字符串
    static std::string parseBulkString(const std::string& data, size_t& pos);

    // 跳过CRLF
    static void expectCRLF(const std::string& data, size_t& pos);

    // 读取直到CRLF
    static std::string readUntilCRLF(const std::string& data, size_t& pos);

    static int64_t parseLength(const std::string& text);
};

} // namespace evtx
