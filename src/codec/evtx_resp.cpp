#include "codec/evtx_resp.hpp"
#include "evtx_errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace evtx {

// RESPCodec 实现

std::string RESPCodec::serializeInteger(int64_t value) {
    return ":" + std::to_string(value) + "\r\n";
}

std::string RESPCodec::serializeBulkString(const std::string& str) {
    return "$" + std::to_string(str.length()) + "\r\n" + str + "\r\n";
}

std::string RESPCodec::serializeArray(const std::vector<std::string>& array) {
    std::string result = "*" + std::to_string(array.size()) + "\r\n";
    for (const auto& item : array) {
        result += serializeBulkString(item);
    }
    return result;
}

std::vector<std::string> RESPCodec::parseArray(const std::string& data, size_t& pos) {
    if (pos >= data.length() || data[pos] != static_cast<char>(RESPType::ARRAY)) {
        throw CodecException("expected array at offset " + std::to_string(pos));
    }

    pos++; // 跳过 '*'
    int64_t count = parseLength(readUntilCRLF(data, pos));

    std::vector<std::string> result;
    // 每个元素至少占用几个字节，长度前缀不可信
    result.reserve(std::min(static_cast<size_t>(count), data.length() - pos));

    for (int64_t i = 0; i < count; i++) {
        if (pos >= data.length()) {
            throw CodecException("array truncated after " + std::to_string(i) + " of " +
                                 std::to_string(count) + " elements");
        }

        switch (static_cast<RESPType>(data[pos])) {
            case RESPType::BULK_STRING:
                result.push_back(parseBulkString(data, pos));
                break;
            case RESPType::SIMPLE_STRING:
            case RESPType::INTEGER:
                pos++;
                result.push_back(readUntilCRLF(data, pos));
                break;
            default:
                throw CodecException("unsupported element type '" + std::string(1, data[pos]) + "'");
        }
    }

    return result;
}

bool RESPCodec::hasCompleteArray(const std::string& data, size_t pos) {
    try {
        parseArray(data, pos);
        return true;
    } catch (const CodecException&) {
        return false;
    }
}

std::string RESPCodec::parseBulkString(const std::string& data, size_t& pos) {
    pos++; // 跳过 '$'
    int64_t length = parseLength(readUntilCRLF(data, pos));

    if (pos + static_cast<size_t>(length) + 2 > data.length()) {
        throw CodecException("bulk string truncated at offset " + std::to_string(pos));
    }

    std::string result = data.substr(pos, static_cast<size_t>(length));
    pos += static_cast<size_t>(length);
    expectCRLF(data, pos);

    return result;
}

void RESPCodec::expectCRLF(const std::string& data, size_t& pos) {
    if (pos + 1 < data.length() && data[pos] == '\r' && data[pos + 1] == '\n') {
        pos += 2;
        return;
    }
    throw CodecException("missing CRLF at offset " + std::to_string(pos));
}

std::string RESPCodec::readUntilCRLF(const std::string& data, size_t& pos) {
    size_t end = data.find("\r\n", pos);
    if (end == std::string::npos) {
        throw CodecException("unterminated line at offset " + std::to_string(pos));
    }

    std::string result = data.substr(pos, end - pos);
    pos = end + 2;
    return result;
}

int64_t RESPCodec::parseLength(const std::string& text) {
    if (text.empty() || text[0] == '-' || !Utils::isNumeric(text)) {
        throw CodecException("invalid length '" + text + "'");
    }
    try {
        return std::stoll(text);
    } catch (const std::out_of_range&) {
        throw CodecException("length out of range '" + text + "'");
    }
}

} // namespace evtx
