#include "codec/evtx_record_fields.hpp"
#include "codec/evtx_resp.hpp"
#include "evtx_errors.hpp"
#include <stdexcept>
#include <vector>

namespace evtx {

RecordFields& RecordFields::set(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
}

RecordFields& RecordFields::setInt(const std::string& key, int64_t value) {
    fields_[key] = Utils::intToString(value);
    return *this;
}

RecordFields& RecordFields::setTimestamp(const std::string& key, Timestamp value) {
    return setInt(key, Utils::timestampToMillis(value));
}

bool RecordFields::has(const std::string& key) const {
    return fields_.find(key) != fields_.end();
}

const std::string& RecordFields::get(const std::string& key) const {
    auto it = fields_.find(key);
    if (it == fields_.end()) {
        throw CodecException("missing field '" + key + "'");
    }
    return it->second;
}

int64_t RecordFields::getInt(const std::string& key) const {
    const std::string& value = get(key);
    if (!Utils::isNumeric(value)) {
        throw CodecException("field '" + key + "' is not an integer: '" + value + "'");
    }
    try {
        return std::stoll(value);
    } catch (const std::out_of_range&) {
        throw CodecException("field '" + key + "' is out of range: '" + value + "'");
    }
}

Timestamp RecordFields::getTimestamp(const std::string& key) const {
    return Utils::millisToTimestamp(getInt(key));
}

std::string RecordFields::getOr(const std::string& key, const std::string& default_value) const {
    auto it = fields_.find(key);
    return it == fields_.end() ? default_value : it->second;
}

std::string RecordFields::encode() const {
    std::vector<std::string> parts;
    parts.reserve(fields_.size() * 2);
    for (const auto& entry : fields_) {
        parts.push_back(entry.first);
        parts.push_back(entry.second);
    }
    return RESPCodec::serializeArray(parts);
}

RecordFields RecordFields::decode(const std::string& data) {
    size_t pos = 0;
    RecordFields fields = decode(data, pos);
    if (pos != data.length()) {
        throw CodecException("trailing bytes after record at offset " + std::to_string(pos));
    }
    return fields;
}

RecordFields RecordFields::decode(const std::string& data, size_t& pos) {
    std::vector<std::string> parts = RESPCodec::parseArray(data, pos);
    if (parts.size() % 2 != 0) {
        throw CodecException("record has an odd number of elements");
    }

    RecordFields fields;
    for (size_t i = 0; i < parts.size(); i += 2) {
        fields.fields_[parts[i]] = parts[i + 1];
    }
    return fields;
}

} // namespace evtx
