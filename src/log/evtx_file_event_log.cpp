#include "log/evtx_file_event_log.hpp"
#include "codec/evtx_record_fields.hpp"
#include "codec/evtx_resp.hpp"
#include "evtx_errors.hpp"
#include "evtx_logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <cctype>

namespace evtx {

FileEventLog::FileEventLog(const std::string& directory) : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw EventLogIOException("Failed to create event log directory " + directory_ + ": " + ec.message());
    }
    EVTX_LOG_INFO("File event log opened at ", directory_);
}

std::string FileEventLog::streamFileName(const std::string& stream) {
    static const char* hex = "0123456789ABCDEF";
    std::string name;
    for (unsigned char c : stream) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            name += static_cast<char>(c);
        } else {
            name += '%';
            name += hex[c >> 4];
            name += hex[c & 0x0F];
        }
    }
    // 避免与"."和".."冲突
    if (name.empty() || name == "." || name == "..") {
        name = "%" + name;
    }
    return name + ".evlog";
}

std::string FileEventLog::streamPath(const std::string& stream) const {
    return (std::filesystem::path(directory_) / streamFileName(stream)).string();
}

std::vector<RecordedEvent> FileEventLog::readStreamForward(const std::string& stream,
                                                           Revision from, size_t max_count) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    return sliceForward(loadStream(stream), from, max_count);
}

std::vector<RecordedEvent> FileEventLog::readStreamBackward(const std::string& stream,
                                                            Revision from, size_t max_count) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    return sliceBackward(loadStream(stream), from, max_count);
}

Revision FileEventLog::appendToStream(const std::string& stream,
                                      const ExpectedRevision& expected,
                                      const std::vector<EventData>& events) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    const std::string path = streamPath(stream);

    std::vector<RecordedEvent> existing;
    size_t valid_bytes = 0;
    try {
        existing = loadStream(stream, &valid_bytes);
    } catch (const StreamNotFoundException&) {
        // 新流，从版本1开始
    }

    Revision current = existing.size();
    checkExpectedRevision(stream, expected, current);
    if (events.empty()) {
        return current;
    }

    // 丢弃上次崩溃留下的半条记录，避免新记录接在残缺数据之后
    std::error_code ec;
    if (std::filesystem::exists(path, ec) && std::filesystem::file_size(path, ec) != valid_bytes) {
        std::filesystem::resize_file(path, valid_bytes, ec);
        if (ec) {
            throw EventLogIOException("Failed to truncate " + path + ": " + ec.message());
        }
    }

    // 整批事件先序列化再一次写入
    std::string batch;
    Timestamp now = Utils::getCurrentTime();
    Revision revision = current;
    for (const auto& event : events) {
        RecordedEvent record;
        record.stream = stream;
        record.revision = ++revision;
        record.created = now;
        record.event = event;
        batch += serializeRecord(record);
    }

    std::ofstream file(path, std::ios::out | std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        throw EventLogIOException("Failed to open stream file for append: " + path);
    }
    file.write(batch.data(), static_cast<std::streamsize>(batch.size()));
    file.flush();
    if (!file) {
        throw EventLogIOException("Failed to write stream file: " + path);
    }

    EVTX_LOG_DEBUG("Appended ", events.size(), " events to ", stream, ", revision ", revision);
    return revision;
}

void FileEventLog::deleteStream(const std::string& stream) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    std::error_code ec;
    if (!std::filesystem::remove(streamPath(stream), ec)) {
        if (ec) {
            throw EventLogIOException("Failed to delete stream " + stream + ": " + ec.message());
        }
        throw StreamNotFoundException(stream);
    }
}

bool FileEventLog::streamExists(const std::string& stream) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    std::error_code ec;
    return std::filesystem::exists(streamPath(stream), ec);
}

std::vector<RecordedEvent> FileEventLog::loadStream(const std::string& stream, size_t* valid_bytes) {
    const std::string path = streamPath(stream);
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            throw StreamNotFoundException(stream);
        }
        throw EventLogIOException("Failed to open stream file for reading: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::vector<RecordedEvent> records;
    size_t pos = 0;
    while (pos < content.size()) {
        if (!RESPCodec::hasCompleteArray(content, pos)) {
            EVTX_LOG_WARNING("Ignoring truncated record at offset ", pos, " in ", path);
            break;
        }
        RecordedEvent record = parseRecord(stream, content, pos);
        if (record.revision != records.size() + 1) {
            throw CodecException("unexpected revision " + std::to_string(record.revision) + " in " + path);
        }
        records.push_back(std::move(record));
    }

    if (valid_bytes) {
        *valid_bytes = pos;
    }
    return records;
}

std::string FileEventLog::serializeRecord(const RecordedEvent& record) {
    RecordFields fields;
    fields.setInt("revision", static_cast<int64_t>(record.revision))
          .set("id", record.event.event_id)
          .set("type", record.event.event_type)
          .set("data", record.event.data)
          .set("metadata", record.event.metadata)
          .setTimestamp("created", record.created);
    return fields.encode();
}

RecordedEvent FileEventLog::parseRecord(const std::string& stream, const std::string& data, size_t& pos) {
    RecordFields fields = RecordFields::decode(data, pos);

    RecordedEvent record;
    record.stream = stream;
    record.revision = static_cast<Revision>(fields.getInt("revision"));
    record.created = fields.getTimestamp("created");
    record.event.event_id = fields.get("id");
    record.event.event_type = fields.get("type");
    record.event.data = fields.get("data");
    record.event.metadata = fields.get("metadata");
    return record;
}

} // namespace evtx
