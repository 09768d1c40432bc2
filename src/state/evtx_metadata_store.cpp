#include "state/evtx_metadata_store.hpp"
#include "codec/evtx_record_fields.hpp"
#include "evtx_errors.hpp"
#include "evtx_logger.hpp"

namespace evtx {

std::string TransactionalStateMetadata::encode() const {
    RecordFields records;
    for (const auto& entry : commit_records) {
        records.set(entry.first, entry.second);
    }

    RecordFields fields;
    fields.setTimestamp("timestamp", timestamp)
          .set("commit_records", records.encode());
    return fields.encode();
}

TransactionalStateMetadata TransactionalStateMetadata::decode(const std::string& data) {
    RecordFields fields = RecordFields::decode(data);

    TransactionalStateMetadata metadata;
    metadata.timestamp = fields.getTimestamp("timestamp");
    metadata.commit_records = RecordFields::decode(fields.get("commit_records")).entries();
    return metadata;
}

MetadataSnapshot MetadataStore::load(const std::string& stream) const {
    std::vector<RecordedEvent> latest;
    try {
        latest = client_.readStreamBackward(stream, STREAM_END, 1);
    } catch (const StreamNotFoundException&) {
        EVTX_LOG_DEBUG("Metadata stream ", stream, " not found, starting from sequence 0");
        return MetadataSnapshot();
    }

    if (latest.empty()) {
        return MetadataSnapshot();
    }

    // 快照是权威数据，无法解码时直接失败
    RecordFields fields = RecordFields::decode(latest.front().event.data);
    MetadataSnapshot snapshot;
    snapshot.sequence_id = fields.getInt("sequence_id");
    if (fields.has("committed_revision")) {
        int64_t revision = fields.getInt("committed_revision");
        if (revision < 0) {
            throw CodecException("negative committed revision in " + stream);
        }
        snapshot.committed_revision = static_cast<Revision>(revision);
    }
    snapshot.metadata = TransactionalStateMetadata::decode(fields.get("metadata"));
    return snapshot;
}

void MetadataStore::save(const std::string& stream, SequenceId sequence_id,
                         const TransactionalStateMetadata& metadata, Revision committed_revision) {
    RecordFields fields;
    fields.setInt("sequence_id", sequence_id)
          .setInt("committed_revision", static_cast<int64_t>(committed_revision))
          .set("metadata", metadata.encode());

    client_.appendToStream(stream, ExpectedRevision::any(),
                           {EventData(Utils::generateUuid(), SNAPSHOT_EVENT_TYPE, fields.encode())});
    EVTX_LOG_DEBUG("Saved metadata snapshot for ", stream, " at sequence ", sequence_id);
}

} // namespace evtx
