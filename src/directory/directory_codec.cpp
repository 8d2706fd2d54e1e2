#include "cypherpunk/directory/directory_codec.hpp"
#include "cypherpunk/core/format.hpp"
#include "directory/remailer_directory.pb.h"

namespace cypherpunk::remailer::directory {

proto::directory::DirectorySnapshot
DirectoryCodec::ToProto(const RemailerDirectory& directory,
                        const std::optional<std::string>& last_update) {
    proto::directory::DirectorySnapshot snapshot;
    snapshot.set_version(SNAPSHOT_VERSION);
    if (last_update.has_value()) {
        snapshot.set_last_update(*last_update);
    }
    for (const auto& record : directory.Records()) {
        auto* entry = snapshot.add_remailers();
        entry->set_name(record->name);
        entry->set_address(record->address);
        entry->mutable_key()->set_identifier(record->key.identifier);
        entry->mutable_key()->set_material(record->key.material.data(), record->key.material.size());
        entry->set_capabilities(record->capabilities.ToBits());
        entry->set_latency_seconds(static_cast<uint64_t>(record->latency.count()));
        entry->set_uptime_percent(record->uptime_percent);
    }
    return snapshot;
}

Result<RemailerDirectory, RemailerFailure>
DirectoryCodec::FromProto(const proto::directory::DirectorySnapshot& snapshot) {
    if (snapshot.version() != SNAPSHOT_VERSION) {
        return Result<RemailerDirectory, RemailerFailure>::Err(
            RemailerFailure::Decode(
                compat::format("Unsupported directory snapshot version {}", snapshot.version())));
    }
    std::vector<RemailerRecord> records;
    records.reserve(static_cast<size_t>(snapshot.remailers_size()));
    for (const auto& entry : snapshot.remailers()) {
        RemailerRecord record;
        record.name = entry.name();
        record.address = entry.address();
        record.key.identifier = entry.key().identifier();
        record.key.material.assign(entry.key().material().begin(), entry.key().material().end());
        record.capabilities = CapabilitySet::FromBits(entry.capabilities());
        record.latency = std::chrono::seconds(static_cast<int64_t>(entry.latency_seconds()));
        record.uptime_percent = entry.uptime_percent();
        records.push_back(std::move(record));
    }
    return RemailerDirectory::Create(std::move(records));
}

Result<std::vector<uint8_t>, RemailerFailure>
DirectoryCodec::Serialize(const RemailerDirectory& directory,
                          const std::optional<std::string>& last_update) {
    const auto snapshot = ToProto(directory, last_update);
    std::vector<uint8_t> bytes(snapshot.ByteSizeLong());
    if (!snapshot.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, RemailerFailure>::Err(
            RemailerFailure::Encode("Failed to serialize DirectorySnapshot to protobuf"));
    }
    return Result<std::vector<uint8_t>, RemailerFailure>::Ok(std::move(bytes));
}

Result<RemailerDirectory, RemailerFailure>
DirectoryCodec::Parse(const std::span<const uint8_t> bytes) {
    proto::directory::DirectorySnapshot snapshot;
    if (!snapshot.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<RemailerDirectory, RemailerFailure>::Err(
            RemailerFailure::Decode("Failed to parse DirectorySnapshot from protobuf"));
    }
    return FromProto(snapshot);
}

}
