#include "cypherpunk/directory/remailer_directory.hpp"
#include "cypherpunk/core/format.hpp"

#include <algorithm>
#include <cctype>

namespace cypherpunk::remailer::directory {

std::vector<Capability> CapabilitySet::ToList() const {
    std::vector<Capability> list;
    for (const auto capability : ALL_CAPABILITIES) {
        if (Has(capability)) {
            list.push_back(capability);
        }
    }
    return list;
}

std::string_view ToString(const Capability capability) noexcept {
    switch (capability) {
        case Capability::MiddleHop: return "middle-hop";
        case Capability::FinalDelivery: return "final-delivery";
        case Capability::Pgp: return "pgp";
        case Capability::Latent: return "latent";
        case Capability::HeaderPasting: return "header-pasting";
        case Capability::Post: return "post";
    }
    return "unknown";
}

std::string RemailerDirectory::NormalizeName(const std::string_view name) {
    std::string normalized(name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

Result<RemailerDirectory, RemailerFailure>
RemailerDirectory::Create(std::vector<RemailerRecord> records) {
    RemailerDirectory directory;
    for (auto& record : records) {
        if (record.name.empty()) {
            return Result<RemailerDirectory, RemailerFailure>::Err(
                RemailerFailure::InvalidInput("Remailer record has an empty name"));
        }
        record.name = NormalizeName(record.name);
        if (directory.records_.contains(record.name)) {
            return Result<RemailerDirectory, RemailerFailure>::Err(
                RemailerFailure::InvalidInput(
                    compat::format("Duplicate remailer '{}' in directory", record.name)));
        }
        auto key = record.name;
        directory.records_.emplace(std::move(key),
                                   std::make_shared<const RemailerRecord>(std::move(record)));
    }
    return Result<RemailerDirectory, RemailerFailure>::Ok(std::move(directory));
}

Result<RecordPtr, RemailerFailure> RemailerDirectory::Lookup(const std::string_view name) const {
    const auto it = records_.find(NormalizeName(name));
    if (it == records_.end()) {
        return Result<RecordPtr, RemailerFailure>::Err(
            RemailerFailure::UnknownRemailer(std::string(name)));
    }
    return Result<RecordPtr, RemailerFailure>::Ok(it->second);
}

bool RemailerDirectory::Contains(const std::string_view name) const {
    return records_.contains(NormalizeName(name));
}

std::vector<RecordPtr> RemailerDirectory::Eligible(const Capability capability) const {
    std::vector<RecordPtr> eligible;
    for (const auto& [name, record] : records_) {
        if (record->Supports(capability)) {
            eligible.push_back(record);
        }
    }
    return eligible;
}

std::vector<RecordPtr> RemailerDirectory::Eligible(const Capability capability,
                                                   const double min_uptime) const {
    auto eligible = Eligible(capability);
    std::erase_if(eligible, [min_uptime](const RecordPtr& record) {
        return record->uptime_percent < min_uptime;
    });
    return eligible;
}

std::vector<RecordPtr> RemailerDirectory::Records() const {
    std::vector<RecordPtr> all;
    all.reserve(records_.size());
    for (const auto& [name, record] : records_) {
        all.push_back(record);
    }
    return all;
}

}
