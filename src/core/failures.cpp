#include "cypherpunk/core/failures.hpp"
#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/core/format.hpp"

namespace cypherpunk::remailer {

RemailerFailure RemailerFailure::UnknownRemailer(std::string name) {
    RemailerFailure failure(RemailerFailureType::UnknownRemailer,
                            compat::format("Unknown remailer '{}'", name));
    failure.remailer = std::move(name);
    return failure;
}

RemailerFailure RemailerFailure::CapabilityMismatch(
    std::string name,
    const std::size_t chain_position,
    const std::string_view required) {
    RemailerFailure failure(RemailerFailureType::CapabilityMismatch,
                            compat::format("Remailer '{}' cannot serve position {}: missing {} capability",
                                           name, chain_position, required));
    failure.remailer = std::move(name);
    failure.position = chain_position;
    return failure;
}

RemailerFailure RemailerFailure::EmptyChain() {
    return {RemailerFailureType::EmptyChain, std::string(ErrorMessages::EMPTY_CHAIN)};
}

RemailerFailure RemailerFailure::NoEligibleRemailer(
    const std::size_t chain_position,
    const std::string_view required) {
    RemailerFailure failure(RemailerFailureType::NoEligibleRemailer,
                            compat::format("No remailer with {} capability available for position {}",
                                           required, chain_position));
    failure.position = chain_position;
    return failure;
}

RemailerFailure RemailerFailure::BackendFailure(std::string hop_name, const std::string_view cause) {
    RemailerFailure failure(RemailerFailureType::BackendFailure,
                            compat::format("Encryption to '{}' failed: {}", hop_name, cause));
    failure.remailer = std::move(hop_name);
    return failure;
}

RemailerFailure RemailerFailure::UnsupportedFormat(std::string format_name) {
    return {RemailerFailureType::UnsupportedFormat,
            compat::format("Unsupported output format '{}'", format_name)};
}

RemailerFailure RemailerFailure::ChainTooLong(const std::size_t length, const std::size_t limit) {
    return {RemailerFailureType::ChainTooLong,
            compat::format("Chain of {} remailers exceeds the limit of {}", length, limit)};
}

std::string RemailerFailure::Describe() const {
    std::string description(ToString(type));
    if (position.has_value()) {
        description += compat::format(" at position {}", *position);
    }
    if (remailer.has_value()) {
        description += compat::format(" ({})", *remailer);
    }
    description += ": ";
    description += message;
    return description;
}

std::string_view ToString(const RemailerFailureType type) noexcept {
    switch (type) {
        case RemailerFailureType::UnknownRemailer: return "UnknownRemailer";
        case RemailerFailureType::CapabilityMismatch: return "CapabilityMismatch";
        case RemailerFailureType::EmptyChain: return "EmptyChain";
        case RemailerFailureType::NoEligibleRemailer: return "NoEligibleRemailer";
        case RemailerFailureType::BackendFailure: return "BackendFailure";
        case RemailerFailureType::UnsupportedFormat: return "UnsupportedFormat";
        case RemailerFailureType::ChainTooLong: return "ChainTooLong";
        case RemailerFailureType::InvalidInput: return "InvalidInput";
        case RemailerFailureType::Decode: return "Decode";
        case RemailerFailureType::Encode: return "Encode";
        case RemailerFailureType::Cancelled: return "Cancelled";
        case RemailerFailureType::Generic: return "Generic";
    }
    return "Unknown";
}

}
