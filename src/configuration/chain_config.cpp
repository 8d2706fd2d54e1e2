#include "cypherpunk/configuration/chain_config.hpp"
#include "cypherpunk/core/format.hpp"

namespace cypherpunk::remailer::configuration {

Result<Unit, RemailerFailure> ChainConfig::Validate() const {
    if (max_chain_length_ == 0) {
        return Result<Unit, RemailerFailure>::Err(
            RemailerFailure::InvalidInput("Maximum chain length must be at least 1"));
    }
    if (max_redundancy_ == 0) {
        return Result<Unit, RemailerFailure>::Err(
            RemailerFailure::InvalidInput("Maximum redundancy must be at least 1"));
    }
    if (min_uptime_percent_ < 0.0 || min_uptime_percent_ > 100.0) {
        return Result<Unit, RemailerFailure>::Err(
            RemailerFailure::InvalidInput(
                compat::format("Minimum uptime {} is outside 0..100", min_uptime_percent_)));
    }
    if (hop_latency_.has_value() && hop_latency_->count() < 0) {
        return Result<Unit, RemailerFailure>::Err(
            RemailerFailure::InvalidInput("Hop latency cannot be negative"));
    }
    if (eml_from_.empty()) {
        return Result<Unit, RemailerFailure>::Err(RemailerFailure::InvalidInput("Eml From address is empty"));
    }
    if (eml_from_.find_first_of("\r\n") != std::string::npos) {
        return Result<Unit, RemailerFailure>::Err(
            RemailerFailure::InvalidInput("Eml From address contains a line break"));
    }
    if (eml_subject_.find_first_of("\r\n") != std::string::npos) {
        return Result<Unit, RemailerFailure>::Err(
            RemailerFailure::InvalidInput("Eml Subject contains a line break"));
    }
    return Result<Unit, RemailerFailure>::Ok(unit);
}

std::optional<std::string> ChainConfig::FormatHopLatency() const {
    if (!hop_latency_.has_value()) {
        return std::nullopt;
    }
    const auto total = hop_latency_->count();
    return compat::format("+{}:{:02}", total / 60, total % 60);
}

}
