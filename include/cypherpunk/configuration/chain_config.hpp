#pragma once

#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/core/failures.hpp"
#include "cypherpunk/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace cypherpunk::remailer::configuration {

/// Output representation selected for a finished routing result.
enum class OutputFormat : uint8_t {
    /// Type I block: "::" remailer headers, optional "##" block, ciphertext
    Native = 0,
    /// mailto: URI with the native block percent-encoded into ?body=
    Mailto = 1,
    /// RFC 5322 message file wrapping the native block
    Eml = 2
};

/// Tunables for chain resolution, envelope construction and output.
///
/// Mirrors the value-type style of the protocol configuration: construct
/// through a factory, refine with With* copies, query with accessors.
///
/// @example
/// ```cpp
/// auto config = ChainConfig::Reliable()
///     .WithMaxChainLength(5)
///     .WithHopLatency(std::chrono::minutes(90));
/// ```
class ChainConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Limits from the original command-line tool: up to 8 hops, any uptime.
    [[nodiscard]] static ChainConfig Default() {
        return ChainConfig();
    }

    /// Wildcards only draw remailers with at least 95% reported uptime.
    ///
    /// Literal chain entries are never filtered on uptime; naming a remailer
    /// explicitly is taken as the sender's decision.
    [[nodiscard]] static ChainConfig Reliable() {
        return Default().WithMinUptime(ChainLimits::RELIABLE_MIN_UPTIME);
    }

    // =========================================================================
    // Builders
    // =========================================================================

    [[nodiscard]] ChainConfig WithMaxChainLength(const size_t length) const {
        ChainConfig copy = *this;
        copy.max_chain_length_ = length;
        return copy;
    }

    [[nodiscard]] ChainConfig WithMaxRedundancy(const size_t redundancy) const {
        ChainConfig copy = *this;
        copy.max_redundancy_ = redundancy;
        return copy;
    }

    [[nodiscard]] ChainConfig WithMinUptime(const double percent) const {
        ChainConfig copy = *this;
        copy.min_uptime_percent_ = percent;
        return copy;
    }

    /// Adds "Latent-Time: +H:MM" to every forwarding hop's remailer block.
    [[nodiscard]] ChainConfig WithHopLatency(const std::chrono::minutes latency) const {
        ChainConfig copy = *this;
        copy.hop_latency_ = latency;
        return copy;
    }

    [[nodiscard]] ChainConfig WithDefaultFormat(const OutputFormat format) const {
        ChainConfig copy = *this;
        copy.default_format_ = format;
        return copy;
    }

    [[nodiscard]] ChainConfig WithEmlFrom(std::string from) const {
        ChainConfig copy = *this;
        copy.eml_from_ = std::move(from);
        return copy;
    }

    [[nodiscard]] ChainConfig WithEmlSubject(std::string subject) const {
        ChainConfig copy = *this;
        copy.eml_subject_ = std::move(subject);
        return copy;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] size_t GetMaxChainLength() const noexcept { return max_chain_length_; }
    [[nodiscard]] size_t GetMaxRedundancy() const noexcept { return max_redundancy_; }
    [[nodiscard]] double GetMinUptime() const noexcept { return min_uptime_percent_; }
    [[nodiscard]] const std::optional<std::chrono::minutes>& GetHopLatency() const noexcept {
        return hop_latency_;
    }
    [[nodiscard]] OutputFormat GetDefaultFormat() const noexcept { return default_format_; }
    [[nodiscard]] const std::string& GetEmlFrom() const noexcept { return eml_from_; }
    [[nodiscard]] const std::string& GetEmlSubject() const noexcept { return eml_subject_; }

    /// Rejects limits that would make every request fail.
    [[nodiscard]] Result<Unit, RemailerFailure> Validate() const;

    /// Formats the configured hop latency as "+H:MM", the remailer syntax.
    [[nodiscard]] std::optional<std::string> FormatHopLatency() const;

private:
    ChainConfig() = default;

    size_t max_chain_length_ = ChainLimits::DEFAULT_MAX_CHAIN_LENGTH;
    size_t max_redundancy_ = ChainLimits::DEFAULT_MAX_REDUNDANCY;
    double min_uptime_percent_ = 0.0;
    std::optional<std::chrono::minutes> hop_latency_;
    OutputFormat default_format_ = OutputFormat::Native;
    std::string eml_from_ = "nobody@localhost";
    std::string eml_subject_;
};

} // namespace cypherpunk::remailer::configuration
