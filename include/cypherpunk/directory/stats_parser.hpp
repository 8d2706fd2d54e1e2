#pragma once
#include "cypherpunk/directory/remailer_record.hpp"
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace cypherpunk::remailer::directory {
struct StatsReport {
    std::vector<RemailerRecord> records;
    std::optional<std::string> last_update;
};

/**
 * @brief Parser for published remailer statistics ("rlist.txt")
 *
 * Two kinds of lines are understood:
 *
 *   $remailer{"dizum"} = "<remailer@dizum.com> cpunk mix pgp hash latent";
 *   dizum    remailer@dizum.com    ++++++++++++    21:15  99.99%
 *
 * The first gives the address and option words, the second latency and
 * uptime. Either may appear alone; records are merged by name. Keys are not
 * part of the stats file, so every record leaves with KeyHandle::identifier
 * set to its address and empty key material.
 */
class StatsParser {
public:
    [[nodiscard]] static Result<StatsReport, RemailerFailure> Parse(std::string_view text);

    /**
     * @brief Maps rlist option words to capabilities
     *
     * "cpunk" marks a Type I remailer, which can forward (MiddleHop) and,
     * unless it also advertises "middle", deliver (FinalDelivery). Both need
     * "pgp" since every layer is encrypted.
     */
    [[nodiscard]] static CapabilitySet CapabilitiesFromOptions(const std::vector<std::string>& options);

    /// "[H:]MM:SS" -> seconds; nullopt when the text does not match.
    [[nodiscard]] static std::optional<std::chrono::seconds> ParseLatency(std::string_view text);

    /**
     * @brief Loads "<key_dir>/<name><extension>" into each record's key material
     *
     * Records without a key file are left untouched; an unreadable file fails
     * the whole call. Returns the number of records that received a key.
     */
    [[nodiscard]] static Result<size_t, RemailerFailure> AttachKeys(
        std::vector<RemailerRecord>& records,
        const std::filesystem::path& key_dir,
        std::string_view extension);

private:
    StatsParser() = delete;
};
}
