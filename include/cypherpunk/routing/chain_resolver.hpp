#pragma once
#include "cypherpunk/configuration/chain_config.hpp"
#include "cypherpunk/directory/remailer_directory.hpp"
#include "cypherpunk/interfaces/i_random_source.hpp"
#include "cypherpunk/routing/chain_spec.hpp"
#include <string>
#include <vector>
namespace cypherpunk::remailer::routing {
using directory::RecordPtr;

/// Concrete route for one copy; hops[0] is the entry hop, hops.back() the exit.
struct ResolvedChain {
    std::vector<RecordPtr> hops;
    /// A wildcard had to reuse a record already on this chain.
    bool degraded = false;

    [[nodiscard]] size_t Length() const noexcept { return hops.size(); }
    [[nodiscard]] std::vector<std::string> HopNames() const;
};

/**
 * @brief Turns a chain specification into concrete remailer records
 *
 * Positions are checked left to right. The last position needs
 * FinalDelivery, every other position MiddleHop. Literal names are looked up
 * and checked against the positional capability; wildcards are drawn
 * uniformly from the eligible records that meet the configured minimum
 * uptime, skipping records already placed earlier on the same chain. When
 * every eligible record is already on the chain the draw falls back to the
 * whole eligible set and the result is marked degraded.
 *
 * The resolver holds no state between calls. Each call consumes randomness
 * from @p rng only, so one resolver serves all redundancy copies.
 */
class ChainResolver {
public:
    explicit ChainResolver(configuration::ChainConfig config);

    [[nodiscard]] Result<ResolvedChain, RemailerFailure> Resolve(
        const ChainSpec& spec,
        const directory::RemailerDirectory& directory,
        interfaces::IRandomSource& rng) const;

    [[nodiscard]] const configuration::ChainConfig& Config() const noexcept { return config_; }

private:
    configuration::ChainConfig config_;
};
}
