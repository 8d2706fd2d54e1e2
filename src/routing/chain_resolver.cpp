#include "cypherpunk/routing/chain_resolver.hpp"
#include "cypherpunk/core/format.hpp"
#include "cypherpunk/debug/chain_logger.hpp"

#include <algorithm>
#include <iterator>

namespace cypherpunk::remailer::routing {
using directory::Capability;
using directory::RequiredCapability;

namespace {
    using ResolveResult = Result<ResolvedChain, RemailerFailure>;

    bool AlreadyChosen(const std::vector<RecordPtr>& chosen, const RecordPtr& candidate) {
        return std::find(chosen.begin(), chosen.end(), candidate) != chosen.end();
    }
}

std::vector<std::string> ResolvedChain::HopNames() const {
    std::vector<std::string> names;
    names.reserve(hops.size());
    for (const auto& hop : hops) {
        names.push_back(hop->name);
    }
    return names;
}

ChainResolver::ChainResolver(configuration::ChainConfig config)
    : config_(std::move(config)) {}

Result<ResolvedChain, RemailerFailure> ChainResolver::Resolve(
    const ChainSpec& spec,
    const directory::RemailerDirectory& directory,
    interfaces::IRandomSource& rng) const {

    if (spec.Empty()) {
        return ResolveResult::Err(RemailerFailure::EmptyChain());
    }
    if (spec.Length() > config_.GetMaxChainLength()) {
        return ResolveResult::Err(
            RemailerFailure::ChainTooLong(spec.Length(), config_.GetMaxChainLength()));
    }

    ResolvedChain chain;
    chain.hops.reserve(spec.Length());
    const auto& tokens = spec.Tokens();
    for (size_t position = 0; position < tokens.size(); ++position) {
        const Capability required = RequiredCapability(position + 1 == tokens.size());
        const auto& token = tokens[position];

        if (!token.IsWildcard()) {
            auto lookup = directory.Lookup(token.name);
            if (lookup.IsErr()) {
                return ResolveResult::Err(std::move(lookup).UnwrapErr());
            }
            auto record = std::move(lookup).Unwrap();
            if (!record->Supports(required)) {
                return ResolveResult::Err(
                    RemailerFailure::CapabilityMismatch(record->name, position, directory::ToString(required)));
            }
            chain.hops.push_back(std::move(record));
            continue;
        }

        const auto eligible = directory.Eligible(required, config_.GetMinUptime());
        if (eligible.empty()) {
            return ResolveResult::Err(
                RemailerFailure::NoEligibleRemailer(position, directory::ToString(required)));
        }
        std::vector<RecordPtr> candidates;
        candidates.reserve(eligible.size());
        std::copy_if(eligible.begin(), eligible.end(), std::back_inserter(candidates),
                     [&chain](const RecordPtr& record) { return !AlreadyChosen(chain.hops, record); });
        const bool repeated = candidates.empty();
        if (repeated) {
            candidates = eligible;
            chain.degraded = true;
        }

        const uint32_t draw = rng.Uniform(static_cast<uint32_t>(candidates.size()));
        if (draw >= candidates.size()) {
            return ResolveResult::Err(RemailerFailure::Generic(
                compat::format("Random source returned {} for a draw below {}", draw, candidates.size())));
        }
        debug::LogWildcardDraw(position, candidates.size(), candidates[draw]->name, repeated);
        chain.hops.push_back(candidates[draw]);
    }

    debug::LogChainResolved(chain.HopNames(), chain.degraded);
    return ResolveResult::Ok(std::move(chain));
}

}
