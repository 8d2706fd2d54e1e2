#pragma once
#include "cypherpunk/envelope/envelope.hpp"
#include "cypherpunk/routing/chain_resolver.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
namespace cypherpunk::remailer::routing {

/// One finished copy, ready to be mailed to entry_address.
struct RoutingResult {
    size_t copy_index = 0;
    ResolvedChain resolved_chain;
    std::string entry_address;
    /// Plaintext headers of the outermost block, "Encrypted: <scheme>".
    envelope::HeaderList outer_headers;
    std::vector<uint8_t> ciphertext;
};

struct CopyFailure {
    size_t copy_index = 0;
    RemailerFailure failure;
};

struct RouteReport {
    std::vector<RoutingResult> results;
    std::vector<CopyFailure> failures;

    [[nodiscard]] size_t SuccessCount() const noexcept { return results.size(); }
    [[nodiscard]] bool AllSucceeded() const noexcept { return failures.empty(); }
    [[nodiscard]] bool AnySucceeded() const noexcept { return !results.empty(); }
};
}
