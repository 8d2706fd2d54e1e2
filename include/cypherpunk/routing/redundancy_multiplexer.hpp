#pragma once
#include "cypherpunk/interfaces/i_random_source.hpp"
#include "cypherpunk/interfaces/i_routing_event_handler.hpp"
#include "cypherpunk/routing/chain_resolver.hpp"
#include "cypherpunk/routing/onion_engine.hpp"
#include <atomic>
#include <memory>
namespace cypherpunk::remailer::routing {

struct RouteOptions {
    /// Run every copy on its own thread.
    bool parallel = false;
    /// Copies that have not started when this becomes true are reported as Cancelled.
    const std::atomic<bool>* cancellation = nullptr;
};

/**
 * @brief Produces N independently routed copies of one message
 *
 * Every copy resolves the chain afresh, so wildcard positions are drawn
 * independently, and is then encrypted by the onion engine. A failing copy
 * never stops its siblings; the report lists the successful results in copy
 * order next to the (copy index, failure) pairs of the rest.
 *
 * Requests that can never succeed (an empty chain, one longer than the
 * configured limit, or a copy count outside 1..max redundancy) fail the
 * whole call instead of producing N identical copy failures.
 *
 * In parallel mode a random source that is not thread-safe is wrapped in a
 * LockedRandomSource for the duration of the call. Event handler callbacks
 * are made from the calling thread, in copy order, once each copy's outcome
 * is known.
 */
class RedundancyMultiplexer {
public:
    RedundancyMultiplexer(
        const directory::RemailerDirectory& directory,
        const OnionEngine& engine,
        interfaces::IRandomSource& rng,
        configuration::ChainConfig config);

    void SetEventHandler(std::shared_ptr<interfaces::IRoutingEventHandler> handler);

    [[nodiscard]] Result<RouteReport, RemailerFailure> Route(
        const ChainSpec& spec,
        const envelope::OutgoingMessage& message,
        size_t redundancy_count,
        const RouteOptions& options = {}) const;

private:
    [[nodiscard]] Result<RoutingResult, RemailerFailure> RunCopy(
        size_t copy_index,
        const ChainSpec& spec,
        const envelope::OutgoingMessage& message,
        interfaces::IRandomSource& rng,
        const std::atomic<bool>* cancellation) const;

    [[nodiscard]] std::vector<Result<RoutingResult, RemailerFailure>> RunSequential(
        const ChainSpec& spec,
        const envelope::OutgoingMessage& message,
        size_t redundancy_count,
        const std::atomic<bool>* cancellation) const;

    [[nodiscard]] std::vector<Result<RoutingResult, RemailerFailure>> RunParallel(
        const ChainSpec& spec,
        const envelope::OutgoingMessage& message,
        size_t redundancy_count,
        const std::atomic<bool>* cancellation) const;

    const directory::RemailerDirectory* directory_;
    const OnionEngine* engine_;
    interfaces::IRandomSource* rng_;
    configuration::ChainConfig config_;
    ChainResolver resolver_;
    std::shared_ptr<interfaces::IRoutingEventHandler> event_handler_;
};
}
