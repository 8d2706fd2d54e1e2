#include "cypherpunk/routing/redundancy_multiplexer.hpp"
#include "cypherpunk/core/format.hpp"
#include "cypherpunk/debug/chain_logger.hpp"

#include <optional>
#include <system_error>
#include <thread>

namespace cypherpunk::remailer::routing {
namespace {
    using CopyResult = Result<RoutingResult, RemailerFailure>;

    bool IsCancelled(const std::atomic<bool>* cancellation) {
        return cancellation != nullptr && cancellation->load(std::memory_order_acquire);
    }
}

RedundancyMultiplexer::RedundancyMultiplexer(
    const directory::RemailerDirectory& directory,
    const OnionEngine& engine,
    interfaces::IRandomSource& rng,
    configuration::ChainConfig config)
    : directory_(&directory)
    , engine_(&engine)
    , rng_(&rng)
    , config_(config)
    , resolver_(std::move(config)) {}

void RedundancyMultiplexer::SetEventHandler(std::shared_ptr<interfaces::IRoutingEventHandler> handler) {
    event_handler_ = std::move(handler);
}

Result<RoutingResult, RemailerFailure> RedundancyMultiplexer::RunCopy(
    const size_t copy_index,
    const ChainSpec& spec,
    const envelope::OutgoingMessage& message,
    interfaces::IRandomSource& rng,
    const std::atomic<bool>* cancellation) const {

    if (IsCancelled(cancellation)) {
        return CopyResult::Err(RemailerFailure::Cancelled(
            compat::format("Copy {} cancelled before it started", copy_index)));
    }
    auto resolved = resolver_.Resolve(spec, *directory_, rng);
    if (resolved.IsErr()) {
        return CopyResult::Err(std::move(resolved).UnwrapErr());
    }
    if (IsCancelled(cancellation)) {
        return CopyResult::Err(RemailerFailure::Cancelled(
            compat::format("Copy {} cancelled before encryption", copy_index)));
    }
    auto encrypted = engine_->EncryptChain(resolved.Unwrap(), message);
    if (encrypted.IsErr()) {
        return encrypted;
    }
    auto result = std::move(encrypted).Unwrap();
    result.copy_index = copy_index;
    return CopyResult::Ok(std::move(result));
}

std::vector<Result<RoutingResult, RemailerFailure>> RedundancyMultiplexer::RunSequential(
    const ChainSpec& spec,
    const envelope::OutgoingMessage& message,
    const size_t redundancy_count,
    const std::atomic<bool>* cancellation) const {

    std::vector<CopyResult> outcomes;
    outcomes.reserve(redundancy_count);
    for (size_t i = 0; i < redundancy_count; ++i) {
        debug::LogCopyStarted(i, false);
        outcomes.push_back(RunCopy(i, spec, message, *rng_, cancellation));
    }
    return outcomes;
}

std::vector<Result<RoutingResult, RemailerFailure>> RedundancyMultiplexer::RunParallel(
    const ChainSpec& spec,
    const envelope::OutgoingMessage& message,
    const size_t redundancy_count,
    const std::atomic<bool>* cancellation) const {

    std::optional<interfaces::LockedRandomSource> locked;
    interfaces::IRandomSource* rng = rng_;
    if (!rng_->IsThreadSafe()) {
        locked.emplace(*rng_);
        rng = &*locked;
    }

    std::vector<std::optional<CopyResult>> slots(redundancy_count);
    {
        std::vector<std::jthread> workers;
        workers.reserve(redundancy_count);
        for (size_t i = 0; i < redundancy_count; ++i) {
            debug::LogCopyStarted(i, true);
            try {
                workers.emplace_back([this, i, &spec, &message, rng, cancellation, &slots]() {
                    slots[i].emplace(RunCopy(i, spec, message, *rng, cancellation));
                });
            } catch (const std::system_error& e) {
                slots[i].emplace(CopyResult::Err(RemailerFailure::Generic(
                    compat::format("Cannot start worker for copy {}: {}", i, e.what()))));
            }
        }
    }

    std::vector<CopyResult> outcomes;
    outcomes.reserve(redundancy_count);
    for (auto& slot : slots) {
        outcomes.push_back(std::move(*slot));
    }
    return outcomes;
}

Result<RouteReport, RemailerFailure> RedundancyMultiplexer::Route(
    const ChainSpec& spec,
    const envelope::OutgoingMessage& message,
    const size_t redundancy_count,
    const RouteOptions& options) const {

    if (redundancy_count == 0 || redundancy_count > config_.GetMaxRedundancy()) {
        return Result<RouteReport, RemailerFailure>::Err(RemailerFailure::InvalidInput(
            compat::format("Redundancy {} is outside 1..{}", redundancy_count, config_.GetMaxRedundancy())));
    }
    if (spec.Empty()) {
        return Result<RouteReport, RemailerFailure>::Err(RemailerFailure::EmptyChain());
    }
    if (spec.Length() > config_.GetMaxChainLength()) {
        return Result<RouteReport, RemailerFailure>::Err(
            RemailerFailure::ChainTooLong(spec.Length(), config_.GetMaxChainLength()));
    }

    CPK_LOG_SECTION(debug::Stage::Multiplex, "ROUTE");
    CPK_LOG_VALUE(debug::Stage::Multiplex, "ROUTE", "redundancy", redundancy_count);
    auto outcomes = options.parallel
        ? RunParallel(spec, message, redundancy_count, options.cancellation)
        : RunSequential(spec, message, redundancy_count, options.cancellation);

    RouteReport report;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].IsOk()) {
            auto result = std::move(outcomes[i]).Unwrap();
            debug::LogCopyFinished(i, "ok");
            if (event_handler_) {
                event_handler_->OnCopyCompleted(i, result.resolved_chain.HopNames());
            }
            report.results.push_back(std::move(result));
        } else {
            auto failure = std::move(outcomes[i]).UnwrapErr();
            debug::LogCopyFinished(i, ToString(failure.type));
            if (event_handler_) {
                event_handler_->OnCopyFailed(i, failure);
            }
            report.failures.push_back(CopyFailure{i, std::move(failure)});
        }
    }
    return Result<RouteReport, RemailerFailure>::Ok(std::move(report));
}

}
