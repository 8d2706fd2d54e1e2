#include "cypherpunk/routing/onion_engine.hpp"
#include "cypherpunk/crypto/sodium_interop.hpp"
#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/debug/chain_logger.hpp"

namespace cypherpunk::remailer::routing {
using crypto::SodiumInterop;
using envelope::EncryptedLayer;
using envelope::EnvelopeBuilder;
using envelope::HopRequirement;

namespace {
    using LayerResult = Result<EncryptedLayer, RemailerFailure>;
}

Result<OnionEngine, RemailerFailure> OnionEngine::Create(
    interfaces::IEncryptionBackend& backend,
    configuration::ChainConfig config) {

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<OnionEngine, RemailerFailure>::Err(
            RemailerFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<OnionEngine, RemailerFailure>::Err(std::move(valid).UnwrapErr());
    }
    return Result<OnionEngine, RemailerFailure>::Ok(OnionEngine(backend, std::move(config)));
}

OnionEngine::OnionEngine(interfaces::IEncryptionBackend& backend, configuration::ChainConfig config)
    : backend_(&backend)
    , config_(std::move(config)) {}

envelope::HeaderList OnionEngine::ForwardingDirectives() const {
    envelope::HeaderList directives;
    if (auto latency = config_.FormatHopLatency(); latency.has_value()) {
        directives.emplace_back(std::string(WireFormat::LATENT_TIME), std::move(*latency));
    }
    return directives;
}

Result<RoutingResult, RemailerFailure> OnionEngine::EncryptChain(
    const ResolvedChain& chain,
    const envelope::OutgoingMessage& message) const {

    using RoutingOutcome = Result<RoutingResult, RemailerFailure>;
    if (chain.hops.empty()) {
        return RoutingOutcome::Err(RemailerFailure::EmptyChain());
    }

    const std::string scheme = backend_->Scheme();
    const auto forwarding_directives = ForwardingDirectives();

    auto encrypt_layer = [this](envelope::Envelope hop_envelope, const RecordPtr& hop, const size_t position) {
        auto plaintext = EnvelopeBuilder::Serialize(hop_envelope);
        auto encrypted = backend_->Encrypt(plaintext, hop->key);
        const size_t plaintext_size = plaintext.size();
        for (auto* buffer : {&plaintext, &hop_envelope.body}) {
            if (auto wiped = SodiumInterop::SecureWipe(*buffer); wiped.IsErr()) {
                return LayerResult::Err(RemailerFailure::FromSodiumFailure(wiped.UnwrapErr()));
            }
        }
        if (encrypted.IsErr()) {
            return LayerResult::Err(
                RemailerFailure::BackendFailure(hop->name, encrypted.UnwrapErr().Describe()));
        }
        auto ciphertext = std::move(encrypted).Unwrap();
        debug::LogLayer(hop->name, position, plaintext_size, ciphertext.size());
        return LayerResult::Ok(EncryptedLayer{std::move(ciphertext), hop});
    };

    const size_t exit_position = chain.hops.size() - 1;
    auto final_envelope = EnvelopeBuilder::BuildFinal(message);
    if (final_envelope.IsErr()) {
        return RoutingOutcome::Err(std::move(final_envelope).UnwrapErr());
    }
    auto layer = encrypt_layer(std::move(final_envelope).Unwrap(), chain.hops[exit_position], exit_position);

    for (size_t position = exit_position; position-- > 0 && layer.IsOk();) {
        HopRequirement next_hop;
        next_hop.address = chain.hops[position + 1]->address;
        next_hop.directives = forwarding_directives;
        next_hop.scheme = scheme;

        auto forward = EnvelopeBuilder::BuildForward(layer.Unwrap(), next_hop);
        if (forward.IsErr()) {
            return RoutingOutcome::Err(std::move(forward).UnwrapErr());
        }
        layer = encrypt_layer(std::move(forward).Unwrap(), chain.hops[position], position);
    }
    if (layer.IsErr()) {
        return RoutingOutcome::Err(std::move(layer).UnwrapErr());
    }

    RoutingResult result;
    result.resolved_chain = chain;
    result.entry_address = chain.hops.front()->address;
    result.outer_headers.emplace_back(std::string(WireFormat::ENCRYPTED), scheme);
    result.ciphertext = std::move(layer).Unwrap().ciphertext;
    return RoutingOutcome::Ok(std::move(result));
}

}
