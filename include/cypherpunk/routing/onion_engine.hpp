#pragma once
#include "cypherpunk/configuration/chain_config.hpp"
#include "cypherpunk/envelope/envelope_builder.hpp"
#include "cypherpunk/interfaces/i_encryption_backend.hpp"
#include "cypherpunk/routing/routing_result.hpp"
namespace cypherpunk::remailer::routing {

/**
 * @brief Builds the nested ciphertext for one resolved chain
 *
 * The chain is folded from the exit hop back to the entry hop. The
 * accumulator is the EncryptedLayer produced by the previous step:
 *
 *   exit hop:    envelope(Anon-To: recipient, ## headers, message body)
 *                -> Encrypt(exit key)
 *   hop k:       envelope(Anon-To: address of hop k+1,
 *                         body = "::\nEncrypted: <scheme>\n\n" + layer)
 *                -> Encrypt(key of hop k)
 *
 * The ciphertext of hop 0 is the routing result. Each hop decrypts a block
 * that names only the next hop, never anything further down the chain.
 * A backend error is fatal for the chain and is reported as
 * BackendFailure with the hop name; nothing is retried.
 *
 * The engine keeps no per-chain state, so concurrent EncryptChain calls are
 * safe whenever the backend is.
 */
class OnionEngine {
public:
    [[nodiscard]] static Result<OnionEngine, RemailerFailure> Create(
        interfaces::IEncryptionBackend& backend,
        configuration::ChainConfig config);

    [[nodiscard]] Result<RoutingResult, RemailerFailure> EncryptChain(
        const ResolvedChain& chain,
        const envelope::OutgoingMessage& message) const;

private:
    OnionEngine(interfaces::IEncryptionBackend& backend, configuration::ChainConfig config);

    [[nodiscard]] envelope::HeaderList ForwardingDirectives() const;

    interfaces::IEncryptionBackend* backend_;
    configuration::ChainConfig config_;
};
}
