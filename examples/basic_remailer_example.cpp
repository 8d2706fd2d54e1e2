/**
 * @file basic_remailer_example.cpp
 * @brief Builds a three-hop chain offline and peels it the way each remailer would
 */

#include "cypherpunk/crypto/sealed_layer_backend.hpp"
#include "cypherpunk/crypto/sodium_interop.hpp"
#include "cypherpunk/crypto/sodium_random_source.hpp"
#include "cypherpunk/envelope/envelope_builder.hpp"
#include "cypherpunk/output/output_formatter.hpp"
#include "cypherpunk/routing/redundancy_multiplexer.hpp"

#include <iostream>
#include <map>

using namespace cypherpunk::remailer;
using namespace cypherpunk::remailer::crypto;
using namespace cypherpunk::remailer::routing;

namespace {
    int Fail(const std::string& step, const RemailerFailure& failure) {
        std::cerr << step << ": " << failure.Describe() << std::endl;
        return 1;
    }
}

int main() {
    std::cout << "=== Cypherpunk Remailer - Basic Chain Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    // Every remailer gets an X25519 key pair; the directory only sees public keys.
    std::cout << "2. Generating remailer keys..." << std::endl;
    std::vector<directory::RemailerRecord> records;
    std::map<std::string, std::vector<uint8_t>> secret_keys;
    for (const std::string name : {"austria", "dizum", "paranoia", "frell"}) {
        auto pair = SodiumInterop::GenerateX25519KeyPair(name);
        if (pair.IsErr()) {
            return Fail("Key generation", pair.UnwrapErr());
        }
        auto [secret_key, public_key] = std::move(pair).Unwrap();
        directory::RemailerRecord record;
        record.name = name;
        record.address = "remailer@" + name + ".example";
        record.key.identifier = record.address;
        record.key.material = std::move(public_key);
        record.capabilities = {directory::Capability::MiddleHop,
                               directory::Capability::FinalDelivery,
                               directory::Capability::Pgp};
        record.uptime_percent = 99.0;
        records.push_back(std::move(record));
        secret_keys.emplace(name, std::move(secret_key));
        std::cout << "   ✓ " << name << std::endl;
    }
    auto directory_result = directory::RemailerDirectory::Create(std::move(records));
    if (directory_result.IsErr()) {
        return Fail("Directory", directory_result.UnwrapErr());
    }
    const auto remailers = std::move(directory_result).Unwrap();
    std::cout << std::endl;

    std::cout << "3. Resolving dizum,*,* and encrypting..." << std::endl;
    auto backend = SealedLayerBackend::Create();
    if (backend.IsErr()) {
        return Fail("Backend", backend.UnwrapErr());
    }
    const auto config = configuration::ChainConfig::Default().WithHopLatency(std::chrono::minutes(45));
    auto engine = OnionEngine::Create(*backend.Unwrap(), config);
    if (engine.IsErr()) {
        return Fail("Engine", engine.UnwrapErr());
    }
    SodiumRandomSource rng;
    const RedundancyMultiplexer multiplexer(remailers, engine.Unwrap(), rng, config);

    envelope::OutgoingMessage message;
    message.recipient = "alice@example.org";
    message.subject = "Hello from nowhere";
    const std::string body = "Nobody on the way knows both ends of this message.\n";
    message.body.assign(body.begin(), body.end());

    auto spec = ChainSpec::Parse({"dizum", "*", "*"});
    if (spec.IsErr()) {
        return Fail("Chain", spec.UnwrapErr());
    }
    auto routed = multiplexer.Route(spec.Unwrap(), message, 1);
    if (routed.IsErr()) {
        return Fail("Route", routed.UnwrapErr());
    }
    const auto report = std::move(routed).Unwrap();
    if (!report.AllSucceeded()) {
        return Fail("Copy", report.failures.front().failure);
    }
    const auto& result = report.results.front();
    std::cout << "   ✓ Chain: " << result.resolved_chain.HopNames()[0] << " -> "
              << result.resolved_chain.HopNames()[1] << " -> "
              << result.resolved_chain.HopNames()[2] << std::endl;
    std::cout << "   ✓ Send to " << result.entry_address << std::endl;
    std::cout << std::endl;
    std::cout << output::OutputFormatter::RenderNative(result) << std::endl;

    // Peel the layers in hop order with each remailer's secret key.
    std::cout << "4. Peeling layers..." << std::endl;
    auto ciphertext = result.ciphertext;
    for (const auto& hop : result.resolved_chain.hops) {
        auto opened = SealedLayerBackend::Open(ciphertext, secret_keys.at(hop->name));
        if (opened.IsErr()) {
            return Fail("Open", opened.UnwrapErr());
        }
        auto layer = envelope::EnvelopeBuilder::Parse(opened.Unwrap());
        if (layer.IsErr()) {
            return Fail("Parse", layer.UnwrapErr());
        }
        const auto& hop_envelope = layer.Unwrap();
        std::cout << "   " << hop->name << " forwards to " << hop_envelope.recipient_directive << std::endl;

        auto inner = envelope::EnvelopeBuilder::ParseBlock(hop_envelope.body);
        const bool forwards = inner.IsOk()
            && !inner.Unwrap().remailer_headers.empty()
            && inner.Unwrap().remailer_headers.front().first == "Encrypted";
        if (!forwards) {
            std::cout << "   Delivered body: "
                      << std::string(hop_envelope.body.begin(), hop_envelope.body.end());
            break;
        }
        ciphertext = std::move(inner).Unwrap().body;
    }

    std::cout << std::endl;
    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
