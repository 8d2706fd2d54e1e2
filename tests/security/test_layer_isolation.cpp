#include <catch2/catch_test_macros.hpp>
#include "cypherpunk/crypto/sealed_layer_backend.hpp"
#include "cypherpunk/output/output_formatter.hpp"
#include "cypherpunk/routing/redundancy_multiplexer.hpp"
#include "helpers/directory_fixtures.hpp"
#include "helpers/layer_peeler.hpp"
#include "helpers/sequence_random_source.hpp"
#include <string>

using namespace cypherpunk::remailer;
using namespace cypherpunk::remailer::routing;
using namespace cypherpunk::remailer::test_helpers;
using configuration::ChainConfig;

namespace {
    constexpr std::string_view RECIPIENT = "whistle@recipient.example";
    constexpr std::string_view SUBJECT = "confidential-subject-line";
    constexpr std::string_view HEADER_VALUE = "private-header-value";
    constexpr std::string_view BODY = "the-secret-body-text\n";

    bool Contains(const std::vector<uint8_t>& haystack, const std::string_view needle) {
        return std::string_view(reinterpret_cast<const char*>(haystack.data()), haystack.size()).find(needle)
            != std::string_view::npos;
    }

    std::vector<uint8_t> OpenRaw(const std::vector<uint8_t>& ciphertext, const std::vector<uint8_t>& secret_key) {
        auto opened = crypto::SealedLayerBackend::Open(ciphertext, secret_key);
        REQUIRE(opened.IsOk());
        return std::move(opened).Unwrap();
    }
}

TEST_CASE("Security - Each layer reveals only the next hop", "[security][isolation]") {
    const std::vector<std::string> names = {"entry", "middle", "exit"};
    auto fixture = SealedDirectory(names);
    auto backend = crypto::SealedLayerBackend::Create();
    REQUIRE(backend.IsOk());
    auto engine = OnionEngine::Create(*backend.Unwrap(), ChainConfig::Default().WithHopLatency(std::chrono::minutes(15)));
    REQUIRE(engine.IsOk());
    SequenceRandomSource rng({0});
    const RedundancyMultiplexer multiplexer(fixture.directory, engine.Unwrap(), rng, ChainConfig::Default());

    envelope::OutgoingMessage message;
    message.recipient = std::string(RECIPIENT);
    message.subject = std::string(SUBJECT);
    message.recipient_headers = {{"X-Private", std::string(HEADER_VALUE)}};
    message.body.assign(BODY.begin(), BODY.end());

    auto routed = multiplexer.Route(ChainSpec::Parse(names).Unwrap(), message, 1);
    REQUIRE(routed.IsOk());
    const auto& result = routed.Unwrap().results.at(0);

    SECTION("Nothing sensitive is visible on the wire") {
        const auto native = output::OutputFormatter::RenderNative(result);
        for (const auto secret : {RECIPIENT, SUBJECT, HEADER_VALUE, std::string_view("the-secret-body")}) {
            REQUIRE(native.find(secret) == std::string::npos);
        }
        REQUIRE(native.find("remailer@middle.example") == std::string::npos);
        REQUIRE(native.find("remailer@exit.example") == std::string::npos);
        REQUIRE(native.find("\n##\n") == std::string::npos);
    }
    SECTION("Eml and mailto renderings leak nothing either") {
        const output::OutputFormatter formatter(ChainConfig::Default());
        for (const auto kind : {configuration::OutputFormat::Eml, configuration::OutputFormat::Mailto}) {
            auto rendered = formatter.Format(result, kind);
            REQUIRE(rendered.IsOk());
            for (const auto secret : {RECIPIENT, SUBJECT, HEADER_VALUE}) {
                REQUIRE(rendered.Unwrap().find(secret) == std::string::npos);
            }
        }
    }
    SECTION("Entry hop sees the middle hop and nothing further") {
        const auto plaintext = OpenRaw(result.ciphertext, fixture.secret_keys.at("entry"));
        REQUIRE(Contains(plaintext, "Anon-To: remailer@middle.example"));
        REQUIRE_FALSE(Contains(plaintext, "remailer@exit.example"));
        REQUIRE_FALSE(Contains(plaintext, RECIPIENT));
        REQUIRE_FALSE(Contains(plaintext, SUBJECT));
        REQUIRE_FALSE(Contains(plaintext, "##"));
    }
    SECTION("Middle hop sees the exit hop and nothing further") {
        const auto entry = PeelSealed(result.ciphertext, fixture.secret_keys.at("entry"));
        const auto inner = UnwrapEncryptedBlock(entry.body).ciphertext;
        const auto plaintext = OpenRaw(inner, fixture.secret_keys.at("middle"));
        REQUIRE(Contains(plaintext, "Anon-To: remailer@exit.example"));
        REQUIRE(Contains(plaintext, "Latent-Time: +0:15"));
        REQUIRE_FALSE(Contains(plaintext, RECIPIENT));
        REQUIRE_FALSE(Contains(plaintext, HEADER_VALUE));
        REQUIRE_FALSE(Contains(plaintext, "the-secret-body"));
    }
    SECTION("Only the exit hop sees the recipient and the pasted headers") {
        const auto entry = PeelSealed(result.ciphertext, fixture.secret_keys.at("entry"));
        const auto middle = PeelSealed(UnwrapEncryptedBlock(entry.body).ciphertext, fixture.secret_keys.at("middle"));
        const auto exit = PeelSealed(UnwrapEncryptedBlock(middle.body).ciphertext, fixture.secret_keys.at("exit"));
        REQUIRE(exit.recipient_directive == RECIPIENT);
        REQUIRE(exit.visible_headers.empty());
        REQUIRE(exit.pasted_headers == envelope::HeaderList{
            {"Subject", std::string(SUBJECT)},
            {"X-Private", std::string(HEADER_VALUE)}});
        REQUIRE(std::string(exit.body.begin(), exit.body.end()) == BODY);
    }
    SECTION("A layer cannot be opened out of order") {
        REQUIRE(crypto::SealedLayerBackend::Open(result.ciphertext, fixture.secret_keys.at("middle")).IsErr());
        REQUIRE(crypto::SealedLayerBackend::Open(result.ciphertext, fixture.secret_keys.at("exit")).IsErr());
    }
}
