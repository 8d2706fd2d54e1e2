#include <catch2/catch_test_macros.hpp>
#include "cypherpunk/crypto/layer_cipher.hpp"
#include "cypherpunk/crypto/sealed_layer_backend.hpp"
#include "cypherpunk/crypto/sodium_interop.hpp"
#include "cypherpunk/core/constants.hpp"
#include <string>
using namespace cypherpunk::remailer;
using namespace cypherpunk::remailer::crypto;

namespace {
    std::pair<std::vector<uint8_t>, std::vector<uint8_t>> KeyPair() {
        auto pair = SodiumInterop::GenerateX25519KeyPair("layer-test");
        REQUIRE(pair.IsOk());
        return std::move(pair).Unwrap();
    }
}

TEST_CASE("LayerCipher - Seal and open", "[layer_cipher]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto [secret_key, public_key] = KeyPair();
    const std::vector<uint8_t> plaintext = {'A', 'n', 'o', 'n', '-', 'T', 'o'};

    auto sealed = LayerCipher::Seal(plaintext, public_key);
    REQUIRE(sealed.IsOk());
    REQUIRE(sealed.Unwrap().size() == LayerCipher::HEADER_SIZE + plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    REQUIRE(sealed.Unwrap()[0] == Constants::SEALED_LAYER_VERSION);

    SECTION("Recipient opens the layer") {
        auto opened = LayerCipher::Open(sealed.Unwrap(), secret_key);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Every sealing uses a fresh ephemeral key") {
        auto again = LayerCipher::Seal(plaintext, public_key);
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap() != sealed.Unwrap());
    }
    SECTION("Another key cannot open it") {
        const auto [other_secret, other_public] = KeyPair();
        REQUIRE(LayerCipher::Open(sealed.Unwrap(), other_secret).IsErr());
    }
    SECTION("Tampered header or body is rejected") {
        for (const size_t index : {size_t{5}, LayerCipher::HEADER_SIZE + 1}) {
            auto tampered = sealed.Unwrap();
            tampered[index] ^= 0x01;
            REQUIRE(LayerCipher::Open(tampered, secret_key).IsErr());
        }
    }
    SECTION("Unknown version") {
        auto tampered = sealed.Unwrap();
        tampered[0] = 0x7F;
        REQUIRE(LayerCipher::Open(tampered, secret_key).IsErr());
    }
    SECTION("Truncated input") {
        const std::vector<uint8_t> short_input(LayerCipher::HEADER_SIZE, 0x01);
        REQUIRE(LayerCipher::Open(short_input, secret_key).IsErr());
    }
}

TEST_CASE("LayerCipher - Key validation", "[layer_cipher]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> plaintext = {'x'};
    const std::vector<uint8_t> short_key(16, 0x42);
    auto sealed = LayerCipher::Seal(plaintext, short_key);
    REQUIRE(sealed.IsErr());
    REQUIRE(sealed.UnwrapErr().type == RemailerFailureType::InvalidInput);
}

TEST_CASE("SealedLayerBackend - Armored layers", "[layer_cipher][backend]") {
    auto created = SealedLayerBackend::Create();
    REQUIRE(created.IsOk());
    auto backend = std::move(created).Unwrap();
    const auto [secret_key, public_key] = KeyPair();
    const std::string text = "::\nAnon-To: alice@example.org\n\nhi\n";
    const std::vector<uint8_t> plaintext(text.begin(), text.end());

    SECTION("Output is armored and opens with the secret key") {
        directory::KeyHandle key{"remailer@example.org", public_key};
        auto encrypted = backend->Encrypt(plaintext, key);
        REQUIRE(encrypted.IsOk());
        const std::string armored(encrypted.Unwrap().begin(), encrypted.Unwrap().end());
        REQUIRE(armored.rfind("-----BEGIN CYPHERPUNK SEALED LAYER-----", 0) == 0);
        REQUIRE(armored.find("alice") == std::string::npos);

        auto opened = SealedLayerBackend::Open(encrypted.Unwrap(), secret_key);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
        REQUIRE(backend->Scheme() == "X25519-AES256GCM");
    }
    SECTION("Missing key material is reported") {
        directory::KeyHandle key{"remailer@example.org", {}};
        auto encrypted = backend->Encrypt(plaintext, key);
        REQUIRE(encrypted.IsErr());
    }
}
