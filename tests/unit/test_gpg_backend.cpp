#include <catch2/catch_test_macros.hpp>
#include "cypherpunk/crypto/gpg_backend.hpp"
#include "cypherpunk/routing/onion_engine.hpp"
#include "helpers/directory_fixtures.hpp"
#include "helpers/temp_directory.hpp"
#include <string>
using namespace cypherpunk::remailer;
using namespace cypherpunk::remailer::crypto;
using namespace cypherpunk::remailer::test_helpers;

namespace {
    constexpr std::string_view MISSING_GPG = "cypherpunk-test-no-such-gpg";

    GpgOptions OptionsIn(const TempDirectory& dir, const std::string_view executable = MISSING_GPG) {
        GpgOptions options;
        options.executable = std::string(executable);
        options.temp_dir = dir.Path();
        return options;
    }

    std::vector<uint8_t> Bytes(const std::string_view text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
}

TEST_CASE("GpgBackend - Creation", "[crypto][gpg]") {
    TempDirectory temp;

    SECTION("Empty executable") {
        auto backend = GpgBackend::Create(OptionsIn(temp, ""));
        REQUIRE(backend.IsErr());
        REQUIRE(backend.UnwrapErr().type == RemailerFailureType::InvalidInput);
        REQUIRE(temp.EntryCount() == 0);
    }
    SECTION("Private keyring lives as long as the backend") {
        {
            auto backend = GpgBackend::Create(OptionsIn(temp));
            REQUIRE(backend.IsOk());
            REQUIRE(backend.Unwrap()->Scheme() == "PGP");
            REQUIRE(backend.Unwrap()->KeyringPath().parent_path().parent_path() == temp.Path());
            REQUIRE(temp.EntryCount() == 1);
        }
        REQUIRE(temp.EntryCount() == 0);
    }
    SECTION("Caller keyring is used as given and never removed") {
        auto options = OptionsIn(temp);
        options.keyring = temp.Path() / "pubring.gpg";
        {
            auto backend = GpgBackend::Create(options);
            REQUIRE(backend.IsOk());
            REQUIRE(backend.Unwrap()->KeyringPath() == *options.keyring);
        }
        REQUIRE(temp.EntryCount() == 0);
    }
}

TEST_CASE("GpgBackend - Failures without a working gpg", "[crypto][gpg]") {
    TempDirectory temp;
    auto created = GpgBackend::Create(OptionsIn(temp));
    REQUIRE(created.IsOk());
    auto backend = std::move(created).Unwrap();
    const auto plaintext = Bytes("::\nAnon-To: alice@example.org\n\nhello\n");

    SECTION("Empty recipient identifier is refused before gpg runs") {
        auto encrypted = backend->Encrypt(plaintext, directory::KeyHandle{});
        REQUIRE(encrypted.IsErr());
        REQUIRE(encrypted.UnwrapErr().type == RemailerFailureType::InvalidInput);
    }
    SECTION("Missing executable is reported and the staging directory is removed") {
        auto encrypted = backend->Encrypt(plaintext, directory::KeyHandle{"remailer@dizum.com", {}});
        REQUIRE(encrypted.IsErr());
        REQUIRE(encrypted.UnwrapErr().type == RemailerFailureType::Generic);
        REQUIRE(encrypted.UnwrapErr().message.find(MISSING_GPG) != std::string::npos);
        REQUIRE(temp.EntryCount() == 1);
    }
    SECTION("Key import reports the missing executable") {
        auto imported = backend->ImportKey(Bytes("-----BEGIN PGP PUBLIC KEY BLOCK-----\n"));
        REQUIRE(imported.IsErr());
        REQUIRE(imported.UnwrapErr().message.find("Cannot import the key") != std::string::npos);
        REQUIRE(temp.EntryCount() == 1);
    }
    SECTION("Importing several keys stops at the first failure") {
        auto imported = backend->ImportKeys({Bytes("first"), Bytes("second")});
        REQUIRE(imported.IsErr());
    }
    SECTION("Importing no keys runs nothing") {
        REQUIRE(backend->ImportKeys({}).IsOk());
    }
}

TEST_CASE("GpgBackend - Engine names the hop gpg failed on", "[crypto][gpg][routing]") {
    TempDirectory temp;
    auto created = GpgBackend::Create(OptionsIn(temp));
    REQUIRE(created.IsOk());
    auto backend = std::move(created).Unwrap();

    auto engine = routing::OnionEngine::Create(*backend, configuration::ChainConfig::Default());
    REQUIRE(engine.IsOk());

    const auto directory = ParanoiaDizumDirectory();
    routing::ResolvedChain chain;
    chain.hops.push_back(directory.Lookup("dizum").Unwrap());
    chain.hops.push_back(directory.Lookup("paranoia").Unwrap());

    envelope::OutgoingMessage message;
    message.recipient = "alice@example.org";
    message.body = Bytes("hello\n");

    auto result = engine.Unwrap().EncryptChain(chain, message);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == RemailerFailureType::BackendFailure);
    REQUIRE(result.UnwrapErr().remailer == "paranoia");
    REQUIRE(temp.EntryCount() == 1);
}
