#include <catch2/catch_test_macros.hpp>
#include "cypherpunk/envelope/envelope_builder.hpp"
#include "cypherpunk/core/constants.hpp"
#include <string>
using namespace cypherpunk::remailer;
using namespace cypherpunk::remailer::envelope;

namespace {
    std::vector<uint8_t> Bytes(const std::string_view text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::string Text(const std::vector<uint8_t>& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }
}

TEST_CASE("EnvelopeBuilder - Final hop envelope", "[envelope_builder]") {
    OutgoingMessage message;
    message.recipient = "alice@example.org";
    message.subject = "Meeting";
    message.recipient_headers = {{"Reply-To", "nobody@example.org"}};
    message.body = Bytes("hello\n");

    SECTION("Directive, pasted headers and raw body") {
        auto built = EnvelopeBuilder::BuildFinal(message);
        REQUIRE(built.IsOk());
        const auto& envelope = built.Unwrap();
        REQUIRE(envelope.recipient_directive == "alice@example.org");
        REQUIRE(envelope.visible_headers.empty());
        REQUIRE(envelope.pasted_headers == HeaderList{{"Subject", "Meeting"}, {"Reply-To", "nobody@example.org"}});
        REQUIRE(envelope.body == message.body);
    }
    SECTION("Serialized form") {
        auto built = EnvelopeBuilder::BuildFinal(message);
        REQUIRE(built.IsOk());
        REQUIRE(Text(EnvelopeBuilder::Serialize(built.Unwrap())) ==
                "::\n"
                "Anon-To: alice@example.org\n"
                "\n"
                "##\n"
                "Subject: Meeting\n"
                "Reply-To: nobody@example.org\n"
                "\n"
                "hello\n");
    }
    SECTION("No subject and no headers leaves out the pasted block") {
        message.subject.clear();
        message.recipient_headers.clear();
        auto built = EnvelopeBuilder::BuildFinal(message);
        REQUIRE(built.IsOk());
        REQUIRE(Text(EnvelopeBuilder::Serialize(built.Unwrap())) == "::\nAnon-To: alice@example.org\n\nhello\n");
    }
    SECTION("Body opening with a paste marker gets an empty pasted block") {
        message.subject.clear();
        message.recipient_headers.clear();
        message.body = Bytes("##\nBcc: eve@example.org\n\nhello\n");
        auto built = EnvelopeBuilder::BuildFinal(message);
        REQUIRE(built.IsOk());
        const auto serialized = EnvelopeBuilder::Serialize(built.Unwrap());
        REQUIRE(Text(serialized) == "::\nAnon-To: alice@example.org\n\n##\n\n##\nBcc: eve@example.org\n\nhello\n");

        auto parsed = EnvelopeBuilder::Parse(serialized);
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().pasted_headers.empty());
        REQUIRE(parsed.Unwrap().body == message.body);
    }
    SECTION("Body that is only a paste marker") {
        message.subject.clear();
        message.recipient_headers.clear();
        message.body = Bytes("##");
        auto built = EnvelopeBuilder::BuildFinal(message);
        REQUIRE(built.IsOk());
        auto parsed = EnvelopeBuilder::Parse(EnvelopeBuilder::Serialize(built.Unwrap()));
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().body == message.body);
    }
    SECTION("Final directives are carried opaquely") {
        message.final_directives = {{"Latent-Time", "+2:00"}};
        auto built = EnvelopeBuilder::BuildFinal(message);
        REQUIRE(built.IsOk());
        REQUIRE(built.Unwrap().visible_headers == HeaderList{{"Latent-Time", "+2:00"}});
    }
    SECTION("Empty recipient") {
        message.recipient.clear();
        auto built = EnvelopeBuilder::BuildFinal(message);
        REQUIRE(built.IsErr());
        REQUIRE(built.UnwrapErr().type == RemailerFailureType::InvalidInput);
    }
}

TEST_CASE("EnvelopeBuilder - Forwarding hop envelope", "[envelope_builder]") {
    EncryptedLayer inner;
    inner.ciphertext = Bytes("-----BEGIN PGP MESSAGE-----\nabc\n-----END PGP MESSAGE-----\n");
    HopRequirement next_hop;
    next_hop.address = "remailer@next.example";
    next_hop.scheme = "PGP";

    SECTION("Body is an Encrypted block holding the inner ciphertext") {
        auto built = EnvelopeBuilder::BuildForward(inner, next_hop);
        REQUIRE(built.IsOk());
        const auto& envelope = built.Unwrap();
        REQUIRE(envelope.recipient_directive == "remailer@next.example");
        REQUIRE(envelope.pasted_headers.empty());
        REQUIRE(Text(envelope.body) == "::\nEncrypted: PGP\n\n" + Text(inner.ciphertext));
    }
    SECTION("Pasted headers are refused") {
        next_hop.pasted_headers = {{"Subject", "leak"}};
        auto built = EnvelopeBuilder::BuildForward(inner, next_hop);
        REQUIRE(built.IsErr());
        REQUIRE(built.UnwrapErr().type == RemailerFailureType::InvalidInput);
    }
    SECTION("A scheme is required") {
        next_hop.scheme.clear();
        REQUIRE(EnvelopeBuilder::BuildForward(inner, next_hop).IsErr());
    }
    SECTION("Anon-To cannot be smuggled as a directive") {
        next_hop.directives = {{"anon-to", "elsewhere@example.org"}};
        REQUIRE(EnvelopeBuilder::BuildForward(inner, next_hop).IsErr());
    }
}

TEST_CASE("EnvelopeBuilder - Parsing blocks", "[envelope_builder]") {
    SECTION("Serialized envelope parses back") {
        Envelope envelope;
        envelope.recipient_directive = "bob@example.org";
        envelope.visible_headers = {{"Latent-Time", "+1:30"}};
        envelope.pasted_headers = {{"Subject", "x"}};
        envelope.body = Bytes("line one\n\nline three\n");
        auto parsed = EnvelopeBuilder::Parse(EnvelopeBuilder::Serialize(envelope));
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().recipient_directive == envelope.recipient_directive);
        REQUIRE(parsed.Unwrap().visible_headers == envelope.visible_headers);
        REQUIRE(parsed.Unwrap().pasted_headers == envelope.pasted_headers);
        REQUIRE(parsed.Unwrap().body == envelope.body);
    }
    SECTION("CRLF line endings in the header sections") {
        auto parsed = EnvelopeBuilder::ParseBlock(Bytes("::\r\nEncrypted: PGP\r\n\r\npayload"));
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().remailer_headers == HeaderList{{"Encrypted", "PGP"}});
        REQUIRE(Text(parsed.Unwrap().body) == "payload");
    }
    SECTION("Missing marker") {
        auto parsed = EnvelopeBuilder::ParseBlock(Bytes("Anon-To: x@example.org\n\nbody"));
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == RemailerFailureType::Decode);
        REQUIRE(parsed.UnwrapErr().message == ErrorMessages::MISSING_REMAILER_MARKER);
    }
    SECTION("Unterminated header section") {
        REQUIRE(EnvelopeBuilder::ParseBlock(Bytes("::\nAnon-To: x@example.org\n")).IsErr());
    }
    SECTION("Header line without a colon") {
        REQUIRE(EnvelopeBuilder::ParseBlock(Bytes("::\nnot a header\n\n")).IsErr());
    }
    SECTION("Envelope without Anon-To") {
        auto parsed = EnvelopeBuilder::Parse(Bytes("::\nEncrypted: PGP\n\nbody"));
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().message == ErrorMessages::MISSING_ANON_TO);
    }
}

TEST_CASE("EnvelopeBuilder - Header validation", "[envelope_builder]") {
    REQUIRE(EnvelopeBuilder::ValidateHeader({"X-Mailer", "anything: goes"}).IsOk());
    REQUIRE(EnvelopeBuilder::ValidateHeader({"", "value"}).IsErr());
    REQUIRE(EnvelopeBuilder::ValidateHeader({"Bad Name", "value"}).IsErr());
    REQUIRE(EnvelopeBuilder::ValidateHeader({"Bad:Name", "value"}).IsErr());
    REQUIRE(EnvelopeBuilder::ValidateHeader({"Subject", "a\r\nBcc: x@example.org"}).IsErr());
    REQUIRE(EnvelopeBuilder::ValidateHeaders({{"A", "1"}, {"B", "2\n"}}).IsErr());
}
