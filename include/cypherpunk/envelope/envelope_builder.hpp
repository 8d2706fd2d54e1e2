#pragma once
#include "cypherpunk/envelope/envelope.hpp"
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace cypherpunk::remailer::envelope {
using remailer::Result;
using remailer::RemailerFailure;

/// A Type I block split into its "::" section, "##" section and body.
struct Block {
    HeaderList remailer_headers;
    HeaderList pasted_headers;
    std::vector<uint8_t> body;
};

class EnvelopeBuilder {
public:
    /**
     * Builds the cleartext a single hop decrypts.
     *
     * is_final_hop: inner_payload is the message body, the directive is the
     * end recipient and pasted headers are carried. Otherwise inner_payload
     * is the ciphertext of the next inner layer, wrapped in an
     * "Encrypted:" block; pasted headers are refused so nothing addressed to
     * the recipient appears at a forwarding hop.
     */
    [[nodiscard]] static Result<Envelope, RemailerFailure> Build(
        std::span<const uint8_t> inner_payload,
        const HopRequirement& next_hop,
        bool is_final_hop);

    [[nodiscard]] static Result<Envelope, RemailerFailure> BuildFinal(const OutgoingMessage& message);

    [[nodiscard]] static Result<Envelope, RemailerFailure> BuildForward(
        const EncryptedLayer& inner,
        const HopRequirement& next_hop);

    [[nodiscard]] static std::vector<uint8_t> Serialize(const Envelope& envelope);

    [[nodiscard]] static Result<Envelope, RemailerFailure> Parse(std::span<const uint8_t> serialized);

    /// "::\nEncrypted: <scheme>\n\n<ciphertext>", the block a hop forwards.
    [[nodiscard]] static std::vector<uint8_t> SerializeEncryptedBlock(
        std::span<const uint8_t> ciphertext,
        std::string_view scheme);

    [[nodiscard]] static std::vector<uint8_t> RenderBlock(const Block& block);

    [[nodiscard]] static Result<Block, RemailerFailure> ParseBlock(std::span<const uint8_t> serialized);

    [[nodiscard]] static Result<Unit, RemailerFailure> ValidateHeader(const Header& header);

    [[nodiscard]] static Result<Unit, RemailerFailure> ValidateHeaders(const HeaderList& headers);

private:
    EnvelopeBuilder() = delete;
};
}
