#include "cypherpunk/envelope/envelope_builder.hpp"
#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/core/format.hpp"

#include <algorithm>
#include <cctype>

namespace cypherpunk::remailer::envelope {
namespace {
    using EnvelopeResult = Result<Envelope, RemailerFailure>;
    using UnitResult = Result<Unit, RemailerFailure>;

    void Append(std::vector<uint8_t>& out, const std::string_view text) {
        out.insert(out.end(), text.begin(), text.end());
    }

    void AppendHeaders(std::vector<uint8_t>& out, const HeaderList& headers) {
        for (const auto& [name, value] : headers) {
            Append(out, name);
            Append(out, WireFormat::HEADER_SEPARATOR);
            Append(out, value);
            Append(out, WireFormat::NEWLINE);
        }
    }

    // True when the first body line would read as the "##" paste marker.
    bool StartsWithPastedMarker(const std::vector<uint8_t>& body) {
        const std::string_view text(reinterpret_cast<const char*>(body.data()), body.size());
        auto first = text.substr(0, text.find('\n'));
        if (!first.empty() && first.back() == '\r') {
            first.remove_suffix(1);
        }
        return first == WireFormat::PASTED_MARKER;
    }

    bool EqualsIgnoreCase(const std::string_view a, const std::string_view b) {
        return a.size() == b.size()
            && std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
                   return std::tolower(static_cast<unsigned char>(x))
                       == std::tolower(static_cast<unsigned char>(y));
               });
    }

    // Reads one '\n'-terminated line starting at pos; strips a trailing '\r'.
    bool NextLine(const std::string_view text, size_t& pos, std::string_view& line) {
        if (pos >= text.size()) {
            return false;
        }
        const auto end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            line = text.substr(pos);
            pos = text.size();
        } else {
            line = text.substr(pos, end - pos);
            pos = end + 1;
        }
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        return true;
    }

    Result<HeaderList, RemailerFailure> ReadHeaderSection(
        const std::string_view text,
        size_t& pos,
        const std::string_view section) {

        HeaderList headers;
        std::string_view line;
        while (NextLine(text, pos, line)) {
            if (line.empty()) {
                return Result<HeaderList, RemailerFailure>::Ok(std::move(headers));
            }
            const auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                return Result<HeaderList, RemailerFailure>::Err(
                    RemailerFailure::Decode(
                        compat::format("Malformed header line in '{}' section: '{}'", section, line)));
            }
            auto value = line.substr(colon + 1);
            if (!value.empty() && value.front() == ' ') {
                value.remove_prefix(1);
            }
            headers.emplace_back(std::string(line.substr(0, colon)), std::string(value));
        }
        return Result<HeaderList, RemailerFailure>::Err(
            RemailerFailure::Decode(
                compat::format("'{}' section is not terminated by a blank line", section)));
    }

    UnitResult ValidateAddress(const std::string_view address, const std::string_view role) {
        if (address.empty()) {
            return UnitResult::Err(RemailerFailure::InvalidInput(
                compat::format("{} address is empty", role)));
        }
        if (address.find_first_of("\r\n") != std::string_view::npos) {
            return UnitResult::Err(RemailerFailure::InvalidInput(
                compat::format("{} address contains a line break", role)));
        }
        return UnitResult::Ok(unit);
    }

    UnitResult RejectReservedDirective(const HeaderList& directives) {
        for (const auto& [name, value] : directives) {
            if (EqualsIgnoreCase(name, WireFormat::ANON_TO)) {
                return UnitResult::Err(RemailerFailure::InvalidInput(
                    "Anon-To is set from the routing address and cannot be given as a directive"));
            }
        }
        return UnitResult::Ok(unit);
    }
}

Result<Unit, RemailerFailure> EnvelopeBuilder::ValidateHeader(const Header& header) {
    const auto& [name, value] = header;
    if (name.empty()) {
        return UnitResult::Err(RemailerFailure::InvalidInput("Header name is empty"));
    }
    const bool printable_name = std::all_of(name.begin(), name.end(), [](const char c) {
        const auto u = static_cast<unsigned char>(c);
        return u > 32 && u < 127 && c != ':';
    });
    if (!printable_name) {
        return UnitResult::Err(RemailerFailure::InvalidInput(
            compat::format("Header name '{}' contains forbidden characters", name)));
    }
    if (value.find_first_of("\r\n") != std::string::npos) {
        return UnitResult::Err(RemailerFailure::InvalidInput(
            compat::format("Header '{}' value contains a line break", name)));
    }
    return UnitResult::Ok(unit);
}

Result<Unit, RemailerFailure> EnvelopeBuilder::ValidateHeaders(const HeaderList& headers) {
    for (const auto& header : headers) {
        auto valid = ValidateHeader(header);
        if (valid.IsErr()) {
            return valid;
        }
    }
    return UnitResult::Ok(unit);
}

Result<Envelope, RemailerFailure> EnvelopeBuilder::Build(
    const std::span<const uint8_t> inner_payload,
    const HopRequirement& next_hop,
    const bool is_final_hop) {

    auto address_ok = ValidateAddress(next_hop.address, is_final_hop ? "Recipient" : "Next hop");
    if (address_ok.IsErr()) {
        return EnvelopeResult::Err(std::move(address_ok).UnwrapErr());
    }
    for (const auto* headers : {&next_hop.directives, &next_hop.pasted_headers}) {
        auto valid = ValidateHeaders(*headers);
        if (valid.IsErr()) {
            return EnvelopeResult::Err(std::move(valid).UnwrapErr());
        }
    }
    auto reserved = RejectReservedDirective(next_hop.directives);
    if (reserved.IsErr()) {
        return EnvelopeResult::Err(std::move(reserved).UnwrapErr());
    }

    Envelope envelope;
    envelope.recipient_directive = next_hop.address;
    envelope.visible_headers = next_hop.directives;
    if (is_final_hop) {
        envelope.pasted_headers = next_hop.pasted_headers;
        envelope.body.assign(inner_payload.begin(), inner_payload.end());
        return EnvelopeResult::Ok(std::move(envelope));
    }

    if (!next_hop.pasted_headers.empty()) {
        return EnvelopeResult::Err(RemailerFailure::InvalidInput(
            "Recipient headers can only be carried by the final hop"));
    }
    if (next_hop.scheme.empty()) {
        return EnvelopeResult::Err(RemailerFailure::InvalidInput(
            "Forwarding envelope needs the encryption scheme of the inner layer"));
    }
    envelope.body = SerializeEncryptedBlock(inner_payload, next_hop.scheme);
    return EnvelopeResult::Ok(std::move(envelope));
}

Result<Envelope, RemailerFailure> EnvelopeBuilder::BuildFinal(const OutgoingMessage& message) {
    HopRequirement requirement;
    requirement.address = message.recipient;
    requirement.directives = message.final_directives;
    if (!message.subject.empty()) {
        requirement.pasted_headers.emplace_back(std::string(WireFormat::SUBJECT), message.subject);
    }
    requirement.pasted_headers.insert(requirement.pasted_headers.end(),
                                      message.recipient_headers.begin(),
                                      message.recipient_headers.end());
    return Build(message.body, requirement, true);
}

Result<Envelope, RemailerFailure> EnvelopeBuilder::BuildForward(
    const EncryptedLayer& inner,
    const HopRequirement& next_hop) {
    return Build(inner.ciphertext, next_hop, false);
}

std::vector<uint8_t> EnvelopeBuilder::RenderBlock(const Block& block) {
    std::vector<uint8_t> out;
    out.reserve(block.body.size() + 128);
    Append(out, WireFormat::REMAILER_MARKER);
    Append(out, WireFormat::NEWLINE);
    AppendHeaders(out, block.remailer_headers);
    Append(out, WireFormat::NEWLINE);
    // An empty "##" block keeps a body that starts with "##" out of the headers.
    if (!block.pasted_headers.empty() || StartsWithPastedMarker(block.body)) {
        Append(out, WireFormat::PASTED_MARKER);
        Append(out, WireFormat::NEWLINE);
        AppendHeaders(out, block.pasted_headers);
        Append(out, WireFormat::NEWLINE);
    }
    out.insert(out.end(), block.body.begin(), block.body.end());
    return out;
}

std::vector<uint8_t> EnvelopeBuilder::Serialize(const Envelope& envelope) {
    Block block;
    block.remailer_headers.reserve(envelope.visible_headers.size() + 1);
    block.remailer_headers.emplace_back(std::string(WireFormat::ANON_TO), envelope.recipient_directive);
    block.remailer_headers.insert(block.remailer_headers.end(),
                                  envelope.visible_headers.begin(),
                                  envelope.visible_headers.end());
    block.pasted_headers = envelope.pasted_headers;
    block.body = envelope.body;
    return RenderBlock(block);
}

std::vector<uint8_t> EnvelopeBuilder::SerializeEncryptedBlock(
    const std::span<const uint8_t> ciphertext,
    const std::string_view scheme) {
    Block block;
    block.remailer_headers.emplace_back(std::string(WireFormat::ENCRYPTED), std::string(scheme));
    block.body.assign(ciphertext.begin(), ciphertext.end());
    return RenderBlock(block);
}

Result<Block, RemailerFailure> EnvelopeBuilder::ParseBlock(const std::span<const uint8_t> serialized) {
    const std::string_view text(reinterpret_cast<const char*>(serialized.data()), serialized.size());
    size_t pos = 0;
    std::string_view line;
    if (!NextLine(text, pos, line) || line != WireFormat::REMAILER_MARKER) {
        return Result<Block, RemailerFailure>::Err(
            RemailerFailure::Decode(std::string(ErrorMessages::MISSING_REMAILER_MARKER)));
    }

    Block block;
    auto remailer_headers = ReadHeaderSection(text, pos, WireFormat::REMAILER_MARKER);
    if (remailer_headers.IsErr()) {
        return Result<Block, RemailerFailure>::Err(std::move(remailer_headers).UnwrapErr());
    }
    block.remailer_headers = std::move(remailer_headers).Unwrap();

    size_t peek = pos;
    if (NextLine(text, peek, line) && line == WireFormat::PASTED_MARKER) {
        pos = peek;
        auto pasted = ReadHeaderSection(text, pos, WireFormat::PASTED_MARKER);
        if (pasted.IsErr()) {
            return Result<Block, RemailerFailure>::Err(std::move(pasted).UnwrapErr());
        }
        block.pasted_headers = std::move(pasted).Unwrap();
    }

    block.body.assign(serialized.begin() + static_cast<std::ptrdiff_t>(pos), serialized.end());
    return Result<Block, RemailerFailure>::Ok(std::move(block));
}

Result<Envelope, RemailerFailure> EnvelopeBuilder::Parse(const std::span<const uint8_t> serialized) {
    auto block_result = ParseBlock(serialized);
    if (block_result.IsErr()) {
        return EnvelopeResult::Err(std::move(block_result).UnwrapErr());
    }
    auto block = std::move(block_result).Unwrap();

    Envelope envelope;
    bool has_directive = false;
    for (auto& header : block.remailer_headers) {
        if (!has_directive && EqualsIgnoreCase(header.first, WireFormat::ANON_TO)) {
            envelope.recipient_directive = std::move(header.second);
            has_directive = true;
        } else {
            envelope.visible_headers.push_back(std::move(header));
        }
    }
    if (!has_directive) {
        return EnvelopeResult::Err(
            RemailerFailure::Decode(std::string(ErrorMessages::MISSING_ANON_TO)));
    }
    envelope.pasted_headers = std::move(block.pasted_headers);
    envelope.body = std::move(block.body);
    return EnvelopeResult::Ok(std::move(envelope));
}

}
