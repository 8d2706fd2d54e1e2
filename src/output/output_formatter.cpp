#include "cypherpunk/output/output_formatter.hpp"
#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/core/format.hpp"
#include "cypherpunk/crypto/sodium_interop.hpp"
#include "cypherpunk/envelope/envelope_builder.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace cypherpunk::remailer::output {
using envelope::EnvelopeBuilder;

namespace {
    constexpr std::string_view MAILTO_SCHEME = "mailto:";
    constexpr std::string_view MAILTO_BODY = "?body=";
    constexpr size_t MESSAGE_ID_BYTES = 16;

    bool IsUnreserved(const unsigned char c) {
        return std::isalnum(c) != 0 || c == '-' || c == '.' || c == '_' || c == '~';
    }

    std::string ToLower(const std::string_view text) {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    std::string ToCrlf(const std::string_view text) {
        std::string out;
        out.reserve(text.size() + text.size() / 32);
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
                out += '\r';
            }
            out += text[i];
        }
        return out;
    }

    // RFC 5322 date-time in UTC, e.g. "Mon, 19 Oct 2026 14:03:22 +0000".
    std::string RfcDate() {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm utc{};
        gmtime_r(&now, &utc);
        char buffer[64];
        const size_t written = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S +0000", &utc);
        return std::string(buffer, written);
    }

    std::string MessageId(const std::string_view from) {
        static constexpr char hex_chars[] = "0123456789abcdef";
        const auto random = crypto::SodiumInterop::GetRandomBytes(MESSAGE_ID_BYTES);
        std::string local;
        local.reserve(random.size() * 2);
        for (const auto byte : random) {
            local.push_back(hex_chars[(byte >> 4) & 0x0F]);
            local.push_back(hex_chars[byte & 0x0F]);
        }
        const auto at = from.rfind('@');
        const auto domain = at == std::string_view::npos ? std::string_view("localhost") : from.substr(at + 1);
        return compat::format("<{}@{}>", local, domain);
    }
}

OutputFormatter::OutputFormatter(configuration::ChainConfig config)
    : config_(std::move(config)) {}

Result<OutputFormat, RemailerFailure> OutputFormatter::ParseFormat(const std::string_view name) {
    const auto lowered = ToLower(name);
    for (const auto kind : {OutputFormat::Native, OutputFormat::Mailto, OutputFormat::Eml}) {
        if (lowered == FormatName(kind)) {
            return Result<OutputFormat, RemailerFailure>::Ok(kind);
        }
    }
    return Result<OutputFormat, RemailerFailure>::Err(RemailerFailure::UnsupportedFormat(std::string(name)));
}

std::string_view OutputFormatter::FormatName(const OutputFormat kind) noexcept {
    switch (kind) {
        case OutputFormat::Native: return "native";
        case OutputFormat::Mailto: return "mailto";
        case OutputFormat::Eml: return "eml";
    }
    return "unknown";
}

std::string_view OutputFormatter::FileExtension(const OutputFormat kind) noexcept {
    switch (kind) {
        case OutputFormat::Native: return ".txt";
        case OutputFormat::Mailto: return ".url";
        case OutputFormat::Eml: return ".eml";
    }
    return ".out";
}

std::string OutputFormatter::RenderNative(const routing::RoutingResult& result) {
    envelope::Block block;
    block.remailer_headers = result.outer_headers;
    block.body = result.ciphertext;
    const auto rendered = EnvelopeBuilder::RenderBlock(block);
    return std::string(rendered.begin(), rendered.end());
}

Result<NativeBlock, RemailerFailure> OutputFormatter::ParseNative(const std::string_view text) {
    const std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    auto parsed = EnvelopeBuilder::ParseBlock(bytes);
    if (parsed.IsErr()) {
        return Result<NativeBlock, RemailerFailure>::Err(std::move(parsed).UnwrapErr());
    }
    auto block = std::move(parsed).Unwrap();
    return Result<NativeBlock, RemailerFailure>::Ok(NativeBlock{
        std::move(block.remailer_headers),
        std::move(block.pasted_headers),
        std::move(block.body)});
}

std::string OutputFormatter::PercentEncode(const std::string_view text) {
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size() * 3);
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (IsUnreserved(c)) {
            encoded.push_back(ch);
        } else {
            encoded.push_back('%');
            encoded.push_back(hex_chars[(c >> 4) & 0x0F]);
            encoded.push_back(hex_chars[c & 0x0F]);
        }
    }
    return encoded;
}

std::string OutputFormatter::RenderMailto(const routing::RoutingResult& result) const {
    std::string uri;
    uri.append(MAILTO_SCHEME);
    uri.append(result.entry_address);
    uri.append(MAILTO_BODY);
    uri.append(PercentEncode(RenderNative(result)));
    return uri;
}

std::string OutputFormatter::RenderEml(const routing::RoutingResult& result) const {
    constexpr std::string_view crlf = WireFormat::CRLF;
    std::string message;
    message += compat::format("To: {}{}", result.entry_address, crlf);
    message += compat::format("From: {}{}", config_.GetEmlFrom(), crlf);
    message += compat::format("Subject: {}{}", config_.GetEmlSubject(), crlf);
    message += compat::format("Date: {}{}", RfcDate(), crlf);
    message += compat::format("Message-ID: {}{}", MessageId(config_.GetEmlFrom()), crlf);
    message += compat::format("MIME-Version: 1.0{}", crlf);
    message += compat::format("Content-Type: text/plain; charset=us-ascii{}", crlf);
    message += crlf;
    message += ToCrlf(RenderNative(result));
    return message;
}

Result<std::string, RemailerFailure> OutputFormatter::Format(
    const routing::RoutingResult& result,
    const OutputFormat kind) const {

    switch (kind) {
        case OutputFormat::Native:
            return Result<std::string, RemailerFailure>::Ok(RenderNative(result));
        case OutputFormat::Mailto:
            return Result<std::string, RemailerFailure>::Ok(RenderMailto(result));
        case OutputFormat::Eml: {
            // From and Subject are written verbatim into the outer headers.
            auto valid = config_.Validate();
            if (valid.IsErr()) {
                return Result<std::string, RemailerFailure>::Err(std::move(valid).UnwrapErr());
            }
            return Result<std::string, RemailerFailure>::Ok(RenderEml(result));
        }
    }
    return Result<std::string, RemailerFailure>::Err(
        RemailerFailure::UnsupportedFormat(std::to_string(static_cast<unsigned>(kind))));
}

Result<std::string, RemailerFailure> OutputFormatter::Format(const routing::RoutingResult& result) const {
    return Format(result, config_.GetDefaultFormat());
}

}
