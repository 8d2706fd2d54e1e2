#pragma once
#include "cypherpunk/configuration/chain_config.hpp"
#include "cypherpunk/routing/routing_result.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
namespace cypherpunk::remailer::output {
using configuration::OutputFormat;

/// Outer headers and ciphertext recovered from a native rendering.
struct NativeBlock {
    envelope::HeaderList headers;
    envelope::HeaderList pasted_headers;
    std::vector<uint8_t> ciphertext;
};

/**
 * @brief Serializes finished copies for hand-off to a mail client
 *
 * Native is the literal block the entry hop expects. Mailto and Eml wrap
 * that same block, so the ciphertext bytes are identical in all three; Eml
 * only changes line endings to CRLF. Formatting never encrypts anything.
 */
class OutputFormatter {
public:
    explicit OutputFormatter(configuration::ChainConfig config);

    [[nodiscard]] Result<std::string, RemailerFailure> Format(
        const routing::RoutingResult& result,
        OutputFormat kind) const;

    /// Uses the configured default format.
    [[nodiscard]] Result<std::string, RemailerFailure> Format(const routing::RoutingResult& result) const;

    [[nodiscard]] static Result<OutputFormat, RemailerFailure> ParseFormat(std::string_view name);

    [[nodiscard]] static std::string_view FormatName(OutputFormat kind) noexcept;

    /// File extension used when copies are written to a directory.
    [[nodiscard]] static std::string_view FileExtension(OutputFormat kind) noexcept;

    [[nodiscard]] static std::string RenderNative(const routing::RoutingResult& result);

    [[nodiscard]] static Result<NativeBlock, RemailerFailure> ParseNative(std::string_view text);

    /// RFC 3986: unreserved characters are kept, every other byte becomes %XX.
    [[nodiscard]] static std::string PercentEncode(std::string_view text);

private:
    [[nodiscard]] std::string RenderMailto(const routing::RoutingResult& result) const;

    [[nodiscard]] std::string RenderEml(const routing::RoutingResult& result) const;

    configuration::ChainConfig config_;
};
}
