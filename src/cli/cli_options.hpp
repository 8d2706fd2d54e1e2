#pragma once
#include "cypherpunk/configuration/chain_config.hpp"
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include "cypherpunk/envelope/envelope.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace cypherpunk::cli {
using remailer::Result;
using remailer::RemailerFailure;

enum class BackendKind : uint8_t {
    Gpg,
    Sealed
};

struct CliOptions {
    std::vector<std::string> chain;
    std::string recipient;
    std::string subject;
    /// Subject of the outer mail to the entry hop; never the recipient's subject.
    std::string eml_subject;
    remailer::envelope::HeaderList headers;
    size_t redundancy = 1;
    std::optional<std::string> format;
    bool mailto = false;
    std::optional<std::filesystem::path> directory;
    std::optional<std::filesystem::path> stats;
    std::optional<std::filesystem::path> keys;
    std::optional<std::filesystem::path> output;
    BackendKind backend = BackendKind::Gpg;
    std::optional<std::filesystem::path> keyring;
    bool parallel = false;
    std::optional<std::chrono::minutes> latency;
    std::optional<std::filesystem::path> input;
    bool show_help = false;
};

[[nodiscard]] Result<CliOptions, RemailerFailure> ParseArguments(const std::vector<std::string>& arguments);

/// "Name: value" -> header; the name must be non-empty.
[[nodiscard]] Result<remailer::envelope::Header, RemailerFailure> ParseHeaderArgument(std::string_view text);

/// "H:MM" or plain minutes.
[[nodiscard]] Result<std::chrono::minutes, RemailerFailure> ParseLatencyArgument(std::string_view text);

/// Chain configuration for the parsed options; only --eml-subject reaches the outer mail.
[[nodiscard]] Result<remailer::configuration::ChainConfig, RemailerFailure> BuildChainConfig(const CliOptions& options);

[[nodiscard]] std::string Usage(std::string_view program);
}
