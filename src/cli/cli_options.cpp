#include "cli_options.hpp"
#include "cypherpunk/core/format.hpp"
#include "cypherpunk/output/output_formatter.hpp"

#include <algorithm>
#include <charconv>

namespace cypherpunk::cli {
namespace {
    using OptionsResult = Result<CliOptions, RemailerFailure>;

    bool IsFlag(const std::string_view argument) {
        return argument.size() > 1 && argument.front() == '-';
    }

    std::string_view Trim(std::string_view text) {
        const auto first = text.find_first_not_of(" \t");
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }

    // Digits only; from_chars would otherwise accept a leading '-'.
    template<typename T>
    std::optional<T> ParseNumber(const std::string_view text) {
        const bool digits = std::all_of(text.begin(), text.end(), [](const char c) { return c >= '0' && c <= '9'; });
        if (text.empty() || !digits) {
            return std::nullopt;
        }
        T value{};
        const auto* end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc() || ptr != end) {
            return std::nullopt;
        }
        return value;
    }

    class ArgumentCursor {
    public:
        explicit ArgumentCursor(const std::vector<std::string>& arguments) : arguments_(arguments) {}

        [[nodiscard]] bool Done() const noexcept { return index_ >= arguments_.size(); }
        const std::string& Next() { return arguments_[index_++]; }

        Result<std::string, RemailerFailure> Value(const std::string_view flag) {
            if (Done()) {
                return Result<std::string, RemailerFailure>::Err(
                    RemailerFailure::InvalidInput(compat::format("{} needs a value", flag)));
            }
            return Result<std::string, RemailerFailure>::Ok(Next());
        }

        /// Values up to the next flag; a lone "*" is a value, not a flag.
        std::vector<std::string> Values() {
            std::vector<std::string> values;
            while (!Done() && !IsFlag(arguments_[index_])) {
                values.push_back(Next());
            }
            return values;
        }

    private:
        const std::vector<std::string>& arguments_;
        size_t index_ = 0;
    };
}

Result<remailer::envelope::Header, RemailerFailure> ParseHeaderArgument(const std::string_view text) {
    const auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return Result<remailer::envelope::Header, RemailerFailure>::Err(
            RemailerFailure::InvalidInput(
                compat::format("Header '{}' is not of the form 'Name: value'", text)));
    }
    const auto name = Trim(text.substr(0, colon));
    if (name.empty()) {
        return Result<remailer::envelope::Header, RemailerFailure>::Err(
            RemailerFailure::InvalidInput(compat::format("Header '{}' has no name", text)));
    }
    return Result<remailer::envelope::Header, RemailerFailure>::Ok(
        remailer::envelope::Header{std::string(name), std::string(Trim(text.substr(colon + 1)))});
}

Result<std::chrono::minutes, RemailerFailure> ParseLatencyArgument(const std::string_view text) {
    using LatencyResult = Result<std::chrono::minutes, RemailerFailure>;
    auto invalid = [text]() {
        return LatencyResult::Err(RemailerFailure::InvalidInput(
            compat::format("Latency '{}' is not H:MM", text)));
    };
    if (text.empty()) {
        return invalid();
    }
    const auto trimmed = Trim(text.front() == '+' ? text.substr(1) : text);
    const auto colon = trimmed.find(':');
    if (colon == std::string_view::npos) {
        const auto minutes = ParseNumber<long>(trimmed);
        return minutes.has_value() ? LatencyResult::Ok(std::chrono::minutes(*minutes)) : invalid();
    }
    const auto hours = ParseNumber<long>(trimmed.substr(0, colon));
    const auto minutes = ParseNumber<long>(trimmed.substr(colon + 1));
    if (!hours.has_value() || !minutes.has_value() || *minutes >= 60 || trimmed.size() - colon != 3) {
        return invalid();
    }
    return LatencyResult::Ok(std::chrono::hours(*hours) + std::chrono::minutes(*minutes));
}

Result<CliOptions, RemailerFailure> ParseArguments(const std::vector<std::string>& arguments) {
    CliOptions options;
    ArgumentCursor cursor(arguments);

    while (!cursor.Done()) {
        const std::string flag = cursor.Next();

        if (flag == "-h" || flag == "--help") {
            options.show_help = true;
            return OptionsResult::Ok(std::move(options));
        }
        if (flag == "-c" || flag == "--chain") {
            auto values = cursor.Values();
            options.chain.insert(options.chain.end(), values.begin(), values.end());
            continue;
        }
        if (flag == "-m" || flag == "--mailto") {
            options.mailto = true;
            continue;
        }
        if (flag == "--parallel") {
            options.parallel = true;
            continue;
        }

        auto value_result = cursor.Value(flag);
        if (value_result.IsErr()) {
            return OptionsResult::Err(std::move(value_result).UnwrapErr());
        }
        std::string value = std::move(value_result).Unwrap();

        if (flag == "-t" || flag == "--to") {
            options.recipient = std::move(value);
        } else if (flag == "-s" || flag == "--subject") {
            options.subject = std::move(value);
        } else if (flag == "--eml-subject") {
            options.eml_subject = std::move(value);
        } else if (flag == "-H" || flag == "--header") {
            auto header = ParseHeaderArgument(value);
            if (header.IsErr()) {
                return OptionsResult::Err(std::move(header).UnwrapErr());
            }
            options.headers.push_back(std::move(header).Unwrap());
        } else if (flag == "-r" || flag == "--redundancy") {
            const auto count = ParseNumber<size_t>(value);
            if (!count.has_value() || *count == 0) {
                return OptionsResult::Err(RemailerFailure::InvalidInput(
                    compat::format("Redundancy '{}' is not a positive integer", value)));
            }
            options.redundancy = *count;
        } else if (flag == "-f" || flag == "--format") {
            options.format = std::move(value);
        } else if (flag == "-d" || flag == "--directory") {
            options.directory = value;
        } else if (flag == "--stats") {
            options.stats = value;
        } else if (flag == "--keys") {
            options.keys = value;
        } else if (flag == "-o" || flag == "--output") {
            options.output = value;
        } else if (flag == "--backend") {
            if (value == "gpg") {
                options.backend = BackendKind::Gpg;
            } else if (value == "sealed") {
                options.backend = BackendKind::Sealed;
            } else {
                return OptionsResult::Err(RemailerFailure::InvalidInput(
                    compat::format("Unknown backend '{}', expected gpg or sealed", value)));
            }
        } else if (flag == "--keyring") {
            options.keyring = value;
        } else if (flag == "--latency") {
            auto latency = ParseLatencyArgument(value);
            if (latency.IsErr()) {
                return OptionsResult::Err(std::move(latency).UnwrapErr());
            }
            options.latency = latency.Unwrap();
        } else if (flag == "-i" || flag == "--input") {
            options.input = value;
        } else {
            return OptionsResult::Err(RemailerFailure::InvalidInput(
                compat::format("Unknown option '{}'", flag)));
        }
    }

    if (options.chain.empty()) {
        return OptionsResult::Err(RemailerFailure::InvalidInput("--chain needs at least one remailer"));
    }
    if (options.recipient.empty()) {
        return OptionsResult::Err(RemailerFailure::InvalidInput("--to is required"));
    }
    if (options.directory.has_value() == options.stats.has_value()) {
        return OptionsResult::Err(RemailerFailure::InvalidInput(
            "Give exactly one of --directory or --stats"));
    }
    if (options.mailto && options.format.has_value()) {
        return OptionsResult::Err(RemailerFailure::InvalidInput("--mailto and --format are exclusive"));
    }
    return OptionsResult::Ok(std::move(options));
}

Result<remailer::configuration::ChainConfig, RemailerFailure> BuildChainConfig(const CliOptions& options) {
    using remailer::configuration::ChainConfig;
    using remailer::configuration::OutputFormat;
    using ConfigResult = Result<ChainConfig, RemailerFailure>;

    auto config = ChainConfig::Default().WithEmlSubject(options.eml_subject);
    if (options.latency.has_value()) {
        config = config.WithHopLatency(*options.latency);
    }
    if (options.mailto) {
        config = config.WithDefaultFormat(OutputFormat::Mailto);
    } else if (options.format.has_value()) {
        auto format = remailer::output::OutputFormatter::ParseFormat(*options.format);
        if (format.IsErr()) {
            return ConfigResult::Err(std::move(format).UnwrapErr());
        }
        config = config.WithDefaultFormat(format.Unwrap());
    }
    auto valid = config.Validate();
    if (valid.IsErr()) {
        return ConfigResult::Err(std::move(valid).UnwrapErr());
    }
    return ConfigResult::Ok(std::move(config));
}

std::string Usage(const std::string_view program) {
    return compat::format(
        "Usage: {} -c <remailer|*>... -t <address> (-d <snapshot> | --stats <rlist.txt>) [options]\n"
        "\n"
        "  -c, --chain <names...>     remailer chain, entry hop first; '*' picks at random\n"
        "  -t, --to <address>         final recipient\n"
        "  -s, --subject <text>       subject seen by the recipient (encrypted)\n"
        "      --eml-subject <text>   plaintext Subject of the eml sent to the entry hop\n"
        "  -H, --header 'Name: value' extra recipient header (repeatable)\n"
        "  -r, --redundancy <n>       independently routed copies (default 1)\n"
        "  -f, --format <kind>        native, mailto or eml (default native)\n"
        "  -m, --mailto               same as --format mailto\n"
        "  -d, --directory <file>     remailer directory snapshot\n"
        "      --stats <file>         remailer statistics (rlist.txt)\n"
        "      --keys <dir>           remailer keys: <name>.asc (gpg) or <name>.pub (sealed)\n"
        "  -o, --output <dir>         write one file per copy instead of stdout\n"
        "      --backend <gpg|sealed> layer encryption backend (default gpg)\n"
        "      --keyring <file>       gpg keyring to use instead of a temporary one\n"
        "      --parallel             encrypt copies in parallel\n"
        "      --latency <H:MM>       Latent-Time for every forwarding hop\n"
        "  -i, --input <file>         message body (default stdin)\n",
        program);
}

}
