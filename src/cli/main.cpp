#include "cli_options.hpp"

#include "cypherpunk/configuration/chain_config.hpp"
#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/core/format.hpp"
#include "cypherpunk/crypto/gpg_backend.hpp"
#include "cypherpunk/crypto/sealed_layer_backend.hpp"
#include "cypherpunk/crypto/sodium_random_source.hpp"
#include "cypherpunk/directory/directory_codec.hpp"
#include "cypherpunk/directory/stats_parser.hpp"
#include "cypherpunk/output/output_formatter.hpp"
#include "cypherpunk/routing/redundancy_multiplexer.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

using namespace cypherpunk::remailer;
using namespace cypherpunk::remailer::directory;
namespace cli = cypherpunk::cli;
namespace fs = std::filesystem;
namespace compat = cypherpunk::compat;

namespace {
    constexpr int EXIT_ALL_SENT = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_PARTIAL = 2;

    int Fail(const RemailerFailure& failure) {
        std::cerr << "error: " << failure.Describe() << std::endl;
        return EXIT_FAILED;
    }

    Result<std::vector<uint8_t>, RemailerFailure> ReadBytes(std::istream& in, const std::string& what) {
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                RemailerFailure::Generic(compat::format("Cannot read {}", what)));
        }
        return Result<std::vector<uint8_t>, RemailerFailure>::Ok(std::move(bytes));
    }

    Result<std::vector<uint8_t>, RemailerFailure> ReadFileBytes(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                RemailerFailure::Generic(compat::format("Cannot open {}", path.string())));
        }
        return ReadBytes(in, path.string());
    }

    Result<std::vector<RemailerRecord>, RemailerFailure> LoadRecords(const cli::CliOptions& options) {
        using RecordsResult = Result<std::vector<RemailerRecord>, RemailerFailure>;
        const fs::path source = options.directory.has_value() ? *options.directory : *options.stats;
        auto bytes = ReadFileBytes(source);
        if (bytes.IsErr()) {
            return RecordsResult::Err(std::move(bytes).UnwrapErr());
        }

        std::vector<RemailerRecord> records;
        if (options.directory.has_value()) {
            auto directory = DirectoryCodec::Parse(bytes.Unwrap());
            if (directory.IsErr()) {
                return RecordsResult::Err(std::move(directory).UnwrapErr());
            }
            for (const auto& record : directory.Unwrap().Records()) {
                records.push_back(*record);
            }
        } else {
            const auto& raw = bytes.Unwrap();
            auto report = StatsParser::Parse(std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()));
            if (report.IsErr()) {
                return RecordsResult::Err(std::move(report).UnwrapErr());
            }
            auto parsed = std::move(report).Unwrap();
            if (parsed.last_update.has_value()) {
                std::cerr << "Remailer statistics last updated " << *parsed.last_update << std::endl;
            }
            records = std::move(parsed.records);
        }
        return RecordsResult::Ok(std::move(records));
    }

    Result<Unit, RemailerFailure> AttachKeys(
        std::vector<RemailerRecord>& records,
        const fs::path& key_dir,
        const std::string_view extension) {

        auto attached = StatsParser::AttachKeys(records, key_dir, extension);
        if (attached.IsErr()) {
            return Result<Unit, RemailerFailure>::Err(std::move(attached).UnwrapErr());
        }
        std::cerr << "Loaded " << attached.Unwrap() << " remailer keys from " << key_dir.string() << std::endl;
        return Result<Unit, RemailerFailure>::Ok(unit);
    }

    Result<std::unique_ptr<interfaces::IEncryptionBackend>, RemailerFailure> CreateBackend(
        const cli::CliOptions& options,
        std::vector<RemailerRecord>& records) {

        using BackendResult = Result<std::unique_ptr<interfaces::IEncryptionBackend>, RemailerFailure>;
        if (options.backend == cli::BackendKind::Sealed) {
            if (options.keys.has_value()) {
                auto attached = AttachKeys(records, *options.keys, KeyFiles::SEALED_EXTENSION);
                if (attached.IsErr()) {
                    return BackendResult::Err(std::move(attached).UnwrapErr());
                }
            }
            auto sealed = crypto::SealedLayerBackend::Create();
            if (sealed.IsErr()) {
                return BackendResult::Err(std::move(sealed).UnwrapErr());
            }
            return BackendResult::Ok(std::move(sealed).Unwrap());
        }

        crypto::GpgOptions gpg_options;
        gpg_options.keyring = options.keyring;
        auto gpg = crypto::GpgBackend::Create(std::move(gpg_options));
        if (gpg.IsErr()) {
            return BackendResult::Err(std::move(gpg).UnwrapErr());
        }
        auto backend = std::move(gpg).Unwrap();
        if (options.keys.has_value()) {
            auto attached = AttachKeys(records, *options.keys, KeyFiles::GPG_EXTENSION);
            if (attached.IsErr()) {
                return BackendResult::Err(std::move(attached).UnwrapErr());
            }
            std::vector<std::vector<uint8_t>> armored_keys;
            for (const auto& record : records) {
                if (!record.key.material.empty()) {
                    armored_keys.push_back(record.key.material);
                }
            }
            auto imported = backend->ImportKeys(armored_keys);
            if (imported.IsErr()) {
                return BackendResult::Err(std::move(imported).UnwrapErr());
            }
        }
        return BackendResult::Ok(std::move(backend));
    }

    Result<Unit, RemailerFailure> WriteCopy(
        const fs::path& directory,
        const routing::RoutingResult& result,
        const configuration::OutputFormat format,
        const std::string& rendered) {

        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            return Result<Unit, RemailerFailure>::Err(RemailerFailure::Generic(
                compat::format("Cannot create {}: {}", directory.string(), ec.message())));
        }
        const auto path = directory / compat::format("copy-{}{}", result.copy_index + 1,
                                                     output::OutputFormatter::FileExtension(format));
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << rendered;
        if (!out.flush()) {
            return Result<Unit, RemailerFailure>::Err(
                RemailerFailure::Generic(compat::format("Cannot write {}", path.string())));
        }
        return Result<Unit, RemailerFailure>::Ok(unit);
    }
}

int main(int argc, char** argv) {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    const std::string_view program = argc > 0 ? argv[0] : "cypherpunk-cli";

    auto parsed = cli::ParseArguments(arguments);
    if (parsed.IsErr()) {
        std::cerr << "error: " << parsed.UnwrapErr().message << "\n\n" << cli::Usage(program);
        return EXIT_FAILED;
    }
    const auto options = std::move(parsed).Unwrap();
    if (options.show_help) {
        std::cout << cli::Usage(program);
        return EXIT_ALL_SENT;
    }

    auto built_config = cli::BuildChainConfig(options);
    if (built_config.IsErr()) {
        return Fail(built_config.UnwrapErr());
    }
    const auto config = std::move(built_config).Unwrap();

    auto body = options.input.has_value() ? ReadFileBytes(*options.input) : ReadBytes(std::cin, "stdin");
    if (body.IsErr()) {
        return Fail(body.UnwrapErr());
    }

    auto records = LoadRecords(options);
    if (records.IsErr()) {
        return Fail(records.UnwrapErr());
    }
    auto backend = CreateBackend(options, records.Unwrap());
    if (backend.IsErr()) {
        return Fail(backend.UnwrapErr());
    }
    auto directory = RemailerDirectory::Create(std::move(records).Unwrap());
    if (directory.IsErr()) {
        return Fail(directory.UnwrapErr());
    }
    auto spec = routing::ChainSpec::Parse(options.chain);
    if (spec.IsErr()) {
        return Fail(spec.UnwrapErr());
    }
    auto engine = routing::OnionEngine::Create(*backend.Unwrap(), config);
    if (engine.IsErr()) {
        return Fail(engine.UnwrapErr());
    }

    crypto::SodiumRandomSource rng;
    routing::RedundancyMultiplexer multiplexer(directory.Unwrap(), engine.Unwrap(), rng, config);

    envelope::OutgoingMessage message;
    message.recipient = options.recipient;
    message.subject = options.subject;
    message.recipient_headers = options.headers;
    message.body = std::move(body).Unwrap();

    routing::RouteOptions route_options;
    route_options.parallel = options.parallel;
    auto routed = multiplexer.Route(spec.Unwrap(), message, options.redundancy, route_options);
    if (routed.IsErr()) {
        return Fail(routed.UnwrapErr());
    }
    const auto report = std::move(routed).Unwrap();

    const output::OutputFormatter formatter(config);
    for (const auto& result : report.results) {
        auto rendered = formatter.Format(result);
        if (rendered.IsErr()) {
            return Fail(rendered.UnwrapErr());
        }
        if (options.output.has_value()) {
            auto written = WriteCopy(*options.output, result, config.GetDefaultFormat(), rendered.Unwrap());
            if (written.IsErr()) {
                return Fail(written.UnwrapErr());
            }
        } else {
            std::cout << rendered.Unwrap() << std::endl;
        }
        std::cerr << "copy " << result.copy_index + 1 << ": send to " << result.entry_address
                  << (result.resolved_chain.degraded ? " (chain repeats a remailer)" : "") << std::endl;
    }
    for (const auto& failed : report.failures) {
        std::cerr << "copy " << failed.copy_index + 1 << " failed: " << failed.failure.Describe() << std::endl;
    }

    if (report.AllSucceeded()) {
        return EXIT_ALL_SENT;
    }
    return report.AnySucceeded() ? EXIT_PARTIAL : EXIT_FAILED;
}
