#include "cypherpunk/crypto/gpg_backend.hpp"
#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/core/format.hpp"

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

extern char** environ;

namespace cypherpunk::remailer::crypto {
namespace fs = std::filesystem;
namespace {
    using UnitResult = Result<Unit, RemailerFailure>;

    // Removes a per-call staging directory on every exit path.
    class StagingDirectory {
    public:
        static Result<StagingDirectory, RemailerFailure> Create(const fs::path& parent) {
            std::string pattern = (parent / "cypherpunk-XXXXXX").string();
            if (mkdtemp(pattern.data()) == nullptr) {
                return Result<StagingDirectory, RemailerFailure>::Err(
                    RemailerFailure::Generic(
                        compat::format("Cannot create temporary directory under {}: {}",
                                       parent.string(), std::strerror(errno))));
            }
            return Result<StagingDirectory, RemailerFailure>::Ok(StagingDirectory(fs::path(pattern)));
        }
        StagingDirectory(StagingDirectory&& other) noexcept : path_(std::move(other.path_)) {
            other.path_.clear();
        }
        StagingDirectory& operator=(StagingDirectory&&) = delete;
        StagingDirectory(const StagingDirectory&) = delete;
        ~StagingDirectory() {
            if (!path_.empty()) {
                std::error_code ec;
                fs::remove_all(path_, ec);
            }
        }
        [[nodiscard]] const fs::path& Path() const noexcept { return path_; }
    private:
        explicit StagingDirectory(fs::path path) : path_(std::move(path)) {}
        fs::path path_;
    };

    UnitResult WriteFile(const fs::path& path, const std::span<const uint8_t> data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return UnitResult::Err(RemailerFailure::Generic(
                compat::format("Cannot create {}", path.string())));
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out.flush()) {
            return UnitResult::Err(RemailerFailure::Generic(
                compat::format("Cannot write {}", path.string())));
        }
        return UnitResult::Ok(unit);
    }

    Result<std::vector<uint8_t>, RemailerFailure> ReadFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                RemailerFailure::Generic(compat::format("Cannot open {}", path.string())));
        }
        return Result<std::vector<uint8_t>, RemailerFailure>::Ok(
            std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));
    }

    fs::path TempRoot(const GpgOptions& options) {
        if (options.temp_dir.has_value()) {
            return *options.temp_dir;
        }
        std::error_code ec;
        auto root = fs::temp_directory_path(ec);
        return ec ? fs::path("/tmp") : root;
    }
}

Result<std::unique_ptr<GpgBackend>, RemailerFailure> GpgBackend::Create(GpgOptions options) {
    if (options.executable.empty()) {
        return Result<std::unique_ptr<GpgBackend>, RemailerFailure>::Err(
            RemailerFailure::InvalidInput("gpg executable path is empty"));
    }
    if (options.keyring.has_value()) {
        auto keyring = *options.keyring;
        return Result<std::unique_ptr<GpgBackend>, RemailerFailure>::Ok(
            std::unique_ptr<GpgBackend>(new GpgBackend(std::move(options), std::move(keyring), std::nullopt)));
    }
    std::string pattern = (TempRoot(options) / "cypherpunk-keyring-XXXXXX").string();
    if (mkdtemp(pattern.data()) == nullptr) {
        return Result<std::unique_ptr<GpgBackend>, RemailerFailure>::Err(
            RemailerFailure::Generic(
                compat::format("Keyring directory is not writable: {}", std::strerror(errno))));
    }
    fs::path owned(pattern);
    auto keyring = owned / "keyring.gpg";
    return Result<std::unique_ptr<GpgBackend>, RemailerFailure>::Ok(
        std::unique_ptr<GpgBackend>(new GpgBackend(std::move(options), std::move(keyring), std::move(owned))));
}

GpgBackend::GpgBackend(GpgOptions options, fs::path keyring, std::optional<fs::path> owned_dir)
    : options_(std::move(options))
    , keyring_(std::move(keyring))
    , owned_dir_(std::move(owned_dir)) {}

GpgBackend::~GpgBackend() {
    if (owned_dir_.has_value()) {
        std::error_code ec;
        fs::remove_all(*owned_dir_, ec);
    }
}

std::string GpgBackend::Scheme() const {
    return std::string(WireFormat::PGP_SCHEME);
}

std::vector<std::string> GpgBackend::BaseArguments() const {
    std::vector<std::string> arguments = {
        options_.executable,
        "--batch",
        "--yes",
        "--no-default-keyring",
        "--keyring", keyring_.string()
    };
    if (options_.quiet) {
        arguments.emplace_back("--quiet");
    }
    return arguments;
}

Result<Unit, RemailerFailure> GpgBackend::Run(const std::vector<std::string>& arguments) const {
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (const auto& argument : arguments) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int spawn_status = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (spawn_status != 0) {
        return UnitResult::Err(RemailerFailure::Generic(
            compat::format("Failed to execute {}: {}", arguments.front(), std::strerror(spawn_status))));
    }

    int wait_status = 0;
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            return UnitResult::Err(RemailerFailure::Generic(
                compat::format("{} unexpected exit: {}", arguments.front(), std::strerror(errno))));
        }
    }
    if (!WIFEXITED(wait_status)) {
        return UnitResult::Err(RemailerFailure::Generic(
            compat::format("{} exited without any exit code", arguments.front())));
    }
    if (const int code = WEXITSTATUS(wait_status); code != 0) {
        return UnitResult::Err(RemailerFailure::Generic(
            compat::format("{} exited with code {}; check its output for details", arguments.front(), code)));
    }
    return UnitResult::Ok(unit);
}

Result<Unit, RemailerFailure> GpgBackend::ImportKey(const std::span<const uint8_t> armored_key) {
    auto staging = StagingDirectory::Create(TempRoot(options_));
    if (staging.IsErr()) {
        return UnitResult::Err(std::move(staging).UnwrapErr());
    }
    const auto key_path = staging.Unwrap().Path() / "key.asc";
    auto written = WriteFile(key_path, armored_key);
    if (written.IsErr()) {
        return written;
    }

    auto arguments = BaseArguments();
    arguments.emplace_back("--import");
    arguments.push_back(key_path.string());

    std::lock_guard<std::mutex> lock(import_mutex_);
    auto run = Run(arguments);
    if (run.IsErr()) {
        return UnitResult::Err(RemailerFailure::Generic(
            compat::format("Cannot import the key: {}", run.UnwrapErr().message)));
    }
    return run;
}

Result<Unit, RemailerFailure> GpgBackend::ImportKeys(const std::vector<std::vector<uint8_t>>& keys) {
    for (const auto& key : keys) {
        auto imported = ImportKey(key);
        if (imported.IsErr()) {
            return imported;
        }
    }
    return UnitResult::Ok(unit);
}

Result<std::vector<uint8_t>, RemailerFailure> GpgBackend::Encrypt(
    const std::span<const uint8_t> plaintext,
    const directory::KeyHandle& recipient) {

    using BytesResult = Result<std::vector<uint8_t>, RemailerFailure>;
    if (recipient.identifier.empty()) {
        return BytesResult::Err(RemailerFailure::InvalidInput("Recipient key identifier is empty"));
    }

    auto staging = StagingDirectory::Create(TempRoot(options_));
    if (staging.IsErr()) {
        return BytesResult::Err(std::move(staging).UnwrapErr());
    }
    const auto in_path = staging.Unwrap().Path() / "input.txt";
    const auto out_path = staging.Unwrap().Path() / "output.asc";
    auto written = WriteFile(in_path, plaintext);
    if (written.IsErr()) {
        return BytesResult::Err(std::move(written).UnwrapErr());
    }

    auto arguments = BaseArguments();
    arguments.insert(arguments.end(), {
        "--trust-model", "always",
        "--armor",
        "--output", out_path.string(),
        "--recipient", recipient.identifier,
        "--encrypt", in_path.string()
    });

    auto run = Run(arguments);
    std::error_code ec;
    fs::remove(in_path, ec);
    if (run.IsErr()) {
        return BytesResult::Err(std::move(run).UnwrapErr());
    }
    return ReadFile(out_path);
}

}
