#pragma once
#include "cypherpunk/interfaces/i_encryption_backend.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
namespace cypherpunk::remailer::crypto {
struct GpgOptions {
    std::string executable = "gpg";
    std::optional<std::filesystem::path> keyring;
    std::optional<std::filesystem::path> temp_dir;
    bool quiet = true;
};

/**
 * @brief OpenPGP backend driving the gpg command-line tool
 *
 * Every call runs gpg against a dedicated keyring (--no-default-keyring), so
 * the user's own keyring is never read or modified. Without an explicit
 * keyring a private one is created under the temp directory and removed with
 * the backend. Plaintext is staged in a per-call temporary directory that is
 * deleted before the call returns.
 */
class GpgBackend final : public interfaces::IEncryptionBackend {
public:
    [[nodiscard]] static Result<std::unique_ptr<GpgBackend>, RemailerFailure> Create(GpgOptions options);

    [[nodiscard]] Result<Unit, RemailerFailure> ImportKey(std::span<const uint8_t> armored_key);

    [[nodiscard]] Result<Unit, RemailerFailure> ImportKeys(const std::vector<std::vector<uint8_t>>& keys);

    [[nodiscard]] Result<std::vector<uint8_t>, RemailerFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        const directory::KeyHandle& recipient) override;

    [[nodiscard]] std::string Scheme() const override;

    [[nodiscard]] const std::filesystem::path& KeyringPath() const noexcept { return keyring_; }

    GpgBackend(const GpgBackend&) = delete;
    GpgBackend& operator=(const GpgBackend&) = delete;
    ~GpgBackend() override;

private:
    GpgBackend(GpgOptions options, std::filesystem::path keyring, std::optional<std::filesystem::path> owned_dir);

    [[nodiscard]] Result<Unit, RemailerFailure> Run(const std::vector<std::string>& arguments) const;

    [[nodiscard]] std::vector<std::string> BaseArguments() const;

    GpgOptions options_;
    std::filesystem::path keyring_;
    std::optional<std::filesystem::path> owned_dir_;
    std::mutex import_mutex_;
};
}
