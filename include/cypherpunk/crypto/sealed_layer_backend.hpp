#pragma once
#include "cypherpunk/interfaces/i_encryption_backend.hpp"
#include <memory>
#include <string_view>
namespace cypherpunk::remailer::crypto {

/**
 * @brief In-process backend encrypting each layer with LayerCipher
 *
 * Keys are raw 32-byte X25519 public keys carried in KeyHandle::material.
 * Output is armored under "CYPHERPUNK SEALED LAYER" and announced as
 * "Encrypted: X25519-AES256GCM". Real Type I remailers only accept PGP, so
 * this backend serves offline chains, tooling and tests; use GpgBackend for
 * mail that leaves the machine.
 */
class SealedLayerBackend final : public interfaces::IEncryptionBackend {
public:
    static constexpr std::string_view SCHEME = "X25519-AES256GCM";
    static constexpr std::string_view ARMOR_LABEL = "CYPHERPUNK SEALED LAYER";

    [[nodiscard]] static Result<std::unique_ptr<SealedLayerBackend>, RemailerFailure> Create();

    [[nodiscard]] Result<std::vector<uint8_t>, RemailerFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        const directory::KeyHandle& recipient) override;

    [[nodiscard]] std::string Scheme() const override { return std::string(SCHEME); }

    /// Reverses Encrypt() for the holder of the recipient's secret key.
    [[nodiscard]] static Result<std::vector<uint8_t>, RemailerFailure> Open(
        std::span<const uint8_t> armored,
        std::span<const uint8_t> recipient_secret_key);

private:
    SealedLayerBackend() = default;
};
}
