#pragma once
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace cypherpunk::remailer::crypto {

/**
 * Anonymous public-key encryption of one onion layer.
 *
 * Wire layout (before armoring):
 *   [0]        version (1)
 *   [1..32]    ephemeral X25519 public key
 *   [33..44]   AES-256-GCM nonce
 *   [45..]     ciphertext || 16-byte tag
 *
 * The AES key is HKDF-SHA256(X25519(eph_sk, recipient_pk),
 * salt = eph_pk || recipient_pk, info = "Cypherpunk-Layer-v1"). The header
 * bytes (version, ephemeral key, nonce) are bound as associated data.
 * A fresh ephemeral key per layer means two sealings of the same envelope
 * never share a key, so random nonces are safe here.
 */
class LayerCipher {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, RemailerFailure> Seal(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> recipient_public_key);

    [[nodiscard]] static Result<std::vector<uint8_t>, RemailerFailure> Open(
        std::span<const uint8_t> sealed,
        std::span<const uint8_t> recipient_secret_key);

    static constexpr size_t HEADER_SIZE = 1 + 32 + 12;
private:
    LayerCipher() = delete;
};
}
