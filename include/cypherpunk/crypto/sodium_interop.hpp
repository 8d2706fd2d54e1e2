#pragma once

#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include "cypherpunk/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace cypherpunk::remailer::crypto {

/**
 * @brief Interop layer for libsodium operations used by the layer backends
 *
 * Wraps initialization, wiping, randomness and X25519 in Result-returning
 * calls so callers never touch raw libsodium return codes.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must succeed before any other call. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide
     *
     * Used on serialized envelopes after encryption and on derived keys.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    // ========================================================================
    // Randomness
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Uniform value in [0, upper_bound) without modulo bias
     *
     * Backed by randombytes_uniform, which is safe to call from any thread.
     */
    static uint32_t UniformRandom(uint32_t upper_bound);

    // ========================================================================
    // X25519
    // ========================================================================

    /**
     * @brief Generate an X25519 key pair
     *
     * @return Ok((secret_key, public_key)); the caller owns and wipes the secret
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, RemailerFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Raw X25519 shared secret between a secret and a peer public key
     *
     * Fails on wrong sizes and on low-order peer points (all-zero output).
     */
    static Result<std::vector<uint8_t>, RemailerFailure> ComputeSharedSecret(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> peer_public_key);

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace cypherpunk::remailer::crypto
