#include "cypherpunk/crypto/sodium_interop.hpp"
#include "cypherpunk/core/format.hpp"

#include <string>

namespace cypherpunk::remailer::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > Constants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer size {} exceeds maximum {}",
                               buffer.size(), Constants::MAX_BUFFER_SIZE)));
    }

    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

// ============================================================================
// Randomness
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::UniformRandom(const uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// X25519
// ============================================================================

Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, RemailerFailure>
SodiumInterop::GenerateX25519KeyPair(const std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, RemailerFailure>;

    if (!IsInitialized()) {
        return KeyPairResult::Err(
            RemailerFailure::Generic(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    std::vector<uint8_t> secret_key = GetRandomBytes(Constants::X_25519_PRIVATE_KEY_SIZE);
    std::vector<uint8_t> public_key(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_scalarmult_base(public_key.data(), secret_key.data()) != SodiumConstants::SUCCESS) {
        (void)SecureWipe(secret_key);
        return KeyPairResult::Err(
            RemailerFailure::Generic(
                compat::format("Failed to derive {} public key", key_purpose)));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(secret_key), std::move(public_key)));
}

Result<std::vector<uint8_t>, RemailerFailure> SodiumInterop::ComputeSharedSecret(
    const std::span<const uint8_t> secret_key,
    const std::span<const uint8_t> peer_public_key) {

    if (secret_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return Result<std::vector<uint8_t>, RemailerFailure>::Err(
            RemailerFailure::InvalidInput(
                compat::format("X25519 secret key must be {} bytes, got {}",
                               Constants::X_25519_PRIVATE_KEY_SIZE, secret_key.size())));
    }
    if (peer_public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, RemailerFailure>::Err(
            RemailerFailure::InvalidInput(
                compat::format("X25519 public key must be {} bytes, got {}",
                               Constants::X_25519_PUBLIC_KEY_SIZE, peer_public_key.size())));
    }

    std::vector<uint8_t> shared(crypto_scalarmult_BYTES);
    if (crypto_scalarmult(shared.data(), secret_key.data(), peer_public_key.data())
        != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, RemailerFailure>::Err(
            RemailerFailure::InvalidInput("X25519 peer public key is a low-order point"));
    }
    return Result<std::vector<uint8_t>, RemailerFailure>::Ok(std::move(shared));
}

} // namespace cypherpunk::remailer::crypto
