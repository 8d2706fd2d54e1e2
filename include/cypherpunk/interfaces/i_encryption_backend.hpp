#pragma once
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include "cypherpunk/directory/remailer_record.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace cypherpunk::remailer::interfaces {
using remailer::Result;
using remailer::RemailerFailure;
using directory::KeyHandle;

/**
 * @brief Public-key encryption primitive consumed by the onion engine
 *
 * One call encrypts one layer to one remailer. Implementations report their
 * own errors as RemailerFailure values; the engine rewraps them as
 * BackendFailure with the hop name. Implementations must be callable from
 * several threads at once when redundancy copies run in parallel.
 */
class IEncryptionBackend {
public:
    virtual ~IEncryptionBackend() = default;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, RemailerFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        const KeyHandle& recipient) = 0;

    /// Value of the "Encrypted:" directive that announces this backend's output.
    [[nodiscard]] virtual std::string Scheme() const = 0;
};
}
