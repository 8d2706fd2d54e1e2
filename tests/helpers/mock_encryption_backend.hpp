#pragma once
#include "cypherpunk/interfaces/i_encryption_backend.hpp"
#include "cypherpunk/core/format.hpp"
#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cypherpunk::remailer::test_helpers {

using interfaces::IEncryptionBackend;
using directory::KeyHandle;

/**
 * Reversible stand-in for a real backend: the "ciphertext" is a marker line
 * naming the recipient key followed by the plaintext, so tests can peel
 * layers without any key material. Every call is recorded; failures can be
 * injected per key identifier.
 */
class MockEncryptionBackend : public IEncryptionBackend {
public:
    static constexpr std::string_view SCHEME = "MOCK";

    struct Call {
        std::string identifier;
        std::vector<uint8_t> plaintext;
    };

    [[nodiscard]] Result<std::vector<uint8_t>, RemailerFailure> Encrypt(
        const std::span<const uint8_t> plaintext,
        const KeyHandle& recipient) override {

        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(Call{recipient.identifier, {plaintext.begin(), plaintext.end()}});
            if (failing_.contains(recipient.identifier)) {
                return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                    RemailerFailure::Generic(compat::format("injected failure for {}", recipient.identifier)));
            }
        }
        const auto marker = Marker(recipient.identifier);
        std::vector<uint8_t> sealed(marker.begin(), marker.end());
        sealed.insert(sealed.end(), plaintext.begin(), plaintext.end());
        return Result<std::vector<uint8_t>, RemailerFailure>::Ok(std::move(sealed));
    }

    [[nodiscard]] std::string Scheme() const override { return std::string(SCHEME); }

    /// Inverse of Encrypt for the given key; Err when the layer was sealed to another key.
    [[nodiscard]] static Result<std::vector<uint8_t>, RemailerFailure> Open(
        const std::span<const uint8_t> sealed,
        const std::string_view identifier) {

        const auto marker = Marker(identifier);
        if (sealed.size() < marker.size()
            || !std::equal(marker.begin(), marker.end(), sealed.begin())) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                RemailerFailure::Decode(compat::format("layer is not sealed to {}", identifier)));
        }
        return Result<std::vector<uint8_t>, RemailerFailure>::Ok(
            std::vector<uint8_t>(sealed.begin() + static_cast<std::ptrdiff_t>(marker.size()), sealed.end()));
    }

    void FailFor(std::string identifier) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(std::move(identifier));
    }

    [[nodiscard]] std::vector<Call> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    static std::string Marker(const std::string_view identifier) {
        return compat::format("[sealed-to:{}]\n", identifier);
    }

    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::set<std::string> failing_;
};

}
