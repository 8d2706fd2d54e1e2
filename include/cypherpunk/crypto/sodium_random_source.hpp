#pragma once
#include "cypherpunk/interfaces/i_random_source.hpp"
#include "cypherpunk/crypto/sodium_interop.hpp"
namespace cypherpunk::remailer::crypto {
class SodiumRandomSource final : public interfaces::IRandomSource {
public:
    [[nodiscard]] uint32_t Uniform(const uint32_t upper_bound) override {
        return SodiumInterop::UniformRandom(upper_bound);
    }
    [[nodiscard]] bool IsThreadSafe() const noexcept override { return true; }
};
}
