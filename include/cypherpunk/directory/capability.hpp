#pragma once
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>
namespace cypherpunk::remailer::directory {
enum class Capability : uint8_t {
    MiddleHop = 0,
    FinalDelivery = 1,
    Pgp = 2,
    Latent = 3,
    HeaderPasting = 4,
    Post = 5
};
inline constexpr Capability ALL_CAPABILITIES[] = {
    Capability::MiddleHop,
    Capability::FinalDelivery,
    Capability::Pgp,
    Capability::Latent,
    Capability::HeaderPasting,
    Capability::Post
};
class CapabilitySet {
public:
    constexpr CapabilitySet() noexcept = default;
    constexpr CapabilitySet(const std::initializer_list<Capability> capabilities) noexcept {
        for (const auto capability : capabilities) {
            bits_ |= Bit(capability);
        }
    }
    [[nodiscard]] constexpr bool Has(const Capability capability) const noexcept {
        return (bits_ & Bit(capability)) != 0;
    }
    [[nodiscard]] constexpr CapabilitySet With(const Capability capability) const noexcept {
        CapabilitySet copy = *this;
        copy.bits_ |= Bit(capability);
        return copy;
    }
    [[nodiscard]] constexpr CapabilitySet Without(const Capability capability) const noexcept {
        CapabilitySet copy = *this;
        copy.bits_ &= static_cast<uint8_t>(~Bit(capability));
        return copy;
    }
    [[nodiscard]] constexpr bool Empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] constexpr uint32_t ToBits() const noexcept { return bits_; }
    [[nodiscard]] static constexpr CapabilitySet FromBits(const uint32_t bits) noexcept {
        CapabilitySet set;
        set.bits_ = static_cast<uint8_t>(bits & ALL_BITS);
        return set;
    }
    [[nodiscard]] std::vector<Capability> ToList() const;
    constexpr bool operator==(const CapabilitySet& other) const noexcept { return bits_ == other.bits_; }
    constexpr bool operator!=(const CapabilitySet& other) const noexcept { return bits_ != other.bits_; }
private:
    static constexpr uint8_t ALL_BITS = 0x3F;
    static constexpr uint8_t Bit(const Capability capability) noexcept {
        return static_cast<uint8_t>(1u << static_cast<uint8_t>(capability));
    }
    uint8_t bits_ = 0;
};
[[nodiscard]] std::string_view ToString(Capability capability) noexcept;
[[nodiscard]] constexpr Capability RequiredCapability(const bool is_last_position) noexcept {
    return is_last_position ? Capability::FinalDelivery : Capability::MiddleHop;
}
}
