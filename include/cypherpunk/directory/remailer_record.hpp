#pragma once
#include "cypherpunk/directory/capability.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
namespace cypherpunk::remailer::directory {
struct KeyHandle {
    std::string identifier;
    std::vector<uint8_t> material;
};
struct RemailerRecord {
    std::string name;
    std::string address;
    KeyHandle key;
    CapabilitySet capabilities;
    std::chrono::seconds latency{0};
    double uptime_percent = 0.0;
    [[nodiscard]] bool Supports(const Capability capability) const noexcept {
        return capabilities.Has(capability);
    }
};
}
