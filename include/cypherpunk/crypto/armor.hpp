#pragma once
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include "cypherpunk/core/constants.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace cypherpunk::remailer::crypto {

/**
 * @brief OpenPGP-style ASCII armor (RFC 4880 section 6)
 *
 *   -----BEGIN <label>-----
 *   <blank line>
 *   base64 body, 64 columns
 *   =<base64 CRC-24>
 *   -----END <label>-----
 *
 * Armor headers ("Version: ...") between the BEGIN line and the blank line
 * are skipped on decode.
 */
class Armor {
public:
    [[nodiscard]] static std::string Encode(
        std::span<const uint8_t> data,
        std::string_view label = WireFormat::ARMOR_LABEL);

    [[nodiscard]] static Result<std::vector<uint8_t>, RemailerFailure> Decode(
        std::string_view armored,
        std::string_view label = WireFormat::ARMOR_LABEL);

    [[nodiscard]] static uint32_t Crc24(std::span<const uint8_t> data) noexcept;

private:
    Armor() = delete;
};
}
