#include "cypherpunk/crypto/armor.hpp"
#include "cypherpunk/core/format.hpp"

#include <openssl/evp.h>
#include <algorithm>
#include <sstream>

namespace cypherpunk::remailer::crypto {
namespace {
    constexpr uint32_t CRC24_INIT = 0xB704CEu;
    constexpr uint32_t CRC24_POLY = 0x1864CFBu;
    constexpr uint32_t CRC24_MASK = 0xFFFFFFu;
    constexpr size_t CRC24_BYTES = 3;

    std::string BeginLine(const std::string_view label) {
        return compat::format("-----BEGIN {}-----", label);
    }

    std::string EndLine(const std::string_view label) {
        return compat::format("-----END {}-----", label);
    }

    std::string Base64Encode(const std::span<const uint8_t> data) {
        if (data.empty()) {
            return {};
        }
        std::string encoded(4 * ((data.size() + 2) / 3), '\0');
        const int written = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(encoded.data()),
            data.data(),
            static_cast<int>(data.size()));
        encoded.resize(static_cast<size_t>(written));
        return encoded;
    }

    Result<std::vector<uint8_t>, RemailerFailure> Base64Decode(const std::string_view text) {
        if (text.empty()) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Ok({});
        }
        if (text.size() % 4 != 0) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                RemailerFailure::Decode("Armored body length is not a multiple of 4"));
        }
        std::vector<uint8_t> decoded(3 * (text.size() / 4));
        const int written = EVP_DecodeBlock(
            decoded.data(),
            reinterpret_cast<const unsigned char*>(text.data()),
            static_cast<int>(text.size()));
        if (written < 0) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                RemailerFailure::Decode("Armored body is not valid base64"));
        }
        const auto padding = static_cast<size_t>(
            std::count(text.end() - std::min<size_t>(2, text.size()), text.end(), '='));
        decoded.resize(static_cast<size_t>(written) - padding);
        return Result<std::vector<uint8_t>, RemailerFailure>::Ok(std::move(decoded));
    }
}

uint32_t Armor::Crc24(const std::span<const uint8_t> data) noexcept {
    uint32_t crc = CRC24_INIT;
    for (const auto byte : data) {
        crc ^= static_cast<uint32_t>(byte) << 16;
        for (int i = 0; i < 8; ++i) {
            crc <<= 1;
            if (crc & 0x1000000u) {
                crc ^= CRC24_POLY;
            }
        }
    }
    return crc & CRC24_MASK;
}

std::string Armor::Encode(const std::span<const uint8_t> data, const std::string_view label) {
    const std::string body = Base64Encode(data);
    std::string armored = BeginLine(label);
    armored += WireFormat::NEWLINE;
    armored += WireFormat::NEWLINE;
    for (size_t offset = 0; offset < body.size(); offset += WireFormat::ARMOR_LINE_LENGTH) {
        armored += body.substr(offset, WireFormat::ARMOR_LINE_LENGTH);
        armored += WireFormat::NEWLINE;
    }
    const uint32_t crc = Crc24(data);
    const uint8_t crc_bytes[CRC24_BYTES] = {
        static_cast<uint8_t>(crc >> 16),
        static_cast<uint8_t>(crc >> 8),
        static_cast<uint8_t>(crc)
    };
    armored += '=';
    armored += Base64Encode(crc_bytes);
    armored += WireFormat::NEWLINE;
    armored += EndLine(label);
    armored += WireFormat::NEWLINE;
    return armored;
}

Result<std::vector<uint8_t>, RemailerFailure> Armor::Decode(
    const std::string_view armored,
    const std::string_view label) {

    const std::string begin = BeginLine(label);
    const std::string end = EndLine(label);
    const auto begin_pos = armored.find(begin);
    if (begin_pos == std::string_view::npos) {
        return Result<std::vector<uint8_t>, RemailerFailure>::Err(
            RemailerFailure::Decode(compat::format("Missing '{}' line", begin)));
    }
    const auto end_pos = armored.find(end, begin_pos + begin.size());
    if (end_pos == std::string_view::npos) {
        return Result<std::vector<uint8_t>, RemailerFailure>::Err(
            RemailerFailure::Decode(compat::format("Missing '{}' line", end)));
    }

    std::istringstream lines{std::string(armored.substr(begin_pos + begin.size(),
                                                       end_pos - begin_pos - begin.size()))};
    std::string line;
    std::string body;
    std::string checksum;
    bool begin_line_rest = true;
    bool in_headers = true;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (begin_line_rest) {
            begin_line_rest = false;
            continue;
        }
        if (in_headers) {
            if (line.empty()) {
                in_headers = false;
                continue;
            }
            if (line.find(':') != std::string::npos) {
                continue;
            }
            in_headers = false;
        }
        if (line.empty()) {
            continue;
        }
        if (line.front() == '=') {
            checksum = line.substr(1);
            continue;
        }
        body += line;
    }

    auto decoded = Base64Decode(body);
    if (decoded.IsErr()) {
        return decoded;
    }
    if (!checksum.empty()) {
        auto crc_bytes = Base64Decode(checksum);
        if (crc_bytes.IsErr() || crc_bytes.Unwrap().size() != CRC24_BYTES) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                RemailerFailure::Decode("Malformed armor checksum line"));
        }
        const auto& crc = crc_bytes.Unwrap();
        const uint32_t expected = (static_cast<uint32_t>(crc[0]) << 16)
                                | (static_cast<uint32_t>(crc[1]) << 8)
                                | static_cast<uint32_t>(crc[2]);
        if (expected != Crc24(decoded.Unwrap())) {
            return Result<std::vector<uint8_t>, RemailerFailure>::Err(
                RemailerFailure::Decode("Armor checksum mismatch"));
        }
    }
    return decoded;
}

}
