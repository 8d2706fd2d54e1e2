#pragma once
#include "cypherpunk/directory/remailer_directory.hpp"
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
namespace cypherpunk::proto::directory {
    class DirectorySnapshot;
}
namespace cypherpunk::remailer::directory {
class DirectoryCodec {
public:
    static constexpr uint32_t SNAPSHOT_VERSION = 1;

    [[nodiscard]] static proto::directory::DirectorySnapshot
    ToProto(const RemailerDirectory& directory,
            const std::optional<std::string>& last_update = std::nullopt);

    [[nodiscard]] static Result<RemailerDirectory, RemailerFailure>
    FromProto(const proto::directory::DirectorySnapshot& snapshot);

    [[nodiscard]] static Result<std::vector<uint8_t>, RemailerFailure>
    Serialize(const RemailerDirectory& directory,
              const std::optional<std::string>& last_update = std::nullopt);

    [[nodiscard]] static Result<RemailerDirectory, RemailerFailure>
    Parse(std::span<const uint8_t> bytes);
private:
    DirectoryCodec() = delete;
};
}
