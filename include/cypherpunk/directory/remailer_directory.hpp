#pragma once
#include "cypherpunk/directory/remailer_record.hpp"
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
namespace cypherpunk::remailer::directory {
using RecordPtr = std::shared_ptr<const RemailerRecord>;

/**
 * @brief Immutable name -> remailer mapping shared by all resolutions
 *
 * Names are case-insensitive; records are stored under their lower-case
 * name and iterated in name order, so Eligible() is stable across calls.
 * Nothing mutates a directory after Create(), which makes concurrent
 * reads from parallel redundancy copies safe without locking.
 */
class RemailerDirectory {
public:
    [[nodiscard]] static Result<RemailerDirectory, RemailerFailure>
    Create(std::vector<RemailerRecord> records);

    [[nodiscard]] Result<RecordPtr, RemailerFailure> Lookup(std::string_view name) const;

    [[nodiscard]] bool Contains(std::string_view name) const;

    [[nodiscard]] std::vector<RecordPtr> Eligible(Capability capability) const;

    /**
     * @brief Eligible records whose reported uptime reaches @p min_uptime
     *
     * Used for wildcard draws only; literal chain entries bypass the filter.
     */
    [[nodiscard]] std::vector<RecordPtr> Eligible(Capability capability, double min_uptime) const;

    [[nodiscard]] std::vector<RecordPtr> Records() const;

    [[nodiscard]] size_t Size() const noexcept { return records_.size(); }

    [[nodiscard]] static std::string NormalizeName(std::string_view name);

private:
    RemailerDirectory() = default;

    std::map<std::string, RecordPtr, std::less<>> records_;
};
}
