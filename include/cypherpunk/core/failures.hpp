#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
namespace cypherpunk::remailer {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    SecureWipeFailed,
    InvalidOperation
};
enum class RemailerFailureType {
    UnknownRemailer,
    CapabilityMismatch,
    EmptyChain,
    NoEligibleRemailer,
    BackendFailure,
    UnsupportedFormat,
    ChainTooLong,
    InvalidInput,
    Decode,
    Encode,
    Cancelled,
    Generic
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class RemailerFailure {
public:
    RemailerFailureType type;
    std::string message;
    std::optional<std::string> remailer;
    std::optional<std::size_t> position;
    RemailerFailure(const RemailerFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static RemailerFailure UnknownRemailer(std::string name);
    static RemailerFailure CapabilityMismatch(std::string name, std::size_t chain_position,
                                              std::string_view required);
    static RemailerFailure EmptyChain();
    static RemailerFailure NoEligibleRemailer(std::size_t chain_position, std::string_view required);
    static RemailerFailure BackendFailure(std::string hop_name, std::string_view cause);
    static RemailerFailure UnsupportedFormat(std::string format_name);
    static RemailerFailure ChainTooLong(std::size_t length, std::size_t limit);
    static RemailerFailure InvalidInput(std::string msg) {
        return {RemailerFailureType::InvalidInput, std::move(msg)};
    }
    static RemailerFailure Decode(std::string msg) {
        return {RemailerFailureType::Decode, std::move(msg)};
    }
    static RemailerFailure Encode(std::string msg) {
        return {RemailerFailureType::Encode, std::move(msg)};
    }
    static RemailerFailure Cancelled(std::string msg) {
        return {RemailerFailureType::Cancelled, std::move(msg)};
    }
    static RemailerFailure Generic(std::string msg) {
        return {RemailerFailureType::Generic, std::move(msg)};
    }
    static RemailerFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] std::string Describe() const;
};
[[nodiscard]] std::string_view ToString(RemailerFailureType type) noexcept;
}
