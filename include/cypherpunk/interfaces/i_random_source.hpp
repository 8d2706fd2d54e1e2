#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
namespace cypherpunk::remailer::interfaces {
class IRandomSource {
public:
    virtual ~IRandomSource() = default;
    /// Uniform value in [0, upper_bound); upper_bound is never 0.
    [[nodiscard]] virtual uint32_t Uniform(uint32_t upper_bound) = 0;
    [[nodiscard]] virtual bool IsThreadSafe() const noexcept = 0;
};
class LockedRandomSource final : public IRandomSource {
public:
    explicit LockedRandomSource(IRandomSource& inner) : inner_(inner) {}
    [[nodiscard]] uint32_t Uniform(const uint32_t upper_bound) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return inner_.Uniform(upper_bound);
    }
    [[nodiscard]] bool IsThreadSafe() const noexcept override { return true; }
private:
    IRandomSource& inner_;
    std::mutex mutex_;
};
}
