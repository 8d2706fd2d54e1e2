#pragma once
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
namespace cypherpunk::remailer::routing {
struct ChainToken {
    enum class Kind : uint8_t { Literal, Wildcard };

    Kind kind = Kind::Wildcard;
    std::string name;

    [[nodiscard]] static ChainToken Literal(std::string remailer_name) {
        return ChainToken{Kind::Literal, std::move(remailer_name)};
    }
    [[nodiscard]] static ChainToken Wildcard() {
        return ChainToken{Kind::Wildcard, {}};
    }
    [[nodiscard]] bool IsWildcard() const noexcept { return kind == Kind::Wildcard; }
};

class ChainSpec {
public:
    ChainSpec() = default;
    explicit ChainSpec(std::vector<ChainToken> tokens) : tokens_(std::move(tokens)) {}

    /// "*" becomes a wildcard, anything else a literal name; blank tokens are refused.
    [[nodiscard]] static Result<ChainSpec, RemailerFailure> Parse(const std::vector<std::string>& tokens);

    [[nodiscard]] const std::vector<ChainToken>& Tokens() const noexcept { return tokens_; }
    [[nodiscard]] size_t Length() const noexcept { return tokens_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return tokens_.empty(); }
    [[nodiscard]] std::string ToString() const;

private:
    std::vector<ChainToken> tokens_;
};
}
