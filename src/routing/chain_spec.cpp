#include "cypherpunk/routing/chain_spec.hpp"
#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/core/format.hpp"

namespace cypherpunk::remailer::routing {

Result<ChainSpec, RemailerFailure> ChainSpec::Parse(const std::vector<std::string>& tokens) {
    std::vector<ChainToken> parsed;
    parsed.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string_view raw = tokens[i];
        const auto first = raw.find_first_not_of(" \t");
        if (first == std::string_view::npos) {
            return Result<ChainSpec, RemailerFailure>::Err(
                RemailerFailure::InvalidInput(
                    compat::format("Chain entry {} is blank", i)));
        }
        const auto last = raw.find_last_not_of(" \t");
        const auto token = raw.substr(first, last - first + 1);
        if (token == WireFormat::WILDCARD_TOKEN) {
            parsed.push_back(ChainToken::Wildcard());
        } else {
            parsed.push_back(ChainToken::Literal(std::string(token)));
        }
    }
    return Result<ChainSpec, RemailerFailure>::Ok(ChainSpec(std::move(parsed)));
}

std::string ChainSpec::ToString() const {
    std::string out;
    for (const auto& token : tokens_) {
        if (!out.empty()) {
            out += ',';
        }
        out += token.IsWildcard() ? std::string(WireFormat::WILDCARD_TOKEN) : token.name;
    }
    return out;
}

}
