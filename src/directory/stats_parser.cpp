#include "cypherpunk/directory/stats_parser.hpp"
#include "cypherpunk/directory/remailer_directory.hpp"
#include "cypherpunk/core/format.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <map>
#include <regex>
#include <sstream>

namespace cypherpunk::remailer::directory {
namespace {
    const std::regex& DeclarationPattern() {
        static const std::regex pattern(
            R"re(^\$remailer\{"([A-Za-z0-9_-]+)"\}\s*=\s*"<([^>\s]+@[^>\s]+)>((?:\s+[A-Za-z0-9]+)*)\s*";\s*$)re");
        return pattern;
    }

    const std::regex& StatisticsPattern() {
        static const std::regex pattern(
            R"re(^([A-Za-z0-9_-]+)\s+([^\s@]+@\S+)\s+.*?\s((?:\d+:)?[0-5]?\d:[0-5]\d)\s+(\d{1,3}(?:\.\d{1,2})?)%\s*$)re");
        return pattern;
    }

    const std::regex& LastUpdatePattern() {
        static const std::regex pattern(R"re(^Last update:\s+(.+?)\s*$)re");
        return pattern;
    }

    const std::regex& LatencyPattern() {
        static const std::regex pattern(R"re(^(?:(\d+):)?([0-5]?\d):([0-5]\d)$)re");
        return pattern;
    }

    std::vector<std::string> SplitWords(const std::string& text) {
        std::vector<std::string> words;
        std::istringstream stream(text);
        std::string word;
        while (stream >> word) {
            words.push_back(word);
        }
        return words;
    }

    uint64_t ToNumber(const std::string& digits) {
        uint64_t value = 0;
        std::from_chars(digits.data(), digits.data() + digits.size(), value);
        return value;
    }

    RemailerRecord& Slot(std::map<std::string, RemailerRecord>& records,
                         const std::string& name,
                         const std::string& address) {
        const auto normalized = RemailerDirectory::NormalizeName(name);
        auto [it, inserted] = records.try_emplace(normalized);
        if (inserted) {
            it->second.name = normalized;
            it->second.address = address;
            it->second.key.identifier = address;
        }
        return it->second;
    }
}

CapabilitySet StatsParser::CapabilitiesFromOptions(const std::vector<std::string>& options) {
    const auto has = [&options](const std::string_view word) {
        return std::find(options.begin(), options.end(), word) != options.end();
    };
    CapabilitySet capabilities;
    if (has("pgp")) {
        capabilities = capabilities.With(Capability::Pgp);
    }
    if (has("cpunk") && has("pgp")) {
        capabilities = capabilities.With(Capability::MiddleHop);
        if (!has("middle")) {
            capabilities = capabilities.With(Capability::FinalDelivery);
        }
    }
    if (has("latent")) {
        capabilities = capabilities.With(Capability::Latent);
    }
    if (has("hash")) {
        capabilities = capabilities.With(Capability::HeaderPasting);
    }
    if (has("post")) {
        capabilities = capabilities.With(Capability::Post);
    }
    return capabilities;
}

std::optional<std::chrono::seconds> StatsParser::ParseLatency(const std::string_view text) {
    const std::string input(text);
    std::smatch match;
    if (!std::regex_match(input, match, LatencyPattern())) {
        return std::nullopt;
    }
    const uint64_t hours = match[1].matched ? ToNumber(match[1].str()) : 0;
    const uint64_t minutes = ToNumber(match[2].str());
    const uint64_t seconds = ToNumber(match[3].str());
    return std::chrono::seconds(static_cast<int64_t>(hours * 3600 + minutes * 60 + seconds));
}

Result<StatsReport, RemailerFailure> StatsParser::Parse(const std::string_view text) {
    std::map<std::string, RemailerRecord> records;
    StatsReport report;
    std::istringstream stream{std::string(text)};
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::smatch match;
        if (std::regex_match(line, match, DeclarationPattern())) {
            auto& record = Slot(records, match[1].str(), match[2].str());
            record.capabilities = CapabilitiesFromOptions(SplitWords(match[3].str()));
        } else if (std::regex_match(line, match, LastUpdatePattern())) {
            report.last_update = match[1].str();
        } else if (std::regex_match(line, match, StatisticsPattern())) {
            auto& record = Slot(records, match[1].str(), match[2].str());
            record.latency = ParseLatency(match[3].str()).value_or(std::chrono::seconds(0));
            record.uptime_percent = std::stod(match[4].str());
        }
    }
    if (records.empty()) {
        return Result<StatsReport, RemailerFailure>::Err(
            RemailerFailure::Decode("No remailer entries found in statistics text"));
    }
    report.records.reserve(records.size());
    for (auto& [name, record] : records) {
        report.records.push_back(std::move(record));
    }
    return Result<StatsReport, RemailerFailure>::Ok(std::move(report));
}

Result<size_t, RemailerFailure> StatsParser::AttachKeys(
    std::vector<RemailerRecord>& records,
    const std::filesystem::path& key_dir,
    const std::string_view extension) {

    using CountResult = Result<size_t, RemailerFailure>;
    std::error_code ec;
    if (!std::filesystem::is_directory(key_dir, ec)) {
        return CountResult::Err(RemailerFailure::InvalidInput(
            compat::format("Key directory {} does not exist", key_dir.string())));
    }

    size_t attached = 0;
    for (auto& record : records) {
        const auto path = key_dir / (record.name + std::string(extension));
        if (!std::filesystem::is_regular_file(path, ec)) {
            continue;
        }
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return CountResult::Err(RemailerFailure::Generic(
                compat::format("Cannot read key file {}", path.string())));
        }
        std::vector<uint8_t> key((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (key.empty()) {
            return CountResult::Err(RemailerFailure::InvalidInput(
                compat::format("Key file {} is empty", path.string())));
        }
        record.key.material = std::move(key);
        ++attached;
    }
    return CountResult::Ok(attached);
}


}
