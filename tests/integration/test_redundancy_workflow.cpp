#include <catch2/catch_test_macros.hpp>
#include "cypherpunk/output/output_formatter.hpp"
#include "cypherpunk/routing/redundancy_multiplexer.hpp"
#include "helpers/directory_fixtures.hpp"
#include "helpers/layer_peeler.hpp"
#include "helpers/mock_encryption_backend.hpp"
#include "helpers/sequence_random_source.hpp"
#include <set>

using namespace cypherpunk::remailer;
using namespace cypherpunk::remailer::routing;
using namespace cypherpunk::remailer::test_helpers;
using configuration::ChainConfig;

namespace {
    envelope::OutgoingMessage Message() {
        envelope::OutgoingMessage message;
        message.recipient = "bob@example.org";
        const std::string body = "redundant\n";
        message.body.assign(body.begin(), body.end());
        return message;
    }

    ChainSpec Spec(const std::vector<std::string>& tokens) {
        return ChainSpec::Parse(tokens).Unwrap();
    }

    class RecordingHandler : public interfaces::IRoutingEventHandler {
    public:
        void OnCopyCompleted(const size_t copy_index, const std::vector<std::string>& hop_names) override {
            completed.emplace_back(copy_index, hop_names);
        }
        void OnCopyFailed(const size_t copy_index, const RemailerFailure& failure) override {
            failed.emplace_back(copy_index, failure.type);
        }

        std::vector<std::pair<size_t, std::vector<std::string>>> completed;
        std::vector<std::pair<size_t, RemailerFailureType>> failed;
    };

    struct MuxContext {
        RemailerDirectory directory;
        MockEncryptionBackend backend;
        std::unique_ptr<OnionEngine> engine;

        explicit MuxContext(RemailerDirectory dir, const ChainConfig& config = ChainConfig::Default())
            : directory(std::move(dir)) {
            auto created = OnionEngine::Create(backend, config);
            REQUIRE(created.IsOk());
            engine = std::make_unique<OnionEngine>(std::move(created).Unwrap());
        }
    };
}

TEST_CASE("Redundancy - Independent copies", "[integration][redundancy]") {
    MuxContext ctx(PoolDirectory(5));
    SequenceRandomSource rng({0, 3, 1, 2, 4, 0, 2, 1});
    RedundancyMultiplexer multiplexer(ctx.directory, *ctx.engine, rng, ChainConfig::Default());
    auto handler = std::make_shared<RecordingHandler>();
    multiplexer.SetEventHandler(handler);

    auto routed = multiplexer.Route(Spec({"*", "*"}), Message(), 4);
    REQUIRE(routed.IsOk());
    const auto& report = routed.Unwrap();

    REQUIRE(report.SuccessCount() == 4);
    REQUIRE(report.AllSucceeded());
    std::set<std::vector<std::string>> distinct_chains;
    for (size_t i = 0; i < report.results.size(); ++i) {
        REQUIRE(report.results[i].copy_index == i);
        distinct_chains.insert(report.results[i].resolved_chain.HopNames());
    }
    REQUIRE(distinct_chains.size() > 1);
    REQUIRE(rng.Requests() == 8);

    REQUIRE(handler->completed.size() == 4);
    REQUIRE(handler->failed.empty());
    for (size_t i = 0; i < 4; ++i) {
        REQUIRE(handler->completed[i].first == i);
        REQUIRE(handler->completed[i].second == report.results[i].resolved_chain.HopNames());
    }

    SECTION("Every copy formats and peels on its own") {
        const output::OutputFormatter formatter(ChainConfig::Default());
        for (const auto& result : report.results) {
            auto native = formatter.Format(result);
            REQUIRE(native.IsOk());
            const auto entry = PeelMock(result.ciphertext, result.resolved_chain.hops[0]->key.identifier);
            REQUIRE(entry.recipient_directive == result.resolved_chain.hops[1]->address);
        }
    }
}

TEST_CASE("Redundancy - Partial failure", "[integration][redundancy]") {
    MuxContext ctx(BuildDirectory({MakeRecord("entry", MIDDLE_ONLY), MakeRecord("good"), MakeRecord("bad")}));
    ctx.backend.FailFor("remailer@bad.example");
    // exit candidates are {bad, good}
    SequenceRandomSource rng({1, 0, 1, 0});
    RedundancyMultiplexer multiplexer(ctx.directory, *ctx.engine, rng, ChainConfig::Default());
    auto handler = std::make_shared<RecordingHandler>();
    multiplexer.SetEventHandler(handler);

    auto routed = multiplexer.Route(Spec({"entry", "*"}), Message(), 4);
    REQUIRE(routed.IsOk());
    const auto& report = routed.Unwrap();

    REQUIRE(report.SuccessCount() == 2);
    REQUIRE(report.failures.size() == 2);
    REQUIRE_FALSE(report.AllSucceeded());
    REQUIRE(report.AnySucceeded());
    REQUIRE(report.results[0].copy_index == 0);
    REQUIRE(report.results[1].copy_index == 2);
    REQUIRE(report.failures[0].copy_index == 1);
    REQUIRE(report.failures[1].copy_index == 3);
    for (const auto& failed : report.failures) {
        REQUIRE(failed.failure.type == RemailerFailureType::BackendFailure);
        REQUIRE(failed.failure.remailer == "bad");
    }
    REQUIRE(handler->failed == std::vector<std::pair<size_t, RemailerFailureType>>{
        {1, RemailerFailureType::BackendFailure},
        {3, RemailerFailureType::BackendFailure}});
}

TEST_CASE("Redundancy - Whole-call rejections", "[integration][redundancy]") {
    MuxContext ctx(PoolDirectory(2));
    SequenceRandomSource rng({0});
    const RedundancyMultiplexer multiplexer(
        ctx.directory, *ctx.engine, rng, ChainConfig::Default().WithMaxRedundancy(3).WithMaxChainLength(2));

    SECTION("Zero copies") {
        auto routed = multiplexer.Route(Spec({"*"}), Message(), 0);
        REQUIRE(routed.IsErr());
        REQUIRE(routed.UnwrapErr().type == RemailerFailureType::InvalidInput);
    }
    SECTION("More copies than allowed") {
        REQUIRE(multiplexer.Route(Spec({"*"}), Message(), 4).IsErr());
    }
    SECTION("Empty chain") {
        auto routed = multiplexer.Route(ChainSpec{}, Message(), 2);
        REQUIRE(routed.IsErr());
        REQUIRE(routed.UnwrapErr().type == RemailerFailureType::EmptyChain);
    }
    SECTION("Chain longer than allowed") {
        auto routed = multiplexer.Route(Spec({"*", "*", "*"}), Message(), 2);
        REQUIRE(routed.IsErr());
        REQUIRE(routed.UnwrapErr().type == RemailerFailureType::ChainTooLong);
    }
    SECTION("Unknown remailer fails every copy but not the call") {
        auto routed = multiplexer.Route(Spec({"unknownname"}), Message(), 2);
        REQUIRE(routed.IsOk());
        REQUIRE(routed.Unwrap().failures.size() == 2);
        REQUIRE(routed.Unwrap().failures[1].failure.type == RemailerFailureType::UnknownRemailer);
    }
    REQUIRE(ctx.backend.CallCount() == 0);
}
