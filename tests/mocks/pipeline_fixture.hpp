#pragma once

#include <catch2/catch_test_macros.hpp>
#include "core/pipeline.hpp"
#include "mocks/mock_interpreter_client.hpp"
#include "mocks/mock_review_source.hpp"
#include "mocks/review_fixtures.hpp"

#include <memory>
#include <string>
#include <vector>

namespace reviewgate::testing {

/**
 * @brief Full turn pipeline over the sample corpus with a scripted interpreter
 */
struct PipelineFixture {
    std::shared_ptr<InMemoryUserDirectory> directory =
        std::make_shared<InMemoryUserDirectory>(sample_users());
    std::shared_ptr<MockReviewSource> source = std::make_shared<MockReviewSource>(sample_rows());
    std::shared_ptr<AccessModel> access = std::make_shared<AccessModel>(directory, source);
    std::shared_ptr<ToolRegistry> registry = std::make_shared<ToolRegistry>();
    std::shared_ptr<MockInterpreterClient> client = std::make_shared<MockInterpreterClient>();
    std::shared_ptr<TurnPipeline> pipeline;

    PipelineFixture() {
        directory->set_catalog(source);

        IntentRouter::Config router_cfg;
        router_cfg.retry.max_attempts = 3;
        router_cfg.retry.base_delay = std::chrono::milliseconds(1);
        router_cfg.retry.max_delay = std::chrono::milliseconds(2);

        AccessCache::Config cache_cfg;
        cache_cfg.ttl = std::chrono::seconds(60);

        PipelineComponents c;
        c.access = access;
        c.router = std::make_shared<IntentRouter>(client, registry, router_cfg);
        c.validator = std::make_shared<Validator>(registry, access, Validator::Config{});
        c.fallback = std::make_shared<FallbackPolicy>(access, FallbackPolicy::Config{});
        c.executor = std::make_shared<ToolExecutor>(access, source,
                                                    std::make_shared<AccessCache>(cache_cfg),
                                                    ToolExecutor::Config{});
        c.trace = std::make_shared<TraceRecorder>(access, TraceRecorder::Config{});
        c.conversations = std::make_shared<ConversationStore>();
        pipeline = std::make_shared<TurnPipeline>(std::move(c));
    }

    Result<TurnResponse> ask(UserId user, ConversationId conv, std::string utterance,
                             CancellationToken cancel = {}) {
        TurnRequest req;
        req.user_id = user;
        req.conversation_id = conv;
        req.utterance = std::move(utterance);
        req.cancel = std::move(cancel);
        return pipeline->process(req);
    }

    std::vector<TraceRecord> traces() {
        auto r = pipeline->trace()->recent(kAdmin, 100);
        REQUIRE(r.is_ok());
        return r.value();
    }
};

} // namespace reviewgate::testing
