#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "mnemo/memory/reranker.hpp"

#include <memory>

namespace {

using mnemo::memory::RerankingService;
using mnemo::memory::SimilarityResult;
using mnemo::testing::ScriptedCompletionClient;

std::vector<SimilarityResult> ranked(const std::size_t count) {
  std::vector<SimilarityResult> out;
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(SimilarityResult{.memory_id = "m" + std::to_string(i + 1),
                                   .content = "memory number " + std::to_string(i + 1),
                                   .relevance = 0.9 - 0.01 * static_cast<double>(i),
                                   .created_at = "2025-01-06T10:00:00Z"});
  }
  return out;
}

mnemo::config::RerankingConfig reranking(const bool enabled) {
  mnemo::config::RerankingConfig config;
  config.enabled = enabled;
  return config;
}

const mnemo::providers::ModelSettings kModel{.model = "test-model", .temperature = 0.1,
                                             .timeout_ms = 1000};

} // namespace

void register_reranker_tests(std::vector<mnemo::tests::TestCase> &tests) {
  using mnemo::tests::require;

  tests.push_back({"rerank_disabled_keeps_similarity_order", [] {
                     auto client = std::make_shared<ScriptedCompletionClient>();
                     RerankingService service(client, reranking(false), kModel);
                     const auto outcome = service.select("where do I live", ranked(3), 2);
                     require(!outcome.reranked, "disabled reranker should not rerank");
                     require(outcome.results.size() == 2, "result should be truncated");
                     require(outcome.results[0].memory_id == "m1" &&
                                 outcome.results[1].memory_id == "m2",
                             "similarity order should be preserved");
                     require(client->calls() == 0, "model must not be called");
                   }});

  tests.push_back({"rerank_trigger_threshold", [] {
                     auto client = std::make_shared<ScriptedCompletionClient>();
                     RerankingService service(client, reranking(true), kModel);
                     require(!service.should_rerank(8, 10), "8 <= floor(10 * 0.8)");
                     require(service.should_rerank(9, 10), "9 > floor(10 * 0.8)");
                     require(!RerankingService(nullptr, reranking(true), kModel)
                                  .should_rerank(50, 10),
                             "no client means no reranking");

                     const auto outcome = service.select("query", ranked(8), 10);
                     require(!outcome.reranked && outcome.results.size() == 8,
                             "below the trigger everything is returned");
                   }});

  tests.push_back({"rerank_uses_model_order_within_pool", [] {
                     auto client = std::make_shared<ScriptedCompletionClient>();
                     client->push_reply(R"({"ids":["m3","m1","m3","m99","m5"]})");
                     RerankingService service(client, reranking(true), kModel);
                     const auto outcome = service.select("where do I live", ranked(6), 3);

                     require(outcome.reranked, "model answer should be used");
                     require(outcome.results.size() == 2, "m5 lies outside the pool of 4");
                     require(outcome.results[0].memory_id == "m3" &&
                                 outcome.results[1].memory_id == "m1",
                             "model order should be kept without duplicates");

                     const auto request = client->last_request();
                     require(request.has_value(), "request should be recorded");
                     require(request->schema.has_value() && request->schema->name ==
                                                                "memory_selection",
                             "selection schema should be requested");
                     require(request->user_prompt.find("[id:m4]") != std::string::npos &&
                                 request->user_prompt.find("[id:m5]") == std::string::npos,
                             "prompt should contain exactly the extended pool");
                     require(request->user_prompt.find("USER MESSAGE: where do I live") !=
                                 std::string::npos,
                             "prompt should contain the query");
                     require(request->model == "test-model" && request->timeout_ms == 1000,
                             "model settings should be forwarded");
                   }});

  tests.push_back({"rerank_caps_at_max_returned", [] {
                     auto client = std::make_shared<ScriptedCompletionClient>();
                     client->push_reply(R"({"ids":["m4","m3","m2","m1"]})");
                     RerankingService service(client, reranking(true), kModel);
                     const auto outcome = service.select("q", ranked(6), 3);
                     require(outcome.results.size() == 3 && outcome.results[0].memory_id == "m4",
                             "selection should be capped");
                   }});

  tests.push_back({"rerank_empty_selection_means_none", [] {
                     auto client = std::make_shared<ScriptedCompletionClient>();
                     client->push_reply(R"({"ids":[]})");
                     RerankingService service(client, reranking(true), kModel);
                     const auto outcome = service.select("q", ranked(6), 3);
                     require(outcome.reranked && outcome.results.empty(),
                             "an empty list is a valid answer");
                   }});

  tests.push_back({"rerank_failure_falls_back_to_truncation", [] {
                     mnemo::testing::ObserverCapture capture;
                     auto client = std::make_shared<ScriptedCompletionClient>();
                     client->push_error(mnemo::common::ErrorKind::Timeout, "slow model");
                     client->push_reply(R"({"ids":[1,2]})");
                     RerankingService service(client, reranking(true), kModel);

                     const auto timed_out = service.select("q", ranked(6), 3);
                     require(!timed_out.reranked && timed_out.fallback_reason.has_value(),
                             "timeout should fall back");
                     require(timed_out.results.size() == 3 &&
                                 timed_out.results[0].memory_id == "m1",
                             "fallback keeps similarity order");

                     const auto malformed = service.select("q", ranked(6), 3);
                     require(!malformed.reranked && malformed.results.size() == 3,
                             "non-string ids should fall back");
                     require(capture.has_error("reranker", "falling back"),
                             "fallback should be logged");

                     bool saw_timeout = false;
                     for (const auto &event : capture.events()) {
                       if (const auto *timeout =
                               std::get_if<mnemo::observability::StageTimeoutEvent>(&event)) {
                         saw_timeout = saw_timeout || timeout->component == "reranker";
                       }
                     }
                     require(saw_timeout, "stage timeout should be recorded");
                   }});
}
