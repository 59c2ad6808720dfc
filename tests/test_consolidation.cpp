#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "mnemo/memory/consolidation.hpp"

#include <memory>

namespace {

using mnemo::memory::CancellationToken;
using mnemo::memory::ConsolidationOperation;
using mnemo::memory::ConsolidationRequest;
using mnemo::memory::ConsolidationService;
using mnemo::memory::OperationKind;
using mnemo::testing::axis_vector;

struct Fixture {
  explicit Fixture(const std::string &embedder_name)
      : config(mnemo::testing::mock_config()),
        store(std::make_shared<mnemo::testing::InMemoryStore>()),
        client(std::make_shared<mnemo::testing::ScriptedCompletionClient>()),
        embedder(std::make_shared<mnemo::testing::ScriptedEmbedder>(embedder_name)),
        cache(std::make_shared<mnemo::memory::EngineCache>()),
        similarity(
            std::make_shared<mnemo::memory::SimilarityEngine>(embedder, cache, config.retrieval)) {}

  ConsolidationService service() {
    return ConsolidationService(store, client, similarity, cache, config);
  }

  mnemo::config::Config config;
  std::shared_ptr<mnemo::testing::InMemoryStore> store;
  std::shared_ptr<mnemo::testing::ScriptedCompletionClient> client;
  std::shared_ptr<mnemo::testing::ScriptedEmbedder> embedder;
  std::shared_ptr<mnemo::memory::EngineCache> cache;
  std::shared_ptr<mnemo::memory::SimilarityEngine> similarity;
};

std::size_t count_kind(const std::vector<ConsolidationOperation> &ops, const OperationKind kind) {
  std::size_t count = 0;
  for (const auto &op : ops) {
    count += op.kind == kind ? 1 : 0;
  }
  return count;
}

} // namespace

void register_consolidation_tests(std::vector<mnemo::tests::TestCase> &tests) {
  using mnemo::tests::require;

  tests.push_back({"consolidation_creates_first_memory", [] {
                     Fixture fixture("cons-create");
                     fixture.client->push_reply(
                         R"({"ops":[{"operation":"CREATE","id":"","content":"User's wife Sarah loves hiking"}]})");
                     mnemo::testing::RecordingStatusSink status;
                     auto service = fixture.service();
                     CancellationToken token;

                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice",
                                              .message = "My wife Sarah loves hiking"},
                         token, status.sink());

                     require(report.created == 1 && report.applied() == 1 && report.failed == 0,
                             "one memory should be created");
                     const auto records = fixture.store->records("alice");
                     require(records.size() == 1 &&
                                 records[0].content == "User's wife Sarah loves hiking",
                             "store should hold the new memory");
                     require(status.contains("Created: User's wife Sarah loves hiking"),
                             "per-operation status expected");
                     require(status.contains("Memory consolidation complete in"),
                             "timing status expected");
                     require(status.contains("Created 1 Memory"), "summary status expected");

                     const auto request = fixture.client->last_request();
                     require(request.has_value() && request->schema.has_value() &&
                                 request->schema->name == "memory_consolidation",
                             "consolidation schema should be requested");
                     require(request->user_prompt.find("EXISTING MEMORIES FOR CONSOLIDATION:\n[]") !=
                                 std::string::npos,
                             "empty candidate list should be explicit");
                     require(request->user_prompt.find("USER MESSAGE: My wife Sarah loves hiking") !=
                                 std::string::npos,
                             "message should be in the prompt");
                   }});

  tests.push_back({"consolidation_rejects_delete_heavy_plan", [] {
                     Fixture fixture("cons-safety");
                     for (int i = 0; i < 7; ++i) {
                       (void)fixture.store->seed("alice", "Stored fact number " + std::to_string(i));
                     }
                     std::string ops = R"({"ops":[)";
                     for (int i = 1; i <= 7; ++i) {
                       ops += R"({"operation":"DELETE","id":"m)" + std::to_string(i) +
                              R"(","content":""},)";
                     }
                     ops += R"({"operation":"CREATE","id":"","content":"New fact one"},)"
                            R"({"operation":"CREATE","id":"","content":"New fact two"},)"
                            R"({"operation":"CREATE","id":"","content":"New fact three"}]})";
                     fixture.client->push_reply(ops);
                     mnemo::testing::RecordingStatusSink status;
                     auto service = fixture.service();
                     CancellationToken token;

                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice",
                                              .message = "Forget everything about my old job"},
                         token, status.sink());

                     require(report.rejected_by_safety, "plan should be rejected");
                     require(report.applied() == 0, "nothing should be applied");
                     require(fixture.store->records("alice").size() == 7,
                             "store should be untouched");
                     require(status.contains("deleted too many"), "rejection status expected");
                   }});

  tests.push_back({"consolidation_update_removes_semantic_duplicate", [] {
                     Fixture fixture("cons-update-dup");
                     const auto x = fixture.store->seed("alice", "User works at Acme");
                     const auto y = fixture.store->seed("alice", "User is employed by Acme Corp");
                     const std::string updated = "User works at Acme as a senior engineer";
                     fixture.embedder->set("User works at Acme", axis_vector(1));
                     fixture.embedder->set("User is employed by Acme Corp", axis_vector(0));
                     fixture.embedder->set(updated, axis_vector(0));
                     fixture.embedder->set("I got promoted to senior engineer at Acme",
                                           {0.7F, 0.7F, 0.0F, 0.0F});
                     fixture.client->push_reply(R"({"ops":[{"operation":"UPDATE","id":")" + x +
                                                R"(","content":")" + updated + R"("}]})");
                     mnemo::testing::RecordingStatusSink status;
                     auto service = fixture.service();
                     CancellationToken token;

                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice",
                                              .message = "I got promoted to senior engineer at Acme"},
                         token, status.sink());

                     require(report.updated == 1 && report.deleted == 1,
                             "update plus duplicate delete expected");
                     const auto kept = fixture.store->find(x);
                     require(kept.has_value() && kept->content == updated,
                             "updated memory should hold the new content");
                     require(!fixture.store->find(y).has_value(), "duplicate should be deleted");
                     require(status.contains("Deleted: User is employed by Acme Corp"),
                             "delete status should preview the removed content");
                   }});

  tests.push_back({"consolidation_drops_duplicate_create", [] {
                     Fixture fixture("cons-create-dup");
                     (void)fixture.store->seed("alice", "User has a dog named Rex");
                     fixture.embedder->set("User has a dog named Rex", axis_vector(0));
                     fixture.embedder->set("User owns a dog called Rex", axis_vector(0));
                     fixture.client->push_reply(
                         R"({"ops":[{"operation":"CREATE","id":"","content":"User owns a dog called Rex"}]})");
                     mnemo::testing::RecordingStatusSink status;
                     auto service = fixture.service();
                     CancellationToken token;

                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice", .message = "My dog Rex is great"},
                         token, status.sink());
                     require(report.applied() == 0, "duplicate create should be dropped");
                     require(fixture.store->records("alice").size() == 1,
                             "store should be unchanged");
                     require(status.events().empty(), "no changes means no status");
                   }});

  tests.push_back({"consolidation_failure_is_isolated_per_operation", [] {
                     Fixture fixture("cons-isolation");
                     fixture.config.consolidation.max_concurrent_operations = 1;
                     fixture.embedder->set("Good fact one", axis_vector(0));
                     fixture.embedder->set("Bad fact here", axis_vector(1));
                     fixture.embedder->set("Good fact two", axis_vector(2));
                     fixture.store->fail_create_content("Bad fact here");
                     fixture.client->push_reply(
                         R"({"ops":[{"operation":"CREATE","id":"","content":"Good fact one"},)"
                         R"({"operation":"CREATE","id":"","content":"Bad fact here"},)"
                         R"({"operation":"CREATE","id":"","content":"Good fact two"}]})");
                     mnemo::testing::RecordingStatusSink status;
                     auto service = fixture.service();
                     CancellationToken token;

                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice", .message = "Several new facts"},
                         token, status.sink());
                     require(report.created == 2 && report.failed == 1,
                             "one failure should not stop the others");
                     require(fixture.store->records("alice").size() == 2, "two memories stored");
                     require(status.contains("Failed CREATE"), "failure status expected");
                     require(status.contains("Created 2 Memories (Failed 1)"),
                             "summary should count the failure");
                   }});

  tests.push_back({"consolidation_cancelled_before_start", [] {
                     Fixture fixture("cons-cancel");
                     auto service = fixture.service();
                     CancellationToken token;
                     token.cancel();
                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice", .message = "I live in Oslo now"},
                         token);
                     require(report.cancelled, "report should be marked cancelled");
                     require(fixture.client->calls() == 0 && fixture.store->list_calls() == 0,
                             "no work after cancellation");
                   }});

  tests.push_back({"consolidation_plan_failure_leaves_store", [] {
                     Fixture fixture("cons-plan-fail");
                     (void)fixture.store->seed("alice", "User lives in Oslo");
                     fixture.client->push_error(mnemo::common::ErrorKind::Timeout, "slow");
                     mnemo::testing::RecordingStatusSink status;
                     auto service = fixture.service();
                     CancellationToken token;
                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice", .message = "I moved to Bergen"},
                         token, status.sink());
                     require(report.applied() == 0 && report.failed == 0, "nothing applied");
                     require(fixture.store->records("alice").size() == 1, "store unchanged");
                     require(status.contains("Memory consolidation failed"),
                             "failure status expected");
                   }});

  tests.push_back({"consolidation_store_failure_stops_run", [] {
                     Fixture fixture("cons-store-fail");
                     fixture.store->fail_list(mnemo::common::ErrorKind::Timeout);
                     mnemo::testing::RecordingStatusSink status;
                     auto service = fixture.service();
                     CancellationToken token;
                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice", .message = "I moved to Bergen"},
                         token, status.sink());
                     require(report.applied() == 0, "nothing applied");
                     require(fixture.client->calls() == 0, "model should not be asked");
                     require(status.contains("memories unavailable"), "status expected");
                   }});

  tests.push_back({"consolidation_uses_cached_candidates", [] {
                     Fixture fixture("cons-cached");
                     fixture.client->push_reply(R"({"ops":[]})");
                     auto service = fixture.service();
                     CancellationToken token;
                     ConsolidationRequest request{.user_id = "alice",
                                                  .message = "I started learning piano"};
                     request.cached_results = std::vector<mnemo::memory::SimilarityResult>{
                         {.memory_id = "keep", .content = "User plays guitar", .relevance = 0.5},
                         {.memory_id = "drop", .content = "User likes tea", .relevance = 0.1},
                     };
                     const auto report = service.run(request, token);
                     require(report.applied() == 0, "empty plan applies nothing");
                     require(fixture.store->list_calls() == 0,
                             "cached candidates should avoid the store");
                     const auto prompt = fixture.client->last_request()->user_prompt;
                     require(prompt.find("[id:keep] User plays guitar") != std::string::npos,
                             "relevant cached candidate should be offered");
                     require(prompt.find("[id:drop]") == std::string::npos,
                             "candidates below the relaxed threshold are dropped");
                   }});

  tests.push_back({"consolidation_refreshes_cache_after_changes", [] {
                     Fixture fixture("cons-refresh");
                     using mnemo::cache::CacheKind;
                     fixture.cache->put("alice", CacheKind::Retrieval, "stale",
                                        mnemo::memory::CacheValue{
                                            std::vector<mnemo::memory::SimilarityResult>{}});
                     fixture.client->push_reply(
                         R"({"ops":[{"operation":"CREATE","id":"","content":"User speaks Norwegian"}]})");
                     auto service = fixture.service();
                     CancellationToken token;
                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice", .message = "I speak Norwegian"},
                         token);
                     require(report.created == 1, "create expected");
                     require(fixture.cache->entry_count("alice", CacheKind::Retrieval) == 0,
                             "retrieval results should be invalidated");
                     require(fixture.cache->entry_count("alice", CacheKind::MemoryList) == 1,
                             "memory list should be reloaded");
                     require(fixture.cache->get("alice", CacheKind::Embedding,
                                                mnemo::cache::make_cache_key(
                                                    CacheKind::Embedding, "alice",
                                                    "User speaks Norwegian"))
                                 .has_value(),
                             "new memory should be embedded");
                   }});

  tests.push_back({"parse_operations_validates_entries", [] {
                     const std::unordered_set<std::string> candidates = {"m1", "m2"};
                     auto parsed = ConsolidationService::parse_operations(
                         R"({"ops":[)"
                         R"({"operation":"create","id":"m1","content":"  New fact  "},)"
                         R"({"operation":"MERGE","id":"m1","content":"x"},)"
                         R"({"operation":"UPDATE","id":"m9","content":"unknown id"},)"
                         R"({"operation":"UPDATE","id":"m1","content":""},)"
                         R"({"operation":"UPDATE","id":"m2","content":"Changed"},)"
                         R"({"operation":"DELETE","id":"m1","content":"ignored"},)"
                         R"({"operation":"CREATE","id":"","content":""}]})",
                         candidates);
                     require(parsed.ok(), parsed.error());
                     const auto &ops = parsed.value().operations;
                     require(ops.size() == 3, "three valid operations expected");
                     require(parsed.value().proposed == 6 && parsed.value().proposed_deletes == 1,
                             "counts should include invalid entries of a known kind");
                     require(ops[0].kind == OperationKind::Create && ops[0].memory_id.empty() &&
                                 ops[0].content == "New fact",
                             "create keeps trimmed content and no id");
                     require(ops[1].kind == OperationKind::Update && ops[1].memory_id == "m2",
                             "update of a candidate is kept");
                     require(ops[2].kind == OperationKind::Delete && ops[2].content.empty(),
                             "delete carries no content");

                     auto malformed = ConsolidationService::parse_operations(
                         R"({"operations":[]})", candidates);
                     require(!malformed.ok() &&
                                 malformed.kind() == mnemo::common::ErrorKind::ValidationFailure,
                             "missing ops array should fail validation");
                   }});

  tests.push_back({"dedup_plan_is_idempotent", [] {
                     const std::vector<ConsolidationOperation> ops = {
                         {.kind = OperationKind::Update, .memory_id = "m1", .content = "A fact"},
                         {.kind = OperationKind::Update, .memory_id = "m1", .content = "Other"},
                         {.kind = OperationKind::Create, .content = "a FACT "},
                         {.kind = OperationKind::Create, .content = "Brand new"},
                         {.kind = OperationKind::Delete, .memory_id = "m2"},
                         {.kind = OperationKind::Delete, .memory_id = "m2"},
                     };
                     const auto once = ConsolidationService::dedup_plan(ops);
                     require(once.size() == 3, "three operations should survive");
                     require(count_kind(once, OperationKind::Update) == 1 &&
                                 count_kind(once, OperationKind::Create) == 1 &&
                                 count_kind(once, OperationKind::Delete) == 1,
                             "one of each kind expected");
                     const auto twice = ConsolidationService::dedup_plan(once);
                     require(twice.size() == once.size(), "dedup should be idempotent");
                   }});

  tests.push_back({"delete_ratio_needs_minimum_size", [] {
                     Fixture fixture("cons-ratio");
                     auto service = fixture.service();
                     require(!service.violates_delete_ratio(5, 5),
                             "small plans are not ratio-checked");
                     require(service.violates_delete_ratio(6, 6), "six deletes exceed the ratio");
                     require(!service.violates_delete_ratio(6, 1), "low ratio passes");
                     require(!service.violates_delete_ratio(0, 0), "empty plan passes");
                   }});

  tests.push_back({"invalid_entries_still_count_toward_delete_ratio", [] {
                     Fixture fixture("cons-ratio-invalid");
                     for (int i = 0; i < 4; ++i) {
                       (void)fixture.store->seed("alice", "Stored fact number " + std::to_string(i));
                     }
                     fixture.client->push_reply(
                         R"({"ops":[)"
                         R"({"operation":"DELETE","id":"m1","content":""},)"
                         R"({"operation":"DELETE","id":"m2","content":""},)"
                         R"({"operation":"DELETE","id":"m3","content":""},)"
                         R"({"operation":"DELETE","id":"m4","content":""},)"
                         R"({"operation":"CREATE","id":"","content":""},)"
                         R"({"operation":"UPDATE","id":"zzz","content":"Unknown target"}]})");
                     mnemo::testing::RecordingStatusSink status;
                     auto service = fixture.service();
                     CancellationToken token;

                     const auto report = service.run(
                         ConsolidationRequest{.user_id = "alice", .message = "Clean up my notes"},
                         token, status.sink());

                     require(report.rejected_by_safety,
                             "four of six proposed operations are deletions");
                     require(report.deleted == 0, "nothing should be deleted");
                     require(fixture.store->records("alice").size() == 4,
                             "store should be untouched");
                   }});
}
