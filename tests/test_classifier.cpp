#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "mnemo/memory/classifier.hpp"
#include "mnemo/memory/reference_categories.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

using mnemo::memory::ContentClassifier;
using mnemo::memory::SkipReason;
using mnemo::testing::axis_vector;
using mnemo::testing::ScriptedEmbedder;

constexpr std::size_t kDims = 6;

// Every exemplar of a category points along its own axis so that message vectors decide the
// verdict exactly.
std::shared_ptr<ScriptedEmbedder> category_embedder(const std::string &name) {
  auto embedder = std::make_shared<ScriptedEmbedder>(name, kDims);
  for (const auto &category : mnemo::memory::builtin_reference_categories()) {
    std::size_t axis = 4;
    if (category.label == "personal") {
      axis = 0;
    } else if (category.label == "technical") {
      axis = 1;
    } else if (category.label == "instruction") {
      axis = 2;
    } else if (category.label == "arithmetic") {
      axis = 3;
    }
    for (const auto &text : category.exemplar_texts) {
      embedder->set(text, axis_vector(axis, kDims));
    }
  }
  return embedder;
}

mnemo::config::ClassifierConfig classifier_config(const std::string &granularity = "binary") {
  mnemo::config::ClassifierConfig config;
  config.granularity = granularity;
  return config;
}

const std::string kPersonalMessage = "My sister Ana just moved to Lisbon with her two kids";
const std::string kTechnicalMessage = "Why does my linker complain about undefined references";
const std::string kArithmeticMessage = "What is four hundred and twelve divided by eight";

} // namespace

void register_classifier_tests(std::vector<mnemo::tests::TestCase> &tests) {
  using mnemo::tests::require;
  using mnemo::memory::detect_structural_skip;

  tests.push_back({"structural_command_transcript", [] {
                     require(detect_structural_skip("$ ls -la\n$ cd project\n$ make build\n$ ./run"),
                             "three shell prompts should be structural");
                     require(detect_structural_skip("Run this: $ cat log.txt | grep error"),
                             "inline command with a pipe should be structural");
                   }});

  tests.push_back({"structural_markup_and_code", [] {
                     require(detect_structural_skip(
                                 R"({"user": {"id": [1, 2]}, "tags": [{"k": "v"}], "meta": {}})"),
                             "JSON should be structural");
                     require(detect_structural_skip(
                                 "def main():\n    load_config()\n    run_server()\n    shutdown()"),
                             "indented code should be structural");
                     require(detect_structural_skip("server:\n  host: localhost\n  port: 8080\n"
                                                    "  tls: true\ndatabase:\n  name: app\n"
                                                    "  user: admin\n  pool: 5\n  timeout: 30"),
                             "indented key/value document should be structural");
                   }});

  tests.push_back({"structural_links_tokens_rules_symbols", [] {
                     require(detect_structural_skip(
                                 "see https://a.io https://b.io https://c.io https://d.io "
                                 "https://e.io"),
                             "five links should be structural");
                     require(detect_structural_skip("token " + std::string(85, 'a') + "-_x"),
                             "long opaque token should be structural");
                     require(detect_structural_skip("---\nsection one\n---"),
                             "repeated rules should be structural");
                     require(detect_structural_skip(
                                 "@#%&!~^@#%&!~^@#%&!~^ ok @#%&!~^@#%&!~^@#%&!~^@#%&!~^"),
                             "symbol noise should be structural");
                   }});

  tests.push_back({"structural_keeps_conversational_text", [] {
                     require(!detect_structural_skip(
                                 "- I love hiking\n- My sister lives in Denver\n- I have two cats"),
                             "a short bullet list is not structural");
                     require(!detect_structural_skip(
                                 "My daughter started kindergarten last week and she loves it."),
                             "plain prose is not structural");
                     require(!detect_structural_skip("# notes for later\nI moved to Berlin in May"),
                             "a single comment-like line is not enough");
                     require(!detect_structural_skip(
                                 "Я переехал в Берлин в прошлом году и работаю инженером"),
                             "non-Latin prose is not symbol noise");
                   }});

  tests.push_back({"structural_key_value_needs_few_loose_words", [] {
                     const std::string text =
                         "trip:\n  city: Rome\n  hotel: Roma\n  nights: 4\n  budget: 900\n"
                         "  flight: AZ\n  seat: 12A\n  meal: veg\n  bags: 1\n"
                         "I am really excited about this trip with my husband";
                     require(!detect_structural_skip(text),
                             "several loose words mean this is not a key/value dump");
                   }});

  tests.push_back({"utf8_length_counts_code_points", [] {
                     require(mnemo::memory::utf8_length("héllo") == 5, "é is one code point");
                     require(mnemo::memory::utf8_length("") == 0, "empty is zero");
                   }});

  tests.push_back({"classifier_size_limits", [] {
                     ContentClassifier classifier(category_embedder("cls-size"),
                                                  classifier_config());
                     const auto short_verdict = classifier.classify("Hi");
                     require(!short_verdict.allowed && short_verdict.reason == SkipReason::Size,
                             "short message should be a size skip");
                     require(classifier.classify("   \n\t ").reason == SkipReason::Size,
                             "blank message should be a size skip");
                     require(classifier.classify(std::string(9, 'x') + "é  ").allowed,
                             "ten code points after trimming should pass the size stage");
                     require(classifier.classify("ééééééééé").reason == SkipReason::Size,
                             "nine code points should be too short");
                     require(classifier.classify(std::string(2600, 'a')).reason ==
                                 SkipReason::Size,
                             "overlong message should be a size skip");
                   }});

  tests.push_back({"classifier_structural_does_not_embed", [] {
                     auto embedder = category_embedder("cls-structural");
                     ContentClassifier classifier(embedder, classifier_config());
                     const auto verdict =
                         classifier.classify("$ ls -la\n$ cd project\n$ make build\n$ ./run");
                     require(!verdict.allowed && verdict.reason == SkipReason::Structural,
                             "command transcript should be a structural skip");
                     require(embedder->calls() == 0, "fast path must not call the embedder");
                   }});

  tests.push_back({"classifier_binary_semantic", [] {
                     auto embedder = category_embedder("cls-binary");
                     embedder->set(kPersonalMessage, axis_vector(0, kDims));
                     embedder->set(kTechnicalMessage, axis_vector(1, kDims));
                     embedder->set(kArithmeticMessage, {0.8F, 0.0F, 0.0F, 0.6F, 0.0F, 0.0F});
                     ContentClassifier classifier(embedder, classifier_config());

                     require(classifier.classify(kPersonalMessage).allowed,
                             "personal message should be allowed");
                     const auto technical = classifier.classify(kTechnicalMessage);
                     require(!technical.allowed && technical.reason == SkipReason::NonPersonal,
                             "technical message should be a non-personal skip");
                     require(classifier.classify(kArithmeticMessage).allowed,
                             "a margin below the threshold should be allowed");
                   }});

  tests.push_back({"classifier_multi_reports_category", [] {
                     auto embedder = category_embedder("cls-multi");
                     embedder->set(kTechnicalMessage, axis_vector(1, kDims));
                     embedder->set(kArithmeticMessage, {0.1F, 0.2F, 0.0F, 0.97F, 0.0F, 0.0F});
                     ContentClassifier classifier(embedder, classifier_config("multi"));

                     require(classifier.classify(kTechnicalMessage).reason ==
                                 SkipReason::Technical,
                             "technical category expected");
                     require(classifier.classify(kArithmeticMessage).reason ==
                                 SkipReason::Arithmetic,
                             "arithmetic has the largest excess");
                   }});

  tests.push_back({"classifier_embedding_failure_allows", [] {
                     mnemo::testing::ObserverCapture capture;
                     auto embedder = category_embedder("cls-failure");
                     embedder->set(kTechnicalMessage, axis_vector(1, kDims));
                     embedder->set_failure(true);
                     ContentClassifier classifier(embedder, classifier_config());

                     require(classifier.classify(kTechnicalMessage).allowed,
                             "embedding failure should allow the message");
                     require(capture.has_error("classifier", "allowing message"),
                             "failure should be logged");

                     embedder->set_failure(false);
                     require(classifier.classify(kTechnicalMessage).reason ==
                                 SkipReason::NonPersonal,
                             "reference table should be built on the next call");
                   }});

  tests.push_back({"classifier_caches_verdict_per_user", [] {
                     auto embedder = category_embedder("cls-cache");
                     embedder->set(kTechnicalMessage, axis_vector(1, kDims));
                     auto cache = std::make_shared<mnemo::memory::EngineCache>();
                     ContentClassifier classifier(embedder, classifier_config(), cache);

                     const auto first = classifier.classify(kTechnicalMessage, "alice");
                     const auto calls = embedder->calls();
                     const auto second = classifier.classify(kTechnicalMessage, "alice");
                     require(!first.allowed && !second.allowed, "verdicts should match");
                     require(embedder->calls() == calls, "cached verdict should skip embedding");
                     require(cache->entry_count("alice", mnemo::cache::CacheKind::Verdict) == 1,
                             "one verdict should be cached");

                     (void)classifier.classify(kTechnicalMessage, "bob");
                     require(embedder->calls() > calls, "other users do not share verdicts");
                   }});

  tests.push_back({"classifier_expired_verdict_is_recomputed", [] {
                     auto embedder = category_embedder("cls-ttl");
                     auto cache = std::make_shared<mnemo::memory::EngineCache>();
                     ContentClassifier classifier(embedder, classifier_config(), cache,
                                                  std::chrono::seconds(0));
                     (void)classifier.classify(kPersonalMessage, "alice");
                     const auto calls = embedder->calls();
                     (void)classifier.classify(kPersonalMessage, "alice");
                     require(embedder->calls() > calls, "zero TTL should never reuse a verdict");
                   }});

  tests.push_back({"reference_table_shared_per_embedder", [] {
                     auto embedder = category_embedder("cls-shared");
                     auto first = mnemo::memory::ReferenceCategoryTable::shared(embedder);
                     require(first.ok(), first.error());
                     const auto calls = embedder->calls();
                     auto second = mnemo::memory::ReferenceCategoryTable::shared(embedder);
                     require(second.ok(), second.error());
                     require(first.value().get() == second.value().get(),
                             "same identity should share one table");
                     require(embedder->calls() == calls, "table should be built once");

                     const auto *technical = first.value()->find("technical");
                     require(technical != nullptr &&
                                 technical->exemplar_embeddings.size() ==
                                     technical->exemplar_texts.size(),
                             "every exemplar should be embedded");
                     const auto similarity = first.value()->max_similarity(
                         "technical", axis_vector(1, kDims));
                     require(similarity.has_value() && *similarity > 0.99,
                             "axis-aligned query should match its category");
                     require(!first.value()->max_similarity("poetry", axis_vector(1, kDims)),
                             "unknown label has no similarity");
                   }});
}
