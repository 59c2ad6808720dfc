#include "mnemo/memory/reference_categories.hpp"

#include "mnemo/memory/similarity.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace mnemo::memory {

namespace {

std::vector<ReferenceCategory> make_builtin_categories() {
  std::vector<ReferenceCategory> categories;

  categories.push_back(ReferenceCategory{
      .label = std::string(kPersonalCategory),
      .exemplar_texts = {
          "about me and who I am: my name, my age, my birthday, where I grew up, my nationality "
          "and the languages I speak at home",
          "my family and relationships: my wife, my husband, my partner, my kids, my parents, "
          "my siblings, my girlfriend or boyfriend and the people closest to me",
          "my job and career: where I work, my role and title, my coworkers and boss, a "
          "promotion, changing jobs, starting my own business",
          "where I live: moving to a new city, buying a house, renting an apartment, my "
          "neighborhood, relocating abroad",
          "my health: a diagnosis I received, an allergy I have, medication I take, an injury, "
          "my diet, going to therapy, my fitness routine",
          "my hobbies and what I do for fun: hiking, running, painting, playing guitar, cooking, "
          "gardening, gaming, reading novels on weekends",
          "my pets: my dog, my cat, adopting an animal, my pet's name and breed and age",
          "things I like and dislike: my favorite food, music I love, movies I enjoy, things I "
          "can't stand, my personal taste and style",
          "important events in my life: my wedding, graduating, having a baby, a death in the "
          "family, a trip I took, a milestone birthday",
          "my education and learning: the school I attended, my degree, a course I'm taking, a "
          "certificate I'm working toward, a language I'm studying",
          "my plans and goals: saving for a house, training for a marathon, a trip I'm planning, "
          "what I want to achieve this year",
          "my personality and habits: I am an introvert, I wake up early, I prefer small groups, "
          "how I spend my mornings and evenings",
      },
      .exemplar_embeddings = {},
  });

  categories.push_back(ReferenceCategory{
      .label = "technical",
      .exemplar_texts = {
          "programming code and syntax: functions, classes, variables, loops, types, imports, "
          "modules, compile errors and stack traces",
          "shell commands in a terminal: cd, ls, grep, sed, chmod, sudo, piping output between "
          "commands, bash and powershell scripts",
          "developer tooling: git commit and push, docker build and run, npm and pip installs, "
          "ssh into a server, curl requests",
          "data formats and configuration files: JSON objects, XML tags, YAML keys, TOML "
          "sections, CSV rows, environment variables",
          "web APIs and protocols: REST endpoints, HTTP methods and status codes, request "
          "headers, bearer tokens, websockets, TCP and UDP sockets",
          "databases and queries: SQL select and join, tables and indexes, transactions, "
          "migrations, schema design",
          "algorithms and data structures: sorting, hash tables, linked lists, trees, graphs, "
          "time and space complexity",
          "software architecture and design patterns: interfaces, dependency injection, "
          "factories, observers, microservices, caching layers",
      },
      .exemplar_embeddings = {},
  });

  categories.push_back(ReferenceCategory{
      .label = "instruction",
      .exemplar_texts = {
          "write me an essay, a story, a poem or a cover letter about a given topic",
          "summarize this article, list the key points, explain this concept in simple terms",
          "act as an expert and answer a general knowledge question about history or science",
          "generate ideas, brainstorm names, draft an email or an outline for a presentation",
          "give me step by step instructions on how to do a task",
      },
      .exemplar_embeddings = {},
  });

  categories.push_back(ReferenceCategory{
      .label = "arithmetic",
      .exemplar_texts = {
          "calculate the result: what is 245 times 17 plus 3, divide 100 by 7",
          "solve this equation for x, compute the derivative, evaluate the integral",
          "convert units and percentages: how many ounces in a liter, what is 15 percent of 80",
          "numbers and math homework: fractions, square roots, averages, probabilities",
      },
      .exemplar_embeddings = {},
  });

  categories.push_back(ReferenceCategory{
      .label = "translation",
      .exemplar_texts = {
          "translate this sentence from English into Spanish, French, German or Japanese",
          "how do you say this phrase in another language, what does this foreign word mean",
          "convert the following paragraph to a different language keeping the tone",
      },
      .exemplar_embeddings = {},
  });

  categories.push_back(ReferenceCategory{
      .label = "grammar",
      .exemplar_texts = {
          "proofread this text and fix the spelling, grammar and punctuation mistakes",
          "rewrite this paragraph to sound more professional, concise or formal",
          "is this sentence grammatically correct, which word should I use here",
      },
      .exemplar_embeddings = {},
  });

  return categories;
}

struct SharedSlot {
  std::once_flag once;
  std::shared_ptr<const ReferenceCategoryTable> table;
};

std::mutex &registry_mutex() {
  static std::mutex mutex;
  return mutex;
}

std::unordered_map<std::string, std::shared_ptr<SharedSlot>> &registry() {
  static std::unordered_map<std::string, std::shared_ptr<SharedSlot>> slots;
  return slots;
}

} // namespace

const std::vector<ReferenceCategory> &builtin_reference_categories() {
  static const std::vector<ReferenceCategory> categories = make_builtin_categories();
  return categories;
}

std::optional<SkipReason> skip_reason_for_category(const std::string_view label) {
  if (label == "technical") {
    return SkipReason::Technical;
  }
  if (label == "instruction") {
    return SkipReason::Instruction;
  }
  if (label == "arithmetic") {
    return SkipReason::Arithmetic;
  }
  if (label == "translation") {
    return SkipReason::Translation;
  }
  if (label == "grammar") {
    return SkipReason::Grammar;
  }
  return std::nullopt;
}

common::Result<ReferenceCategoryTable> ReferenceCategoryTable::build(IEmbedder &embedder) {
  ReferenceCategoryTable table;
  table.categories_ = builtin_reference_categories();

  for (auto &category : table.categories_) {
    auto embedded = embedder.embed_batch(category.exemplar_texts);
    if (!embedded.ok()) {
      return common::Result<ReferenceCategoryTable>::failure(
          embedded.kind(), "embedding '" + category.label + "' exemplars: " + embedded.error());
    }
    if (embedded.value().size() != category.exemplar_texts.size()) {
      return common::Result<ReferenceCategoryTable>::failure(
          common::ErrorKind::ValidationFailure,
          "embedder returned the wrong number of vectors for '" + category.label + "'");
    }
    category.exemplar_embeddings.clear();
    for (auto &vector : embedded.value()) {
      category.exemplar_embeddings.push_back(l2_normalize(std::move(vector)));
    }
  }
  return common::Result<ReferenceCategoryTable>::success(std::move(table));
}

common::Result<std::shared_ptr<const ReferenceCategoryTable>>
ReferenceCategoryTable::shared(const std::shared_ptr<IEmbedder> &embedder) {
  using TableResult = common::Result<std::shared_ptr<const ReferenceCategoryTable>>;
  if (embedder == nullptr) {
    return TableResult::failure(common::ErrorKind::Internal, "no embedder configured");
  }

  std::shared_ptr<SharedSlot> slot;
  {
    std::lock_guard<std::mutex> lock(registry_mutex());
    auto &entry = registry()[std::string(embedder->name())];
    if (entry == nullptr) {
      entry = std::make_shared<SharedSlot>();
    }
    slot = entry;
  }

  // call_once leaves the flag unset when the callable throws, so a failed build is retried.
  try {
    std::call_once(slot->once, [&] {
      auto built = build(*embedder);
      if (!built.ok()) {
        throw std::runtime_error(built.error());
      }
      slot->table = std::make_shared<const ReferenceCategoryTable>(std::move(built.value()));
    });
  } catch (const std::runtime_error &ex) {
    return TableResult::failure(common::ErrorKind::Internal,
                                std::string("reference table build failed: ") + ex.what());
  }
  return TableResult::success(slot->table);
}

const ReferenceCategory *ReferenceCategoryTable::find(const std::string_view label) const {
  const auto it = std::find_if(categories_.begin(), categories_.end(),
                               [&](const auto &category) { return category.label == label; });
  return it == categories_.end() ? nullptr : &*it;
}

std::optional<double> ReferenceCategoryTable::max_similarity(const std::string_view label,
                                                             const Embedding &vector) const {
  const auto *category = find(label);
  if (category == nullptr || category->exemplar_embeddings.empty()) {
    return std::nullopt;
  }
  double best = -1.0;
  for (const auto &exemplar : category->exemplar_embeddings) {
    best = std::max(best, dot_product(vector, exemplar));
  }
  return best;
}

} // namespace mnemo::memory
