#include "mnemo/config/config.hpp"

#include "mnemo/common/text.hpp"
#include "mnemo/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace mnemo::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".mnemo";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("MNEMO_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

std::size_t get_size(const common::TomlDocument &doc, const std::string &key,
                     const std::size_t fallback) {
  return static_cast<std::size_t>(doc.get_u64(key, fallback));
}

void apply_document(Config &config, const common::TomlDocument &doc) {
  auto &cache = config.cache;
  cache.max_users = get_size(doc, "cache.max_users", cache.max_users);
  cache.max_entries_per_kind = get_size(doc, "cache.max_entries_per_kind", cache.max_entries_per_kind);
  cache.verdict_ttl_seconds = doc.get_u64("cache.verdict_ttl_seconds", cache.verdict_ttl_seconds);

  auto &classifier = config.classifier;
  classifier.min_message_chars =
      get_size(doc, "classifier.min_message_chars", classifier.min_message_chars);
  classifier.max_message_chars =
      get_size(doc, "classifier.max_message_chars", classifier.max_message_chars);
  classifier.skip_margin = doc.get_double("classifier.skip_margin", classifier.skip_margin);
  classifier.granularity = doc.get_string("classifier.granularity", classifier.granularity);

  auto &retrieval = config.retrieval;
  retrieval.semantic_threshold =
      doc.get_double("retrieval.semantic_threshold", retrieval.semantic_threshold);
  retrieval.relaxed_multiplier =
      doc.get_double("retrieval.relaxed_multiplier", retrieval.relaxed_multiplier);
  retrieval.max_memories_returned =
      get_size(doc, "retrieval.max_memories_returned", retrieval.max_memories_returned);
  retrieval.max_memory_content_chars =
      get_size(doc, "retrieval.max_memory_content_chars", retrieval.max_memory_content_chars);

  auto &reranking = config.reranking;
  reranking.enabled = doc.get_bool("reranking.enabled", reranking.enabled);
  reranking.trigger_multiplier =
      doc.get_double("reranking.trigger_multiplier", reranking.trigger_multiplier);
  reranking.extension_multiplier =
      doc.get_double("reranking.extension_multiplier", reranking.extension_multiplier);

  auto &consolidation = config.consolidation;
  consolidation.enabled = doc.get_bool("consolidation.enabled", consolidation.enabled);
  consolidation.dedup_threshold =
      doc.get_double("consolidation.dedup_threshold", consolidation.dedup_threshold);
  consolidation.max_delete_ratio =
      doc.get_double("consolidation.max_delete_ratio", consolidation.max_delete_ratio);
  consolidation.min_ops_for_ratio_check =
      get_size(doc, "consolidation.min_ops_for_ratio_check", consolidation.min_ops_for_ratio_check);
  consolidation.max_concurrent_operations = get_size(
      doc, "consolidation.max_concurrent_operations", consolidation.max_concurrent_operations);

  auto &timeouts = config.timeouts;
  timeouts.store_ms = doc.get_u64("timeouts.store_ms", timeouts.store_ms);
  timeouts.llm_ms = doc.get_u64("timeouts.llm_ms", timeouts.llm_ms);
  timeouts.embedding_ms = doc.get_u64("timeouts.embedding_ms", timeouts.embedding_ms);

  auto &provider = config.provider;
  provider.name = doc.get_string("provider.name", provider.name);
  provider.base_url = expand_config_value(doc.get_string("provider.base_url", provider.base_url));
  if (doc.has("provider.api_key")) {
    provider.api_key = expand_config_value(doc.get_string("provider.api_key"));
  }
  provider.model = doc.get_string("provider.model", provider.model);
  provider.temperature = doc.get_double("provider.temperature", provider.temperature);
  provider.max_retries = static_cast<std::uint32_t>(
      doc.get_u64("provider.max_retries", provider.max_retries));
  provider.backoff_ms = doc.get_u64("provider.backoff_ms", provider.backoff_ms);

  auto &embedding = config.embedding;
  embedding.provider = doc.get_string("embedding.provider", embedding.provider);
  embedding.model = doc.get_string("embedding.model", embedding.model);
  embedding.dimensions = get_size(doc, "embedding.dimensions", embedding.dimensions);
  embedding.base_url = expand_config_value(doc.get_string("embedding.base_url", embedding.base_url));

  config.store.backend = doc.get_string("store.backend", config.store.backend);
  config.store.path = doc.get_string("store.path", config.store.path);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
}

bool in_unit_interval(const double value) { return value >= 0.0 && value <= 1.0; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *api_key = std::getenv("MNEMO_API_KEY"); api_key != nullptr && *api_key) {
    config.provider.api_key = std::string(api_key);
  }
  if (const char *base_url = std::getenv("MNEMO_BASE_URL"); base_url != nullptr && *base_url) {
    config.provider.base_url = base_url;
  }
  if (const char *model = std::getenv("MNEMO_MODEL"); model != nullptr && *model) {
    config.provider.model = model;
  }
  if (const char *model = std::getenv("MNEMO_EMBEDDING_MODEL"); model != nullptr && *model) {
    config.embedding.model = model;
  }
  if (const char *path = std::getenv("MNEMO_STORE_PATH"); path != nullptr && *path) {
    config.store.path = path;
  }
}

common::Result<Config> load_config_from_string(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  Config config;
  apply_document(config, parsed.value());
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto loaded = load_config_from_string(buffer.str());
  if (!loaded.ok()) {
    return common::Result<Config>::failure(loaded.kind(),
                                           path.string() + ": " + loaded.error());
  }
  apply_env_overrides(loaded.value());
  return loaded;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "[cache]\n";
  file << "max_users = " << config.cache.max_users << "\n";
  file << "max_entries_per_kind = " << config.cache.max_entries_per_kind << "\n";
  file << "verdict_ttl_seconds = " << config.cache.verdict_ttl_seconds << "\n\n";

  file << "[classifier]\n";
  file << "min_message_chars = " << config.classifier.min_message_chars << "\n";
  file << "max_message_chars = " << config.classifier.max_message_chars << "\n";
  file << "skip_margin = " << config.classifier.skip_margin << "\n";
  file << "granularity = " << common::quote_toml_string(config.classifier.granularity) << "\n\n";

  file << "[retrieval]\n";
  file << "semantic_threshold = " << config.retrieval.semantic_threshold << "\n";
  file << "relaxed_multiplier = " << config.retrieval.relaxed_multiplier << "\n";
  file << "max_memories_returned = " << config.retrieval.max_memories_returned << "\n";
  file << "max_memory_content_chars = " << config.retrieval.max_memory_content_chars << "\n\n";

  file << "[reranking]\n";
  file << "enabled = " << bool_to_toml(config.reranking.enabled) << "\n";
  file << "trigger_multiplier = " << config.reranking.trigger_multiplier << "\n";
  file << "extension_multiplier = " << config.reranking.extension_multiplier << "\n\n";

  file << "[consolidation]\n";
  file << "enabled = " << bool_to_toml(config.consolidation.enabled) << "\n";
  file << "dedup_threshold = " << config.consolidation.dedup_threshold << "\n";
  file << "max_delete_ratio = " << config.consolidation.max_delete_ratio << "\n";
  file << "min_ops_for_ratio_check = " << config.consolidation.min_ops_for_ratio_check << "\n";
  file << "max_concurrent_operations = " << config.consolidation.max_concurrent_operations
       << "\n\n";

  file << "[timeouts]\n";
  file << "store_ms = " << config.timeouts.store_ms << "\n";
  file << "llm_ms = " << config.timeouts.llm_ms << "\n";
  file << "embedding_ms = " << config.timeouts.embedding_ms << "\n\n";

  file << "[provider]\n";
  file << "name = " << common::quote_toml_string(config.provider.name) << "\n";
  file << "base_url = " << common::quote_toml_string(config.provider.base_url) << "\n";
  if (config.provider.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.provider.api_key) << "\n";
  }
  file << "model = " << common::quote_toml_string(config.provider.model) << "\n";
  file << "temperature = " << config.provider.temperature << "\n";
  file << "max_retries = " << config.provider.max_retries << "\n";
  file << "backoff_ms = " << config.provider.backoff_ms << "\n\n";

  file << "[embedding]\n";
  file << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  file << "dimensions = " << config.embedding.dimensions << "\n";
  if (!config.embedding.base_url.empty()) {
    file << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";
  }
  file << "\n";

  file << "[store]\n";
  file << "backend = " << common::quote_toml_string(config.store.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.store.path) << "\n\n";

  file << "[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed to flush config file");
  }

  std::error_code rename_ec;
  std::filesystem::rename(tmp_path, path, rename_ec);
  if (rename_ec) {
    return common::Status::error("Failed to replace config file: " + rename_ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.cache.max_users == 0 || config.cache.max_entries_per_kind == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "cache capacities must be positive");
  }

  if (config.classifier.min_message_chars > config.classifier.max_message_chars) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "classifier.min_message_chars exceeds max_message_chars");
  }
  const std::string granularity = common::to_lower(common::trim(config.classifier.granularity));
  if (granularity != "binary" && granularity != "multi") {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "Invalid classifier.granularity: " +
                                         config.classifier.granularity);
  }
  if (config.classifier.skip_margin < 0.0 || config.classifier.skip_margin > 2.0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "classifier.skip_margin must be between 0.0 and 2.0");
  }

  if (config.retrieval.semantic_threshold < -1.0 || config.retrieval.semantic_threshold > 1.0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "retrieval.semantic_threshold must be between -1.0 and 1.0");
  }
  if (config.retrieval.relaxed_multiplier <= 0.0 || config.retrieval.relaxed_multiplier > 1.0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "retrieval.relaxed_multiplier must be in (0.0, 1.0]");
  }
  if (config.retrieval.max_memories_returned == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "retrieval.max_memories_returned must be positive");
  }

  if (config.reranking.extension_multiplier < 1.0) {
    warnings.push_back("reranking.extension_multiplier below 1.0 narrows the reranking window");
  }
  if (config.reranking.trigger_multiplier <= 0.0) {
    warnings.push_back("reranking.trigger_multiplier <= 0 reranks every retrieval");
  }

  if (config.consolidation.dedup_threshold < -1.0 || config.consolidation.dedup_threshold > 1.0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "consolidation.dedup_threshold must be between -1.0 and 1.0");
  }
  if (!in_unit_interval(config.consolidation.max_delete_ratio)) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "consolidation.max_delete_ratio must be between 0.0 and 1.0");
  }
  if (config.consolidation.max_concurrent_operations == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "consolidation.max_concurrent_operations must be positive");
  }
  if (config.consolidation.dedup_threshold < config.retrieval.semantic_threshold) {
    warnings.push_back("consolidation.dedup_threshold is below the retrieval threshold");
  }

  if (config.timeouts.store_ms == 0 || config.timeouts.llm_ms == 0 ||
      config.timeouts.embedding_ms == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput, "timeouts must be positive");
  }

  if (config.provider.temperature < 0.0 || config.provider.temperature > 2.0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "provider.temperature must be between 0.0 and 2.0");
  }

  const std::string embedding_provider = common::to_lower(config.embedding.provider);
  if (embedding_provider != "local" && embedding_provider != "openai") {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "Invalid embedding.provider: " + config.embedding.provider);
  }
  if (config.embedding.dimensions == 0) {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "embedding.dimensions must be positive");
  }

  const std::string store_backend = common::to_lower(config.store.backend);
  if (store_backend != "sqlite") {
    return ValidationResult::failure(common::ErrorKind::InvalidInput,
                                     "Invalid store.backend: " + config.store.backend);
  }

  const bool needs_key = embedding_provider == "openai" || config.consolidation.enabled ||
                         config.reranking.enabled;
  if (needs_key && (!config.provider.api_key.has_value() ||
                    common::trim(*config.provider.api_key).empty())) {
    warnings.push_back("provider.api_key is not set; language-model calls will fail");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace mnemo::config
