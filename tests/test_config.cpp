#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "mnemo/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(const std::filesystem::path &path) {
    mnemo::config::set_config_path_override(path);
  }
  ~ConfigOverrideGuard() { mnemo::config::clear_config_path_override(); }
};

} // namespace

void register_config_tests(std::vector<mnemo::tests::TestCase> &tests) {
  using mnemo::tests::require;
  namespace cfg = mnemo::config;

  tests.push_back({"config_defaults", [] {
                     const cfg::Config config;
                     require(config.retrieval.semantic_threshold == 0.25, "threshold default");
                     require(config.retrieval.max_memories_returned == 10, "max returned default");
                     require(config.classifier.min_message_chars == 10 &&
                                 config.classifier.max_message_chars == 2500,
                             "size limits default");
                     require(config.consolidation.max_delete_ratio == 0.6 &&
                                 config.consolidation.min_ops_for_ratio_check == 6,
                             "safety defaults");
                     require(config.reranking.extension_multiplier == 1.6, "extension default");
                     require(!config.provider.api_key.has_value(), "no key by default");
                   }});

  tests.push_back({"load_config_from_string_sections", [] {
                     const auto loaded = cfg::load_config_from_string(R"(
[retrieval]
semantic_threshold = 0.4
max_memories_returned = 5

[classifier]
granularity = "multi"

[reranking]
enabled = false

[provider]
name = "openai"
model = "gpt-test"
api_key = "sk-123"

[timeouts]
llm_ms = 1500
)");
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.retrieval.semantic_threshold == 0.4, "threshold mismatch");
                     require(config.retrieval.max_memories_returned == 5, "max returned mismatch");
                     require(config.classifier.granularity == "multi", "granularity mismatch");
                     require(!config.reranking.enabled, "reranking should be disabled");
                     require(config.provider.model == "gpt-test", "model mismatch");
                     require(config.provider.api_key == std::optional<std::string>("sk-123"),
                             "key mismatch");
                     require(config.timeouts.llm_ms == 1500, "timeout mismatch");
                     require(config.timeouts.store_ms == 10'000, "unset values keep defaults");
                   }});

  tests.push_back({"load_config_from_string_rejects_garbage", [] {
                     const auto loaded = cfg::load_config_from_string("[retrieval]\nthis is not toml\n");
                     require(!loaded.ok() && loaded.kind() == mnemo::common::ErrorKind::InvalidInput,
                             "malformed toml should fail");
                   }});

  tests.push_back({"config_api_key_expands_env", [] {
                     const EnvGuard key("MNEMO_TEST_SECRET", std::optional<std::string>("s3cret"));
                     const auto loaded = cfg::load_config_from_string(
                         "[provider]\napi_key = \"${MNEMO_TEST_SECRET}\"\n");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().provider.api_key == std::optional<std::string>("s3cret"),
                             "env reference should be expanded");
                   }});

  tests.push_back({"validate_config_hard_errors", [] {
                     auto config = mnemo::testing::mock_config();
                     require(cfg::validate_config(config).ok(), "mock config should validate");

                     auto bad_ratio = config;
                     bad_ratio.consolidation.max_delete_ratio = 1.5;
                     require(!cfg::validate_config(bad_ratio).ok(), "ratio above 1 should fail");

                     auto bad_granularity = config;
                     bad_granularity.classifier.granularity = "fine";
                     const auto result = cfg::validate_config(bad_granularity);
                     require(!result.ok() &&
                                 result.kind() == mnemo::common::ErrorKind::InvalidInput,
                             "unknown granularity should fail");

                     auto bad_sizes = config;
                     bad_sizes.classifier.min_message_chars = 3000;
                     require(!cfg::validate_config(bad_sizes).ok(), "min above max should fail");

                     auto bad_cache = config;
                     bad_cache.cache.max_users = 0;
                     require(!cfg::validate_config(bad_cache).ok(), "zero capacity should fail");

                     auto bad_store = config;
                     bad_store.store.backend = "redis";
                     require(!cfg::validate_config(bad_store).ok(), "unknown store should fail");
                   }});

  tests.push_back({"validate_config_warnings", [] {
                     auto config = mnemo::testing::mock_config();
                     config.provider.api_key = std::nullopt;
                     config.reranking.extension_multiplier = 0.5;
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "two warnings expected");
                     require(result.value()[1].find("api_key") != std::string::npos,
                             "missing key should be a warning");
                   }});

  tests.push_back({"env_overrides_apply", [] {
                     const EnvGuard key("MNEMO_API_KEY", std::optional<std::string>("from-env"));
                     const EnvGuard model("MNEMO_MODEL", std::optional<std::string>("env-model"));
                     const EnvGuard path("MNEMO_STORE_PATH",
                                         std::optional<std::string>("/tmp/env-memories.db"));
                     const EnvGuard base("MNEMO_BASE_URL", std::nullopt);
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.provider.api_key == std::optional<std::string>("from-env"),
                             "key override failed");
                     require(config.provider.model == "env-model", "model override failed");
                     require(config.store.path == "/tmp/env-memories.db", "path override failed");
                     require(config.provider.base_url == "https://api.openai.com/v1",
                             "unset variable keeps the default");
                   }});

  tests.push_back({"save_and_load_config_file", [] {
                     mnemo::testing::TempWorkspace workspace;
                     const ConfigOverrideGuard guard(workspace.path() / "conf" / "config.toml");
                     const EnvGuard key("MNEMO_API_KEY", std::nullopt);
                     const EnvGuard model("MNEMO_MODEL", std::nullopt);
                     const EnvGuard path("MNEMO_STORE_PATH", std::nullopt);

                     require(!cfg::config_exists(), "no file yet");
                     const auto defaults = cfg::load_config();
                     require(defaults.ok() && defaults.value().store.backend == "sqlite",
                             "missing file gives defaults");

                     auto config = mnemo::testing::mock_config();
                     config.retrieval.max_memories_returned = 7;
                     config.classifier.granularity = "multi";
                     config.store.path = "/var/lib/mnemo/memories.db";
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "file should be written");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().retrieval.max_memories_returned == 7,
                             "saved value should load back");
                     require(loaded.value().classifier.granularity == "multi",
                             "string value should load back");
                     require(loaded.value().provider.api_key ==
                                 std::optional<std::string>("test-key"),
                             "api key should load back");
                     require(loaded.value().store.path == "/var/lib/mnemo/memories.db",
                             "store path should load back");
                   }});

  tests.push_back({"config_path_env_variable", [] {
                     mnemo::testing::TempWorkspace workspace;
                     const auto file = workspace.path() / "custom.toml";
                     workspace.create_file("custom.toml", "[retrieval]\nmax_memories_returned = 3\n");
                     const EnvGuard env("MNEMO_CONFIG_PATH", file.string());
                     cfg::clear_config_path_override();
                     const auto path = cfg::config_path();
                     require(path.ok() && path.value() == file, "env path should be used");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok() && loaded.value().retrieval.max_memories_returned == 3,
                             "env-located file should be loaded");
                   }});
}
