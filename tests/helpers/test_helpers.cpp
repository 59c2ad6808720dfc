#include "tests/helpers/test_helpers.hpp"

#include "mnemo/observability/global.hpp"
#include "mnemo/observability/noop_observer.hpp"

#include <fstream>
#include <random>

namespace mnemo::testing {

namespace {

class CapturingObserver final : public observability::IObserver {
public:
  explicit CapturingObserver(std::shared_ptr<ObserverCapture::State> state)
      : state_(std::move(state)) {}

  void record_event(const observability::ObserverEvent &event) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->events.push_back(event);
  }

  void record_metric(const observability::ObserverMetric &metric) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->metrics.push_back(metric);
  }

  [[nodiscard]] std::string_view name() const override { return "capture"; }

private:
  std::shared_ptr<ObserverCapture::State> state_;
};

} // namespace

config::Config mock_config() {
  config::Config config;
  config.provider.api_key = "test-key";
  config.provider.max_retries = 0;
  config.embedding.provider = "local";
  config.embedding.dimensions = 4;
  config.observability.backend = "none";
  return config;
}

ScriptedEmbedder::ScriptedEmbedder(std::string name, const std::size_t dimensions)
    : name_(std::move(name)), dimensions_(dimensions),
      fallback_(axis_vector(dimensions - 1, dimensions)) {}

void ScriptedEmbedder::set(const std::string &text, std::vector<float> vector) {
  std::lock_guard<std::mutex> lock(mutex_);
  table_[text] = std::move(vector);
}

void ScriptedEmbedder::set_fallback(std::vector<float> vector) {
  std::lock_guard<std::mutex> lock(mutex_);
  fallback_ = std::move(vector);
}

void ScriptedEmbedder::set_failure(const bool failing) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_ = failing;
}

std::vector<float> ScriptedEmbedder::lookup(const std::string &text) const {
  const auto it = table_.find(text);
  return it == table_.end() ? fallback_ : it->second;
}

common::Result<std::vector<float>> ScriptedEmbedder::embed(const std::string_view text) {
  ++calls_;
  ++texts_;
  std::lock_guard<std::mutex> lock(mutex_);
  if (failing_) {
    return common::Result<std::vector<float>>::failure(common::ErrorKind::Transport,
                                                       "embedding backend unavailable");
  }
  return common::Result<std::vector<float>>::success(lookup(std::string(text)));
}

common::Result<std::vector<std::vector<float>>>
ScriptedEmbedder::embed_batch(const std::vector<std::string> &texts) {
  using BatchResult = common::Result<std::vector<std::vector<float>>>;
  ++calls_;
  texts_ += texts.size();
  std::lock_guard<std::mutex> lock(mutex_);
  if (failing_) {
    return BatchResult::failure(common::ErrorKind::Transport, "embedding backend unavailable");
  }
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    out.push_back(lookup(text));
  }
  return BatchResult::success(std::move(out));
}

std::vector<float> axis_vector(const std::size_t axis, const std::size_t dimensions) {
  std::vector<float> vector(dimensions, 0.0F);
  vector[axis % dimensions] = 1.0F;
  return vector;
}

void ScriptedCompletionClient::push_reply(std::string reply) {
  std::lock_guard<std::mutex> lock(mutex_);
  replies_.push_back(common::Result<std::string>::success(std::move(reply)));
}

void ScriptedCompletionClient::push_error(const common::ErrorKind kind, std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  replies_.push_back(common::Result<std::string>::failure(kind, std::move(message)));
}

std::size_t ScriptedCompletionClient::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

std::optional<providers::CompletionRequest> ScriptedCompletionClient::last_request() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_.empty()) {
    return std::nullopt;
  }
  return requests_.back();
}

common::Result<std::string>
ScriptedCompletionClient::complete(const providers::CompletionRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(request);
  if (replies_.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::Transport,
                                                "no scripted reply left");
  }
  auto reply = std::move(replies_.front());
  replies_.pop_front();
  return reply;
}

std::string InMemoryStore::seed(const std::string &user_id, const std::string &content,
                                const std::string &created_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string id = "m" + std::to_string(next_id_++);
  records_[id] = memory::MemoryRecord{.id = id,
                                      .user_id = user_id,
                                      .content = content,
                                      .created_at = created_at,
                                      .updated_at = created_at};
  return id;
}

void InMemoryStore::fail_list(const std::optional<common::ErrorKind> kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  list_failure_ = kind;
}

void InMemoryStore::fail_create(const std::optional<common::ErrorKind> kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  create_failure_ = kind;
}

void InMemoryStore::fail_create_content(std::string content) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_content_ = std::move(content);
}

std::vector<memory::MemoryRecord> InMemoryStore::records(const std::string &user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<memory::MemoryRecord> out;
  for (const auto &[id, record] : records_) {
    if (record.user_id == user_id) {
      out.push_back(record);
    }
  }
  return out;
}

std::optional<memory::MemoryRecord> InMemoryStore::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

common::Result<std::vector<memory::MemoryRecord>>
InMemoryStore::list_by_user(const std::string &user_id, std::chrono::milliseconds) {
  ++list_calls_;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (list_failure_.has_value()) {
      return common::Result<std::vector<memory::MemoryRecord>>::failure(*list_failure_,
                                                                        "list failed");
    }
  }
  return common::Result<std::vector<memory::MemoryRecord>>::success(records(user_id));
}

common::Result<std::string> InMemoryStore::create(const std::string &user_id,
                                                  const std::string &content,
                                                  std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (create_failure_.has_value()) {
    return common::Result<std::string>::failure(*create_failure_, "create failed");
  }
  if (failing_content_.has_value() && *failing_content_ == content) {
    return common::Result<std::string>::failure(common::ErrorKind::StoreFailure,
                                                "create rejected");
  }
  const std::string id = "m" + std::to_string(next_id_++);
  records_[id] = memory::MemoryRecord{.id = id,
                                      .user_id = user_id,
                                      .content = content,
                                      .created_at = "2025-01-07T09:00:00Z",
                                      .updated_at = "2025-01-07T09:00:00Z"};
  return common::Result<std::string>::success(id);
}

common::Status InMemoryStore::update(const std::string &id, const std::string &user_id,
                                     const std::string &content, std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end() || it->second.user_id != user_id) {
    return common::Status::error(common::ErrorKind::StoreFailure, "memory not found");
  }
  it->second.content = content;
  it->second.updated_at = "2025-01-07T09:00:00Z";
  return common::Status::success();
}

common::Status InMemoryStore::remove(const std::string &id, const std::string &user_id,
                                     std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end() || it->second.user_id != user_id) {
    return common::Status::error(common::ErrorKind::StoreFailure, "memory not found");
  }
  records_.erase(it);
  return common::Status::success();
}

RecordingStatusSink::RecordingStatusSink() : state_(std::make_shared<State>()) {}

memory::StatusSink RecordingStatusSink::sink() const {
  return [state = state_](const memory::StatusEvent &event) {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->events.push_back(event);
  };
}

std::vector<memory::StatusEvent> RecordingStatusSink::events() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->events;
}

bool RecordingStatusSink::contains(const std::string &fragment) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  for (const auto &event : state_->events) {
    if (event.description.find(fragment) != std::string::npos) {
      return true;
    }
  }
  return false;
}

ObserverCapture::ObserverCapture() : state_(std::make_shared<State>()) {
  observability::set_global_observer(std::make_unique<CapturingObserver>(state_));
}

ObserverCapture::~ObserverCapture() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

std::vector<observability::ObserverEvent> ObserverCapture::events() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->events;
}

std::vector<observability::ObserverMetric> ObserverCapture::metrics() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->metrics;
}

bool ObserverCapture::has_error(const std::string &component, const std::string &fragment) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  for (const auto &event : state_->events) {
    if (const auto *error = std::get_if<observability::ErrorEvent>(&event);
        error != nullptr && error->component == component &&
        error->message.find(fragment) != std::string::npos) {
      return true;
    }
  }
  return false;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("mnemo-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.store.path = (workspace.path() / "memories.db").string();
  return config;
}

} // namespace mnemo::testing
