#include "sweep_worker.hpp"

#include <stdexcept>

#include "internal/core/coordinator.hpp"
#include "internal/observability/logging.hpp"

namespace hive::maintenance {

namespace {

// Releases a namespace claim on every exit path.
class ClaimGuard {
 public:
  ClaimGuard(std::function<void()> release) : release_(std::move(release)) {
  }
  ~ClaimGuard() {
    release_();
  }

 private:
  std::function<void()> release_;
};

} // namespace

SweepWorker::SweepWorker(std::shared_ptr<hive::core::Coordinator> coordinator, SweepOptions options)
    : coordinator_(std::move(coordinator)), options_(std::move(options)) {
  if (!coordinator_) {
    throw std::invalid_argument("SweepWorker requires a coordinator");
  }
  if (options_.interval.count() <= 0) {
    throw std::invalid_argument("SweepWorker interval must be positive");
  }
}

SweepWorker::~SweepWorker() {
  Stop();
}

void SweepWorker::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&SweepWorker::Run, this);
}

void SweepWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool SweepWorker::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void SweepWorker::Run() {
  HIVE_LOG_INFO("Memory sweep started", {observability::IntField("interval_ms", options_.interval.count())});

  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, options_.interval, [this] { return !running_; })) {
      break;
    }

    lock.unlock();
    try {
      auto result = SweepOnce();
      if (result.expired + result.aged_out + result.trimmed > 0) {
        HIVE_LOG_INFO("Memory sweep", {observability::CountField("expired", result.expired),
                                       observability::CountField("aged_out", result.aged_out),
                                       observability::CountField("trimmed", result.trimmed)});
      }
    } catch (const std::exception& e) {
      HIVE_LOG_ERROR("Memory sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }

  HIVE_LOG_INFO("Memory sweep stopped");
}

SweepResult SweepWorker::SweepOnce() {
  SweepResult result;

  if (options_.expire_ttl_entries) {
    result.expired = coordinator_->DeleteExpiredMemory();
  }

  for (const auto& policy : options_.namespaces) {
    if (!SweepNamespace(policy, result)) {
      ++result.skipped;
    }
  }
  return result;
}

bool SweepWorker::SweepNamespace(const NamespacePolicy& policy, SweepResult& result) {
  if (!Claim(policy.ns)) {
    HIVE_LOG_DEBUG("Namespace sweep already running", {observability::StringField("namespace", policy.ns)});
    return false;
  }
  ClaimGuard guard([&] { Release(policy.ns); });

  if (options_.on_namespace_begin) {
    options_.on_namespace_begin(policy.ns);
  }

  if (policy.ttl_sec > 0) {
    result.aged_out += coordinator_->DeleteOldMemory(policy.ns, policy.ttl_sec);
  }
  if (policy.max_entries > 0) {
    result.trimmed += coordinator_->TrimNamespace(policy.ns, policy.max_entries);
  }
  return true;
}

bool SweepWorker::Claim(const std::string& ns) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.insert(ns).second;
}

void SweepWorker::Release(const std::string& ns) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  in_flight_.erase(ns);
}

} // namespace hive::maintenance
