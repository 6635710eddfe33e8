#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace hive::core {
class Coordinator;
}

namespace hive::maintenance {

struct NamespacePolicy {
  std::string ns;

  // 0 disables the age rule / the size cap.
  uint64_t ttl_sec     = 0;
  uint64_t max_entries = 0;
};

struct SweepOptions {
  std::chrono::milliseconds    interval{60000};
  bool                         expire_ttl_entries = true;
  std::vector<NamespacePolicy> namespaces;

  // Called with the namespace claimed, before any delete runs.
  std::function<void(const std::string&)> on_namespace_begin;
};

struct SweepResult {
  std::size_t expired  = 0;  // per-entry ttl
  std::size_t aged_out = 0;  // namespace ttl
  std::size_t trimmed  = 0;  // namespace cap
  std::size_t skipped  = 0;  // namespaces already in flight
};

/*
  Background worker that keeps the memory cache bounded.

  Every interval it removes entries past their own ttl, then applies
  each namespace policy (age, then size cap). A namespace is never
  swept twice at once; an overlapping request is skipped.
*/
class SweepWorker {
 public:
  SweepWorker(std::shared_ptr<hive::core::Coordinator> coordinator, SweepOptions options);
  ~SweepWorker();

  SweepWorker(const SweepWorker&)            = delete;
  SweepWorker& operator=(const SweepWorker&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const;

  SweepResult SweepOnce();

  // false when ns is already being swept.
  bool SweepNamespace(const NamespacePolicy& policy, SweepResult& result);

  const SweepOptions& Options() const {
    return options_;
  }

 private:
  void Run();

  bool Claim(const std::string& ns);
  void Release(const std::string& ns);

  std::shared_ptr<hive::core::Coordinator> coordinator_;
  SweepOptions                             options_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;

  std::mutex            in_flight_mutex_;
  std::set<std::string> in_flight_;
};

} // namespace hive::maintenance
