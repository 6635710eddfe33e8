#include "internal/maintenance/sweep_worker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/core/coordinator.hpp"
#include "internal/store/memory_cache.hpp"
#include "tests/support/store_fixture.hpp"

namespace {

using hive::maintenance::NamespacePolicy;
using hive::maintenance::SweepOptions;
using hive::maintenance::SweepResult;
using hive::maintenance::SweepWorker;

std::shared_ptr<hive::core::Coordinator> MakeCoordinator() {
  return std::make_shared<hive::core::Coordinator>(hive::testing::OpenMemoryDb());
}

// Stores with an explicit clock so entries can be made old.
void StoreAt(const std::shared_ptr<hive::core::Coordinator>& coordinator, const std::string& ns, const std::string& key,
             uint64_t now_ms, std::optional<int64_t> ttl_sec = std::nullopt) {
  hive::db::model::MemoryRecord entry;
  entry.key     = key;
  entry.ns      = ns;
  entry.value   = "v";
  entry.ttl_sec = ttl_sec;
  hive::store::MemoryCache(coordinator->Database()).Store(entry, now_ms);
}

void TestConstructionIsValidated() {
  bool null_coordinator = false;
  try {
    SweepWorker worker(nullptr, SweepOptions{});
  } catch (const std::invalid_argument&) {
    null_coordinator = true;
  }
  assert(null_coordinator);

  bool zero_interval = false;
  try {
    SweepOptions options;
    options.interval = std::chrono::milliseconds(0);
    SweepWorker worker(MakeCoordinator(), options);
  } catch (const std::invalid_argument&) {
    zero_interval = true;
  }
  assert(zero_interval);
}

void TestSweepOnceAppliesEveryRule() {
  auto coordinator = MakeCoordinator();

  // a 1s ttl written at t=1000 ran out long ago
  StoreAt(coordinator, "default", "expired", 1000, int64_t{1});
  coordinator->StoreMemory("kept", "default", "v", "{}", int64_t{3600});

  StoreAt(coordinator, "aging", "ancient", 1000);
  coordinator->StoreMemory("recent", "aging", "v");

  for (int i = 0; i < 5; ++i) {
    coordinator->StoreMemory("k" + std::to_string(i), "capped", "v");
  }

  SweepOptions options;
  options.namespaces = {NamespacePolicy{"aging", 60, 0}, NamespacePolicy{"capped", 0, 2}};
  SweepWorker worker(coordinator, options);

  SweepResult result = worker.SweepOnce();
  assert(result.expired == 1);
  assert(result.aged_out == 1);
  assert(result.trimmed == 3);
  assert(result.skipped == 0);

  assert(!coordinator->GetMemory("expired", "default"));
  assert(coordinator->GetMemory("kept", "default"));
  assert(!coordinator->GetMemory("ancient", "aging"));
  assert(coordinator->GetMemory("recent", "aging"));
  assert(coordinator->GetNamespaceStats("capped").entries == 2);

  // nothing left to do
  result = worker.SweepOnce();
  assert(result.expired + result.aged_out + result.trimmed == 0);
}

void TestTtlExpiryCanBeDisabled() {
  auto coordinator = MakeCoordinator();
  StoreAt(coordinator, "default", "expired", 1000, int64_t{1});

  SweepOptions options;
  options.expire_ttl_entries = false;
  SweepWorker worker(coordinator, options);

  assert(worker.SweepOnce().expired == 0);
  assert(coordinator->GetMemory("expired", "default"));
}

void TestOverlappingNamespaceSweepIsSkipped() {
  auto coordinator = MakeCoordinator();
  for (int i = 0; i < 3; ++i) {
    coordinator->StoreMemory("k" + std::to_string(i), "busy", "v");
  }

  SweepWorker* self          = nullptr;
  bool         nested_result = true;
  SweepResult  nested;

  SweepOptions options;
  options.namespaces         = {NamespacePolicy{"busy", 0, 1}};
  options.on_namespace_begin = [&](const std::string& ns) {
    // a second sweep of the same namespace while the first holds it
    nested_result = self->SweepNamespace(NamespacePolicy{ns, 0, 1}, nested);
  };

  SweepWorker worker(coordinator, options);
  self = &worker;

  SweepResult result = worker.SweepOnce();
  assert(!nested_result);
  assert(nested.trimmed == 0);
  assert(result.trimmed == 2);
  assert(result.skipped == 0);

  // the claim is released afterwards
  SweepResult after;
  assert(worker.SweepNamespace(NamespacePolicy{"busy", 0, 1}, after));
}

void TestStopIsPrompt() {
  auto coordinator = MakeCoordinator();

  SweepOptions options;
  options.interval = std::chrono::minutes(10);
  SweepWorker worker(coordinator, options);

  worker.Start();
  assert(worker.IsRunning());

  const auto begin = std::chrono::steady_clock::now();
  worker.Stop();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  assert(!worker.IsRunning());
  assert(elapsed < std::chrono::seconds(5));

  // stopping twice is harmless
  worker.Stop();
}

void TestBackgroundLoopSweeps() {
  auto coordinator = MakeCoordinator();
  StoreAt(coordinator, "default", "expired", 1000, int64_t{1});

  SweepOptions options;
  options.interval = std::chrono::milliseconds(20);
  SweepWorker worker(coordinator, options);
  worker.Start();

  bool swept = false;
  for (int i = 0; i < 200 && !swept; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    swept = coordinator->GetMemoryStats().total_entries == 0;
  }
  worker.Stop();
  assert(swept);
}

} // namespace

int main() {
  TestConstructionIsValidated();
  TestSweepOnceAppliesEveryRule();
  TestTtlExpiryCanBeDisabled();
  TestOverlappingNamespaceSweepIsSkipped();
  TestStopIsPrompt();
  TestBackgroundLoopSweeps();

  std::cout << "hive_store_unit_sweep_worker: pass\n";
  return 0;
}
