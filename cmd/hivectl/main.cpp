#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  hivectl <config.yaml> health\n"
            << "  hivectl <config.yaml> swarms\n"
            << "  hivectl <config.yaml> activate <swarm_id>\n"
            << "  hivectl <config.yaml> stats <swarm_id>\n"
            << "  hivectl <config.yaml> get <namespace> <key>\n"
            << "  hivectl <config.yaml> put <namespace> <key> <value> [ttl_sec]\n"
            << "  hivectl <config.yaml> search <namespace> <pattern> [limit]\n"
            << "  hivectl <config.yaml> memory-stats [namespace]\n"
            << "  hivectl <config.yaml> namespaces\n"
            << "  hivectl <config.yaml> sweep\n";
}

static std::string FormatOptionalMillis(const std::optional<uint64_t>& ms) {
  return ms ? hive::util::FormatUnixMillis(*ms) : "-";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = hive::config::ConfigLoader::LoadFromYaml(config_path);
    hive::observability::InitializeLogging(config);

    auto  app         = hive::factory::BuildRuntime(config);
    auto& coordinator = *app.coordinator;

    // ------------------------------------------------------------

    if (cmd == "health") {
      auto report = coordinator.HealthCheck();
      for (const auto& table : report.tables) {
        std::cout << table.table << "=" << table.rows << "\n";
      }
      std::cout << "healthy=" << (report.healthy ? "true" : "false") << " message=" << report.message << "\n";
      return report.healthy ? 0 : 3;
    }

    // ------------------------------------------------------------

    if (cmd == "swarms") {
      auto active = coordinator.GetActiveSwarmId();
      for (const auto& summary : coordinator.ListSwarms()) {
        const auto& s = summary.swarm;
        std::cout << (active && *active == s.id ? "* " : "  ") << s.id << " " << s.name << " topology=" << hive::model::ToString(s.topology)
                  << " status=" << hive::model::ToString(s.status) << " agents=" << summary.agent_count
                  << " created=" << hive::util::FormatUnixMillis(s.created_at_ms) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "activate") {
      if (argc < 4) return 1;
      coordinator.SetActiveSwarm(argv[3]);
      std::cout << "active=" << argv[3] << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      if (argc < 4) return 1;
      auto stats = coordinator.GetSwarmStats(argv[3]);
      std::cout << "agents=" << stats.agent_count << " busy=" << stats.busy_agents << " utilization=" << stats.utilization << "\n";
      std::cout << "tasks=" << stats.task_count << " backlog=" << stats.task_backlog << " completed=" << stats.completed_tasks
                << " failed=" << stats.failed_tasks << "\n";
      std::cout << "messages_last_hour=" << stats.recent_messages << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (argc < 5) return 1;
      auto entry = coordinator.GetMemory(argv[4], argv[3]);
      if (!entry) {
        std::cerr << "not found\n";
        return 4;
      }
      std::cout << entry->value << "\n";
      std::cout << "access_count=" << entry->access_count << " last_accessed=" << FormatOptionalMillis(entry->last_accessed_at_ms) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "put") {
      if (argc < 6) return 1;
      std::optional<int64_t> ttl;
      if (argc >= 7) ttl = std::stoll(argv[6]);
      coordinator.StoreMemory(argv[4], argv[3], argv[5], "{}", ttl);
      std::cout << "stored\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "search") {
      if (argc < 5) return 1;
      std::size_t limit = argc >= 6 ? std::stoull(argv[5]) : 10;
      for (const auto& entry : coordinator.SearchMemory(argv[3], argv[4], limit)) {
        std::cout << entry.key << "=" << entry.value << " (access_count=" << entry.access_count << ")\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "memory-stats") {
      if (argc >= 4) {
        auto stats = coordinator.GetNamespaceStats(argv[3]);
        std::cout << "entries=" << stats.entries << " size=" << stats.size
                  << " last_accessed=" << FormatOptionalMillis(stats.last_accessed_at_ms) << "\n";
        return 0;
      }
      auto stats = coordinator.GetMemoryStats();
      std::cout << "entries=" << stats.total_entries << " size=" << stats.total_size << " namespaces=" << stats.namespaces << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "namespaces") {
      for (const auto& ns : coordinator.ListNamespaces()) {
        std::cout << ns << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "sweep") {
      if (!app.sweep_worker) {
        std::cerr << "maintenance.sweep_interval_ms is 0; nothing to sweep\n";
        return 1;
      }
      auto result = app.sweep_worker->SweepOnce();
      std::cout << "expired=" << result.expired << " aged_out=" << result.aged_out << " trimmed=" << result.trimmed << "\n";
      return 0;
    }
  } catch (const hive::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return 4;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
