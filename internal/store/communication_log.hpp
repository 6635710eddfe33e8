#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/communication_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace hive::store {

/*
  Inter-agent message log.

  Direct messages carry their delivery state on the message row.
  Broadcasts are closed per recipient through receipts, so one
  agent reading a broadcast does not hide it from the others.
*/
class CommunicationLog {
 public:
  explicit CommunicationLog(std::shared_ptr<db::sqlite::SqliteDB> db);

  void Create(const db::model::CommunicationRecord& message);

  std::optional<db::model::CommunicationRecord> Get(const std::string& id) const;

  // Undelivered messages addressed to agent_id, urgent first then oldest first.
  std::vector<db::model::CommunicationRecord> PendingFor(const std::string& agent_id) const;

  // Each stage stamps once and backfills the earlier stages.
  // With a recipient on a broadcast, only that recipient's receipt moves.
  void MarkDelivered(const std::string& id, uint64_t now_ms, const std::optional<std::string>& recipient = std::nullopt);
  void MarkRead(const std::string& id, uint64_t now_ms, const std::optional<std::string>& recipient = std::nullopt);
  void MarkAcknowledged(const std::string& id, uint64_t now_ms, const std::optional<std::string>& recipient = std::nullopt);

  std::optional<db::model::ReceiptRecord> Receipt(const std::string& message_id, const std::string& agent_id) const;

  // Messages of swarm_id created within window_ms before now_ms, newest first.
  std::vector<db::model::CommunicationRecord> Recent(const std::string& swarm_id, uint64_t window_ms, uint64_t now_ms) const;

  // Replies threaded under parent_id, oldest first.
  std::vector<db::model::CommunicationRecord> ResponsesTo(const std::string& parent_id) const;

 private:
  enum class Stage { kDelivered, kRead, kAcknowledged };

  void Mark(Stage stage, const std::string& id, uint64_t now_ms, const std::optional<std::string>& recipient);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace hive::store
