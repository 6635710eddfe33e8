#include "internal/store/communication_log.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace hive::store {

using db::model::CommunicationRecord;
using db::model::ReceiptRecord;

namespace {

CommunicationRecord MapMessage(const db::sql::Row& r) {
  CommunicationRecord c;
  c.id                 = r.GetText(0);
  c.swarm_id           = r.GetText(1);
  c.from_agent_id      = r.GetText(2);
  c.to_agent_id        = r.GetOptionalText(3);
  c.message_type       = r.GetText(4);
  c.content            = r.GetText(5);
  c.metadata           = r.GetOptionalText(6).value_or("{}");
  c.broadcast_scope    = model::ParseBroadcastScope(r.GetText(7));
  c.priority           = model::ParseMessagePriority(r.GetText(8));
  c.created_at_ms      = r.GetU64(9);
  c.delivered_at_ms    = r.GetOptionalU64(10);
  c.read_at_ms         = r.GetOptionalU64(11);
  c.acknowledged_at_ms = r.GetOptionalU64(12);
  c.requires_response  = r.GetBool(13);
  c.parent_message_id  = r.GetOptionalText(14);
  return c;
}

} // namespace

CommunicationLog::CommunicationLog(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

void CommunicationLog::Create(const CommunicationRecord& message) {
  if (message.IsBroadcast() && message.broadcast_scope == model::BroadcastScope::kNone) {
    throw util::InvalidArgument("broadcast message needs scope 'swarm' or 'global'");
  }

  db_->Execute("createCommunication", db::sql::CREATE_COMMUNICATION,
               {message.id, message.swarm_id, message.from_agent_id, db::sql::Nullable(message.to_agent_id),
                message.message_type, message.content, message.metadata, model::Text(message.broadcast_scope),
                model::Text(message.priority), message.created_at_ms, db::sql::Nullable(message.delivered_at_ms),
                db::sql::Nullable(message.read_at_ms), db::sql::Nullable(message.acknowledged_at_ms),
                static_cast<int32_t>(message.requires_response ? 1 : 0), db::sql::Nullable(message.parent_message_id)});
}

std::optional<CommunicationRecord> CommunicationLog::Get(const std::string& id) const {
  return db_->QueryOne("getCommunication", db::sql::GET_COMMUNICATION, {id}, MapMessage);
}

std::vector<CommunicationRecord> CommunicationLog::PendingFor(const std::string& agent_id) const {
  return db_->QueryAll("getPendingMessages", db::sql::GET_PENDING_MESSAGES, {agent_id}, MapMessage);
}

void CommunicationLog::MarkDelivered(const std::string& id, uint64_t now_ms, const std::optional<std::string>& recipient) {
  Mark(Stage::kDelivered, id, now_ms, recipient);
}

void CommunicationLog::MarkRead(const std::string& id, uint64_t now_ms, const std::optional<std::string>& recipient) {
  Mark(Stage::kRead, id, now_ms, recipient);
}

void CommunicationLog::MarkAcknowledged(const std::string& id, uint64_t now_ms, const std::optional<std::string>& recipient) {
  Mark(Stage::kAcknowledged, id, now_ms, recipient);
}

void CommunicationLog::Mark(Stage stage, const std::string& id, uint64_t now_ms, const std::optional<std::string>& recipient) {
  db::sqlite::SqliteTransaction tx(db_);

  auto message = Get(id);
  if (!message) {
    throw util::NotFound("message not found: " + id);
  }

  if (message->IsBroadcast() && recipient) {
    switch (stage) {
      case Stage::kDelivered:
        db_->Execute("markReceiptDelivered", db::sql::MARK_RECEIPT_DELIVERED, {now_ms, id, *recipient});
        break;
      case Stage::kRead:
        db_->Execute("markReceiptRead", db::sql::MARK_RECEIPT_READ, {now_ms, id, *recipient});
        break;
      case Stage::kAcknowledged:
        db_->Execute("markReceiptAcknowledged", db::sql::MARK_RECEIPT_ACKNOWLEDGED, {now_ms, id, *recipient});
        break;
    }
    tx.Commit();
    return;
  }

  if (recipient && message->to_agent_id != recipient) {
    throw util::InvalidArgument("message " + id + " is not addressed to " + *recipient);
  }

  switch (stage) {
    case Stage::kDelivered:
      db_->Execute("markMessageDelivered", db::sql::MARK_MESSAGE_DELIVERED, {now_ms, id});
      break;
    case Stage::kRead:
      db_->Execute("markMessageRead", db::sql::MARK_MESSAGE_READ, {now_ms, id});
      break;
    case Stage::kAcknowledged:
      db_->Execute("markMessageAcknowledged", db::sql::MARK_MESSAGE_ACKNOWLEDGED, {now_ms, id});
      break;
  }
  tx.Commit();
}

std::optional<ReceiptRecord> CommunicationLog::Receipt(const std::string& message_id, const std::string& agent_id) const {
  return db_->QueryOne("getReceipt", db::sql::GET_RECEIPT, {message_id, agent_id}, [](const db::sql::Row& r) {
    ReceiptRecord rec;
    rec.message_id         = r.GetText(0);
    rec.agent_id           = r.GetText(1);
    rec.delivered_at_ms    = r.GetOptionalU64(2);
    rec.read_at_ms         = r.GetOptionalU64(3);
    rec.acknowledged_at_ms = r.GetOptionalU64(4);
    return rec;
  });
}

std::vector<CommunicationRecord> CommunicationLog::Recent(const std::string& swarm_id, uint64_t window_ms, uint64_t now_ms) const {
  const uint64_t cutoff = now_ms > window_ms ? now_ms - window_ms : 0;
  return db_->QueryAll("getRecentMessages", db::sql::GET_RECENT_MESSAGES, {swarm_id, cutoff}, MapMessage);
}

std::vector<CommunicationRecord> CommunicationLog::ResponsesTo(const std::string& parent_id) const {
  return db_->QueryAll("getMessageResponses", db::sql::GET_MESSAGE_RESPONSES, {parent_id}, MapMessage);
}

} // namespace hive::store
