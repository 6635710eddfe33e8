#pragma once

namespace hive::db::sql {

/*
  Statement catalog.

  Every operation the stores run is listed here and compiled once
  per op key by SqliteDB. The only statements built at runtime are
  partial updates, whose SET clause comes from an allow-listed
  UpdateSet (see internal/store/update_set.hpp).

  Column order of each SELECT matches the record mappers in the
  corresponding store.
*/

// ---------------------------------------------------------------------
// Swarms
// ---------------------------------------------------------------------

static constexpr const char* CREATE_SWARM =
    "INSERT INTO swarms(id,name,topology,queen_mode,max_agents,consensus_threshold,"
    "memory_ttl,config,created_at,updated_at,is_active,status)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* GET_SWARM =
    "SELECT id,name,topology,queen_mode,max_agents,consensus_threshold,memory_ttl,"
    "config,created_at,updated_at,is_active,status"
    " FROM swarms WHERE id=?;";

static constexpr const char* GET_ACTIVE_SWARM =
    "SELECT id FROM swarms WHERE is_active=1 LIMIT 1;";

static constexpr const char* CLEAR_ACTIVE_SWARMS =
    "UPDATE swarms SET is_active=0 WHERE is_active<>0;";

static constexpr const char* ACTIVATE_SWARM =
    "UPDATE swarms SET is_active=1, updated_at=? WHERE id=?;";

static constexpr const char* GET_ALL_SWARMS =
    "SELECT s.id,s.name,s.topology,s.queen_mode,s.max_agents,s.consensus_threshold,"
    "s.memory_ttl,s.config,s.created_at,s.updated_at,s.is_active,s.status,"
    "(SELECT COUNT(*) FROM agents a WHERE a.swarm_id=s.id)"
    " FROM swarms s ORDER BY s.created_at DESC, s.rowid DESC;";

static constexpr const char* UPDATE_SWARM_STATUS =
    "UPDATE swarms SET status=?1, updated_at=?2,"
    " is_active=CASE WHEN ?1='archived' THEN 0 ELSE is_active END"
    " WHERE id=?3;";

static constexpr const char* GET_SWARM_STATS =
    "SELECT"
    " (SELECT COUNT(*) FROM agents WHERE swarm_id=?1),"
    " (SELECT COUNT(*) FROM agents WHERE swarm_id=?1 AND status='active'),"
    " (SELECT COUNT(*) FROM agents WHERE swarm_id=?1 AND status='busy'),"
    " (SELECT COUNT(*) FROM tasks WHERE swarm_id=?1),"
    " (SELECT COUNT(*) FROM tasks WHERE swarm_id=?1 AND status IN ('pending','assigned')),"
    " (SELECT COUNT(*) FROM tasks WHERE swarm_id=?1 AND status='completed'),"
    " (SELECT COUNT(*) FROM tasks WHERE swarm_id=?1 AND status='failed'),"
    " (SELECT COUNT(*) FROM communications WHERE swarm_id=?1 AND created_at>?2);";

// ?1 swarm id, ?2 start of the recent window (epoch ms). One row per topology.
static constexpr const char* GET_STRATEGY_PERFORMANCE =
    "SELECT s.topology,"
    " COUNT(t.id),"
    " COALESCE(SUM(CASE WHEN t.status='completed' THEN 1 ELSE 0 END),0),"
    " AVG(CASE WHEN t.status='completed' THEN t.completed_at - t.created_at END),"
    " AVG(t.actual_duration),"
    " COALESCE(SUM(CASE WHEN t.created_at>?2 THEN 1 ELSE 0 END),0),"
    " COALESCE(SUM(CASE WHEN t.created_at>?2 AND t.status='completed' THEN 1 ELSE 0 END),0)"
    " FROM swarms s LEFT JOIN tasks t ON s.id=t.swarm_id"
    " WHERE s.id=?1"
    " GROUP BY s.topology;";

// ---------------------------------------------------------------------
// Agents
// ---------------------------------------------------------------------

static constexpr const char* CREATE_AGENT =
    "INSERT INTO agents(id,swarm_id,name,type,status,capabilities,current_task_id,"
    "message_count,error_count,success_count,created_at,last_active_at,metadata)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* GET_AGENT =
    "SELECT id,swarm_id,name,type,status,capabilities,current_task_id,message_count,"
    "error_count,success_count,created_at,last_active_at,metadata"
    " FROM agents WHERE id=?;";

static constexpr const char* GET_AGENTS =
    "SELECT id,swarm_id,name,type,status,capabilities,current_task_id,message_count,"
    "error_count,success_count,created_at,last_active_at,metadata"
    " FROM agents WHERE swarm_id=? ORDER BY created_at ASC, rowid ASC;";

static constexpr const char* UPDATE_AGENT_PREFIX = "UPDATE agents SET ";

static constexpr const char* UPDATE_AGENT_STATUS =
    "UPDATE agents SET status=?, last_active_at=? WHERE id=?;";

static constexpr const char* RECORD_AGENT_SUCCESS =
    "UPDATE agents SET success_count=success_count+1, last_active_at=? WHERE id=?;";

static constexpr const char* RECORD_AGENT_ERROR =
    "UPDATE agents SET error_count=error_count+1, last_active_at=? WHERE id=?;";

static constexpr const char* GET_AGENT_PERFORMANCE =
    "SELECT a.success_count, a.error_count,"
    " (SELECT COUNT(*) FROM tasks WHERE assigned_agent_id=a.id AND status='completed'),"
    " (SELECT COUNT(*) FROM tasks WHERE assigned_agent_id=a.id AND status='failed'),"
    " (SELECT AVG(actual_duration) FROM tasks"
    "   WHERE assigned_agent_id=a.id AND actual_duration IS NOT NULL)"
    " FROM agents a WHERE a.id=?;";

// ---------------------------------------------------------------------
// Tasks
// ---------------------------------------------------------------------

static constexpr const char* CREATE_TASK =
    "INSERT INTO tasks(id,swarm_id,type,description,status,priority,assigned_agent_id,"
    "dependencies,requirements,result,created_at,assigned_at,started_at,completed_at,"
    "estimated_duration,actual_duration,metadata)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* GET_TASK =
    "SELECT id,swarm_id,type,description,status,priority,assigned_agent_id,dependencies,"
    "requirements,result,created_at,assigned_at,started_at,completed_at,"
    "estimated_duration,actual_duration,metadata"
    " FROM tasks WHERE id=?;";

static constexpr const char* GET_TASKS =
    "SELECT id,swarm_id,type,description,status,priority,assigned_agent_id,dependencies,"
    "requirements,result,created_at,assigned_at,started_at,completed_at,"
    "estimated_duration,actual_duration,metadata"
    " FROM tasks WHERE swarm_id=? ORDER BY created_at DESC, rowid DESC;";

static constexpr const char* UPDATE_TASK_PREFIX = "UPDATE tasks SET ";

// ?1 status, ?2 now, ?3 id. completed_at follows the terminal states only.
static constexpr const char* UPDATE_TASK_STATUS =
    "UPDATE tasks SET status=?1,"
    " completed_at=CASE WHEN ?1 IN ('completed','failed','cancelled') THEN ?2 ELSE NULL END,"
    " started_at=CASE WHEN ?1='in_progress' THEN COALESCE(started_at, ?2) ELSE started_at END"
    " WHERE id=?3;";

// Rank then FIFO. rowid breaks ties between tasks created in the same millisecond.
static constexpr const char* GET_PENDING_TASKS =
    "SELECT id,swarm_id,type,description,status,priority,assigned_agent_id,dependencies,"
    "requirements,result,created_at,assigned_at,started_at,completed_at,"
    "estimated_duration,actual_duration,metadata"
    " FROM tasks WHERE swarm_id=? AND status='pending'"
    " ORDER BY CASE priority WHEN 'critical' THEN 1 WHEN 'high' THEN 2"
    " WHEN 'medium' THEN 3 ELSE 4 END, created_at ASC, rowid ASC;";

static constexpr const char* GET_ACTIVE_TASKS =
    "SELECT t.id,t.swarm_id,t.type,t.description,t.status,t.priority,t.assigned_agent_id,"
    "t.dependencies,t.requirements,t.result,t.created_at,t.assigned_at,t.started_at,"
    "t.completed_at,t.estimated_duration,t.actual_duration,t.metadata,a.name"
    " FROM tasks t LEFT JOIN agents a ON t.assigned_agent_id=a.id"
    " WHERE t.swarm_id=? AND t.status IN ('assigned','in_progress')"
    " ORDER BY t.created_at ASC, t.rowid ASC;";

static constexpr const char* REASSIGN_TASK =
    "UPDATE tasks SET assigned_agent_id=?, status='assigned', assigned_at=? WHERE id=?;";

// ---------------------------------------------------------------------
// Memory
// ---------------------------------------------------------------------

// created_at and access_count survive an overwrite.
static constexpr const char* STORE_MEMORY =
    "INSERT INTO memory(key,namespace,value,access_count,last_accessed_at,created_at,"
    "updated_at,metadata,ttl)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(key,namespace) DO UPDATE SET"
    " value=excluded.value,"
    " updated_at=excluded.updated_at,"
    " metadata=excluded.metadata,"
    " ttl=excluded.ttl;";

static constexpr const char* GET_MEMORY =
    "SELECT key,namespace,value,access_count,last_accessed_at,created_at,updated_at,"
    "metadata,ttl"
    " FROM memory WHERE key=? AND namespace=?;";

static constexpr const char* UPDATE_MEMORY_ACCESS =
    "UPDATE memory SET access_count=access_count+1, last_accessed_at=?"
    " WHERE key=? AND namespace=?;";

static constexpr const char* SEARCH_MEMORY =
    "SELECT key,namespace,value,access_count,last_accessed_at,created_at,updated_at,"
    "metadata,ttl"
    " FROM memory WHERE namespace=?1"
    " AND (key LIKE ?2 ESCAPE '\\' OR value LIKE ?2 ESCAPE '\\')"
    " ORDER BY access_count DESC, last_accessed_at DESC, rowid DESC"
    " LIMIT ?3;";

static constexpr const char* DELETE_MEMORY =
    "DELETE FROM memory WHERE key=? AND namespace=?;";

static constexpr const char* LIST_MEMORY =
    "SELECT key,namespace,value,access_count,last_accessed_at,created_at,updated_at,"
    "metadata,ttl"
    " FROM memory WHERE namespace=?"
    " ORDER BY access_count DESC, last_accessed_at DESC, rowid DESC"
    " LIMIT ?;";

static constexpr const char* LIST_NAMESPACES =
    "SELECT DISTINCT namespace FROM memory ORDER BY namespace;";

static constexpr const char* GET_MEMORY_STATS =
    "SELECT COUNT(*), COALESCE(SUM(LENGTH(value)),0), COUNT(DISTINCT namespace)"
    " FROM memory;";

static constexpr const char* GET_NAMESPACE_STATS =
    "SELECT COUNT(*), COALESCE(SUM(LENGTH(value)),0), AVG(ttl), AVG(access_count),"
    " MAX(last_accessed_at)"
    " FROM memory WHERE namespace=?;";

// ?1 namespace, ?2 cutoff (epoch ms)
static constexpr const char* DELETE_OLD_ENTRIES =
    "DELETE FROM memory WHERE namespace=?1 AND updated_at<?2;";

static constexpr const char* DELETE_EXPIRED_ENTRIES =
    "DELETE FROM memory WHERE ttl IS NOT NULL AND updated_at + ttl*1000 < ?;";

static constexpr const char* TRIM_NAMESPACE =
    "DELETE FROM memory WHERE namespace=?1 AND rowid NOT IN ("
    " SELECT rowid FROM memory WHERE namespace=?1"
    " ORDER BY access_count DESC, last_accessed_at DESC, rowid DESC"
    " LIMIT ?2);";

static constexpr const char* CLEAR_NAMESPACE =
    "DELETE FROM memory WHERE namespace=?;";

// Across namespaces; never-read entries last.
static constexpr const char* GET_RECENT_MEMORY =
    "SELECT key,namespace,value,access_count,last_accessed_at,created_at,updated_at,"
    "metadata,ttl"
    " FROM memory"
    " ORDER BY last_accessed_at IS NULL, last_accessed_at DESC, updated_at DESC, rowid DESC"
    " LIMIT ?;";

// ?1 cutoff (epoch ms) on created_at, oldest first
static constexpr const char* GET_OLD_MEMORY =
    "SELECT key,namespace,value,access_count,last_accessed_at,created_at,updated_at,"
    "metadata,ttl"
    " FROM memory WHERE created_at<?1"
    " ORDER BY created_at ASC, rowid ASC"
    " LIMIT ?2;";

// Writes a saved entry back as-is; access bookkeeping comes from the caller.
static constexpr const char* RESTORE_MEMORY_ENTRY =
    "UPDATE memory SET value=?, metadata=?, access_count=?, last_accessed_at=?, updated_at=?"
    " WHERE key=? AND namespace=?;";

// ?1 is an escaped LIKE pattern of the swarm tag in metadata
static constexpr const char* CLEAR_SWARM_MEMORY =
    "DELETE FROM memory WHERE metadata LIKE ?1 ESCAPE '\\';";

// ---------------------------------------------------------------------
// Communications
// ---------------------------------------------------------------------

static constexpr const char* CREATE_COMMUNICATION =
    "INSERT INTO communications(id,swarm_id,from_agent_id,to_agent_id,message_type,"
    "content,metadata,broadcast_scope,priority,created_at,delivered_at,read_at,"
    "acknowledged_at,requires_response,parent_message_id)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* GET_COMMUNICATION =
    "SELECT id,swarm_id,from_agent_id,to_agent_id,message_type,content,metadata,"
    "broadcast_scope,priority,created_at,delivered_at,read_at,acknowledged_at,"
    "requires_response,parent_message_id"
    " FROM communications WHERE id=?;";

// ?1 agent id. Broadcasts stay pending per agent until a receipt says otherwise.
static constexpr const char* GET_PENDING_MESSAGES =
    "SELECT c.id,c.swarm_id,c.from_agent_id,c.to_agent_id,c.message_type,c.content,"
    "c.metadata,c.broadcast_scope,c.priority,c.created_at,c.delivered_at,c.read_at,"
    "c.acknowledged_at,c.requires_response,c.parent_message_id"
    " FROM communications c"
    " WHERE c.delivered_at IS NULL AND ("
    "  c.to_agent_id=?1"
    "  OR (c.to_agent_id IS NULL AND c.from_agent_id<>?1"
    "   AND (c.broadcast_scope='global'"
    "    OR (c.broadcast_scope='swarm'"
    "     AND c.swarm_id=(SELECT swarm_id FROM agents WHERE id=?1)))"
    "   AND NOT EXISTS (SELECT 1 FROM communication_receipts r"
    "    WHERE r.message_id=c.id AND r.agent_id=?1 AND r.delivered_at IS NOT NULL)))"
    " ORDER BY CASE c.priority WHEN 'urgent' THEN 1 WHEN 'high' THEN 2"
    " WHEN 'medium' THEN 3 ELSE 4 END, c.created_at ASC, c.rowid ASC;";

// ?1 now, ?2 id. Each timestamp is written once; later stages backfill earlier ones.
static constexpr const char* MARK_MESSAGE_DELIVERED =
    "UPDATE communications SET delivered_at=COALESCE(delivered_at,?1) WHERE id=?2;";

static constexpr const char* MARK_MESSAGE_READ =
    "UPDATE communications SET delivered_at=COALESCE(delivered_at,?1),"
    " read_at=COALESCE(read_at,?1) WHERE id=?2;";

static constexpr const char* MARK_MESSAGE_ACKNOWLEDGED =
    "UPDATE communications SET delivered_at=COALESCE(delivered_at,?1),"
    " read_at=COALESCE(read_at,?1), acknowledged_at=COALESCE(acknowledged_at,?1)"
    " WHERE id=?2;";

// ?1 now, ?2 message id, ?3 agent id
static constexpr const char* MARK_RECEIPT_DELIVERED =
    "INSERT INTO communication_receipts(message_id,agent_id,delivered_at)"
    " VALUES(?2,?3,?1)"
    " ON CONFLICT(message_id,agent_id) DO UPDATE SET"
    " delivered_at=COALESCE(delivered_at,excluded.delivered_at);";

static constexpr const char* MARK_RECEIPT_READ =
    "INSERT INTO communication_receipts(message_id,agent_id,delivered_at,read_at)"
    " VALUES(?2,?3,?1,?1)"
    " ON CONFLICT(message_id,agent_id) DO UPDATE SET"
    " delivered_at=COALESCE(delivered_at,excluded.delivered_at),"
    " read_at=COALESCE(read_at,excluded.read_at);";

static constexpr const char* MARK_RECEIPT_ACKNOWLEDGED =
    "INSERT INTO communication_receipts(message_id,agent_id,delivered_at,read_at,acknowledged_at)"
    " VALUES(?2,?3,?1,?1,?1)"
    " ON CONFLICT(message_id,agent_id) DO UPDATE SET"
    " delivered_at=COALESCE(delivered_at,excluded.delivered_at),"
    " read_at=COALESCE(read_at,excluded.read_at),"
    " acknowledged_at=COALESCE(acknowledged_at,excluded.acknowledged_at);";

static constexpr const char* GET_RECEIPT =
    "SELECT message_id,agent_id,delivered_at,read_at,acknowledged_at"
    " FROM communication_receipts WHERE message_id=? AND agent_id=?;";

static constexpr const char* GET_RECENT_MESSAGES =
    "SELECT id,swarm_id,from_agent_id,to_agent_id,message_type,content,metadata,"
    "broadcast_scope,priority,created_at,delivered_at,read_at,acknowledged_at,"
    "requires_response,parent_message_id"
    " FROM communications WHERE swarm_id=? AND created_at>?"
    " ORDER BY created_at DESC, rowid DESC;";

static constexpr const char* GET_MESSAGE_RESPONSES =
    "SELECT id,swarm_id,from_agent_id,to_agent_id,message_type,content,metadata,"
    "broadcast_scope,priority,created_at,delivered_at,read_at,acknowledged_at,"
    "requires_response,parent_message_id"
    " FROM communications WHERE parent_message_id=?"
    " ORDER BY created_at ASC, rowid ASC;";

// ---------------------------------------------------------------------
// Consensus
// ---------------------------------------------------------------------

static constexpr const char* CREATE_CONSENSUS_PROPOSAL =
    "INSERT INTO consensus(id,swarm_id,proposal_type,proposal_data,proposed_by,"
    "threshold_required,votes_for,votes_against,votes_total,status,created_at,"
    "resolved_at,timeout_at)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* GET_CONSENSUS_PROPOSAL =
    "SELECT id,swarm_id,proposal_type,proposal_data,proposed_by,threshold_required,"
    "votes_for,votes_against,votes_total,status,created_at,resolved_at,timeout_at"
    " FROM consensus WHERE id=?;";

static constexpr const char* RECORD_CONSENSUS_VOTE =
    "INSERT INTO consensus_votes(proposal_id,agent_id,vote,reason,created_at)"
    " VALUES(?,?,?,?,?);";

// Single statement keeps votes_total = votes_for + votes_against.
static constexpr const char* SUBMIT_CONSENSUS_VOTE =
    "UPDATE consensus SET votes_for=votes_for+?, votes_against=votes_against+?,"
    " votes_total=votes_total+1"
    " WHERE id=? AND status='pending';";

// Guarded: a terminal status is written exactly once.
static constexpr const char* UPDATE_CONSENSUS_STATUS =
    "UPDATE consensus SET status=?, resolved_at=? WHERE id=? AND status='pending';";

static constexpr const char* GET_RECENT_CONSENSUS =
    "SELECT id,swarm_id,proposal_type,proposal_data,proposed_by,threshold_required,"
    "votes_for,votes_against,votes_total,status,created_at,resolved_at,timeout_at"
    " FROM consensus WHERE swarm_id=? ORDER BY created_at DESC, rowid DESC LIMIT ?;";

static constexpr const char* GET_CONSENSUS_VOTES =
    "SELECT proposal_id,agent_id,vote,reason,created_at"
    " FROM consensus_votes WHERE proposal_id=? ORDER BY created_at ASC, rowid ASC;";

// ---------------------------------------------------------------------
// Performance metrics
// ---------------------------------------------------------------------

static constexpr const char* STORE_PERFORMANCE_METRIC =
    "INSERT INTO performance_metrics(id,swarm_id,agent_id,task_id,metric_type,"
    "metric_value,metadata,created_at)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* GET_PERFORMANCE_METRICS =
    "SELECT id,swarm_id,agent_id,task_id,metric_type,metric_value,metadata,created_at"
    " FROM performance_metrics WHERE swarm_id=? AND metric_type=?"
    " ORDER BY created_at DESC, rowid DESC LIMIT ?;";

// ---------------------------------------------------------------------
// Health
// ---------------------------------------------------------------------

static constexpr const char* HEALTH_TABLE_EXISTS =
    "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?;";

static constexpr const char* HEALTH_QUICK_CHECK = "PRAGMA quick_check;";

}
