#pragma once

namespace hive::db::sql {

/*
  Built-in schema. Every statement is idempotent so Initialize()
  can run against an existing database file.

  Timestamps are epoch milliseconds. Serialized blobs (config,
  capabilities, metadata, ...) are opaque TEXT.
*/

static constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS swarms ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " topology TEXT NOT NULL CHECK (topology IN ('mesh','hierarchical','ring','star')),"
    " queen_mode TEXT NOT NULL DEFAULT 'centralized' CHECK (queen_mode IN ('centralized','distributed')),"
    " max_agents INTEGER NOT NULL DEFAULT 8,"
    " consensus_threshold REAL NOT NULL DEFAULT 0.66 CHECK (consensus_threshold >= 0 AND consensus_threshold <= 1),"
    " memory_ttl INTEGER NOT NULL DEFAULT 86400,"
    " config TEXT,"
    " created_at INTEGER NOT NULL,"
    " updated_at INTEGER NOT NULL,"
    " is_active INTEGER NOT NULL DEFAULT 0,"
    " status TEXT NOT NULL DEFAULT 'active' CHECK (status IN ('active','paused','archived')));",

    "CREATE TABLE IF NOT EXISTS agents ("
    " id TEXT PRIMARY KEY,"
    " swarm_id TEXT NOT NULL REFERENCES swarms(id),"
    " name TEXT NOT NULL,"
    " type TEXT NOT NULL,"
    " status TEXT NOT NULL DEFAULT 'idle' CHECK (status IN ('idle','busy','active','error','offline')),"
    " capabilities TEXT,"
    " current_task_id TEXT,"
    " message_count INTEGER NOT NULL DEFAULT 0,"
    " error_count INTEGER NOT NULL DEFAULT 0,"
    " success_count INTEGER NOT NULL DEFAULT 0,"
    " created_at INTEGER NOT NULL,"
    " last_active_at INTEGER,"
    " metadata TEXT);",

    "CREATE TABLE IF NOT EXISTS tasks ("
    " id TEXT PRIMARY KEY,"
    " swarm_id TEXT NOT NULL REFERENCES swarms(id),"
    " type TEXT,"
    " description TEXT NOT NULL,"
    " status TEXT NOT NULL DEFAULT 'pending'"
    "   CHECK (status IN ('pending','assigned','in_progress','completed','failed','cancelled')),"
    " priority TEXT NOT NULL DEFAULT 'medium' CHECK (priority IN ('critical','high','medium','low')),"
    " assigned_agent_id TEXT REFERENCES agents(id),"
    " dependencies TEXT,"
    " requirements TEXT,"
    " result TEXT,"
    " created_at INTEGER NOT NULL,"
    " assigned_at INTEGER,"
    " started_at INTEGER,"
    " completed_at INTEGER,"
    " estimated_duration INTEGER,"
    " actual_duration INTEGER,"
    " metadata TEXT);",

    "CREATE TABLE IF NOT EXISTS memory ("
    " key TEXT NOT NULL,"
    " namespace TEXT NOT NULL DEFAULT 'default',"
    " value TEXT NOT NULL,"
    " access_count INTEGER NOT NULL DEFAULT 0,"
    " last_accessed_at INTEGER,"
    " created_at INTEGER NOT NULL,"
    " updated_at INTEGER NOT NULL,"
    " metadata TEXT,"
    " ttl INTEGER,"
    " PRIMARY KEY (key, namespace));",

    "CREATE TABLE IF NOT EXISTS communications ("
    " id TEXT PRIMARY KEY,"
    " swarm_id TEXT NOT NULL REFERENCES swarms(id),"
    " from_agent_id TEXT NOT NULL,"
    " to_agent_id TEXT,"
    " message_type TEXT NOT NULL,"
    " content TEXT NOT NULL,"
    " metadata TEXT,"
    " broadcast_scope TEXT NOT NULL DEFAULT 'none' CHECK (broadcast_scope IN ('swarm','global','none')),"
    " priority TEXT NOT NULL DEFAULT 'medium' CHECK (priority IN ('urgent','high','medium','low')),"
    " created_at INTEGER NOT NULL,"
    " delivered_at INTEGER,"
    " read_at INTEGER,"
    " acknowledged_at INTEGER,"
    " requires_response INTEGER NOT NULL DEFAULT 0,"
    " parent_message_id TEXT REFERENCES communications(id));",

    "CREATE TABLE IF NOT EXISTS communication_receipts ("
    " message_id TEXT NOT NULL REFERENCES communications(id),"
    " agent_id TEXT NOT NULL,"
    " delivered_at INTEGER,"
    " read_at INTEGER,"
    " acknowledged_at INTEGER,"
    " PRIMARY KEY (message_id, agent_id));",

    "CREATE TABLE IF NOT EXISTS consensus ("
    " id TEXT PRIMARY KEY,"
    " swarm_id TEXT NOT NULL REFERENCES swarms(id),"
    " proposal_type TEXT NOT NULL,"
    " proposal_data TEXT,"
    " proposed_by TEXT,"
    " threshold_required REAL NOT NULL CHECK (threshold_required >= 0 AND threshold_required <= 1),"
    " votes_for INTEGER NOT NULL DEFAULT 0,"
    " votes_against INTEGER NOT NULL DEFAULT 0,"
    " votes_total INTEGER NOT NULL DEFAULT 0,"
    " status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','achieved','failed','timeout')),"
    " created_at INTEGER NOT NULL,"
    " resolved_at INTEGER,"
    " timeout_at INTEGER,"
    " CHECK (votes_total = votes_for + votes_against));",

    "CREATE TABLE IF NOT EXISTS consensus_votes ("
    " proposal_id TEXT NOT NULL REFERENCES consensus(id),"
    " agent_id TEXT NOT NULL,"
    " vote INTEGER NOT NULL,"
    " reason TEXT,"
    " created_at INTEGER NOT NULL,"
    " PRIMARY KEY (proposal_id, agent_id));",

    "CREATE TABLE IF NOT EXISTS performance_metrics ("
    " id TEXT PRIMARY KEY,"
    " swarm_id TEXT,"
    " agent_id TEXT,"
    " task_id TEXT,"
    " metric_type TEXT NOT NULL,"
    " metric_value REAL NOT NULL,"
    " metadata TEXT,"
    " created_at INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS idx_swarms_active ON swarms(is_active);",
    "CREATE INDEX IF NOT EXISTS idx_agents_swarm ON agents(swarm_id, created_at);",
    "CREATE INDEX IF NOT EXISTS idx_tasks_swarm_status ON tasks(swarm_id, status);",
    "CREATE INDEX IF NOT EXISTS idx_tasks_agent ON tasks(assigned_agent_id);",
    "CREATE INDEX IF NOT EXISTS idx_memory_rank ON memory(namespace, access_count, last_accessed_at);",
    "CREATE INDEX IF NOT EXISTS idx_memory_updated ON memory(namespace, updated_at);",
    "CREATE INDEX IF NOT EXISTS idx_communications_to ON communications(to_agent_id, delivered_at);",
    "CREATE INDEX IF NOT EXISTS idx_communications_swarm ON communications(swarm_id, created_at);",
    "CREATE INDEX IF NOT EXISTS idx_communications_parent ON communications(parent_message_id);",
    "CREATE INDEX IF NOT EXISTS idx_consensus_swarm ON consensus(swarm_id, created_at);",
    "CREATE INDEX IF NOT EXISTS idx_metrics_swarm ON performance_metrics(swarm_id, created_at);",
};

// Tables every healthy database must carry.
static constexpr const char* kCoreTables[] = {
    "swarms", "agents", "tasks", "memory", "communications", "consensus"};

}
