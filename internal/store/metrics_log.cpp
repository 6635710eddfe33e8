#include "internal/store/metrics_log.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace hive::store {

using db::model::PerformanceMetricRecord;

MetricsLog::MetricsLog(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

void MetricsLog::Append(const PerformanceMetricRecord& metric) {
  if (metric.metric_type.empty()) {
    throw util::InvalidArgument("metric_type must not be empty");
  }

  db_->Execute("storePerformanceMetric", db::sql::STORE_PERFORMANCE_METRIC,
               {metric.id, metric.swarm_id, db::sql::Nullable(metric.agent_id), db::sql::Nullable(metric.task_id),
                metric.metric_type, metric.metric_value, metric.metadata, metric.created_at_ms});
}

std::vector<PerformanceMetricRecord> MetricsLog::List(const std::string& swarm_id, const std::string& metric_type,
                                                      std::size_t limit) const {
  if (limit == 0) {
    throw util::InvalidArgument("limit must be positive");
  }

  return db_->QueryAll("getPerformanceMetrics", db::sql::GET_PERFORMANCE_METRICS,
                       {swarm_id, metric_type, static_cast<uint64_t>(limit)}, [](const db::sql::Row& r) {
                         PerformanceMetricRecord m;
                         m.id            = r.GetText(0);
                         m.swarm_id      = r.GetText(1);
                         m.agent_id      = r.GetOptionalText(2);
                         m.task_id       = r.GetOptionalText(3);
                         m.metric_type   = r.GetText(4);
                         m.metric_value  = r.GetDouble(5);
                         m.metadata      = r.GetOptionalText(6).value_or("{}");
                         m.created_at_ms = r.GetU64(7);
                         return m;
                       });
}

} // namespace hive::store
