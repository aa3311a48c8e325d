#include "mycelic/stats.hpp"

#include "mycelic/clock.hpp"
#include "mycelic/schema.hpp"
#include "mycelic/sqlite_database.hpp"

namespace mycelic {

StatsAggregator::StatsAggregator(Database& db) : db_(db) {}

StatsSnapshot StatsAggregator::Collect() {
  return db_.Read([](Connection& conn) {
    StatsSnapshot stats{};

    auto totals = conn.Prepare(
        "SELECT COUNT(*), AVG(importance), MIN(created_at), MAX(created_at), COUNT(parent_memory_id) FROM memories;");
    if (totals.Step()) {
      stats.memory_count = static_cast<std::uint64_t>(totals.ColumnInt64(0));
      stats.chunk_count = static_cast<std::uint64_t>(totals.ColumnInt64(4));
      if (!totals.ColumnIsNull(1)) {
        stats.average_importance = totals.ColumnDouble(1);
      }
      if (const auto earliest = totals.ColumnOptionalText(2)) {
        stats.earliest_created_at = ParseTimestamp(*earliest);
      }
      if (const auto latest = totals.ColumnOptionalText(3)) {
        stats.latest_created_at = ParseTimestamp(*latest);
      }
    }

    auto tags = conn.Prepare("SELECT DISTINCT j.value FROM memories m, json_each(m.tags) j ORDER BY j.value;");
    while (tags.Step()) {
      stats.distinct_tags.push_back(tags.ColumnText(0));
    }

    auto domains = conn.Prepare(
        "SELECT domain, COUNT(*), AVG(importance) FROM memories WHERE domain IS NOT NULL "
        "GROUP BY domain COLLATE NOCASE ORDER BY COUNT(*) DESC, domain COLLATE NOCASE ASC;");
    while (domains.Step()) {
      stats.domains.push_back(DomainCount{
          .domain = domains.ColumnText(0),
          .memory_count = static_cast<std::uint64_t>(domains.ColumnInt64(1)),
          .average_importance = domains.ColumnDouble(2),
      });
    }

    auto categories = conn.Prepare(
        "SELECT c.id, c.name, COUNT(mc.memory_id) AS n FROM categories c "
        "LEFT JOIN memory_categorizations mc ON mc.category_id = c.id "
        "GROUP BY c.id ORDER BY n DESC, c.name ASC;");
    while (categories.Step()) {
      stats.categories.push_back(CategoryCount{
          .category_id = categories.ColumnText(0),
          .name = categories.ColumnText(1),
          .memory_count = static_cast<std::uint64_t>(categories.ColumnInt64(2)),
      });
    }

    auto relationships = conn.Prepare("SELECT COUNT(*), COALESCE(SUM(auto_generated), 0) FROM memory_relationships;");
    if (relationships.Step()) {
      stats.relationship_count = static_cast<std::uint64_t>(relationships.ColumnInt64(0));
      stats.auto_generated_relationship_count = static_cast<std::uint64_t>(relationships.ColumnInt64(1));
    }

    auto sessions = conn.Prepare("SELECT COUNT(*), COALESCE(SUM(is_active), 0) FROM agent_sessions;");
    if (sessions.Step()) {
      stats.session_count = static_cast<std::uint64_t>(sessions.ColumnInt64(0));
      stats.active_session_count = static_cast<std::uint64_t>(sessions.ColumnInt64(1));
    }

    auto vectors = conn.Prepare("SELECT COUNT(*) FROM vector_metadata;");
    if (vectors.Step()) {
      stats.vector_count = static_cast<std::uint64_t>(vectors.ColumnInt64(0));
    }

    stats.schema_version = SchemaVersion(conn);
    return stats;
  });
}

}  // namespace mycelic
