#include "mycelic/session_store.hpp"

#include "mycelic/clock.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/sqlite_database.hpp"

namespace mycelic {
namespace {

constexpr const char* kSessionColumns =
    "session_id, agent_type, agent_context, created_at, last_accessed, is_active";

Session ReadSession(const Statement& stmt) {
  return Session{
      .session_id = stmt.ColumnText(0),
      .agent_type = ParseAgentType(stmt.ColumnText(1)),
      .agent_context = stmt.ColumnOptionalText(2),
      .created_at = ParseTimestamp(stmt.ColumnText(3)),
      .last_accessed = ParseTimestamp(stmt.ColumnText(4)),
      .is_active = stmt.ColumnInt64(5) != 0,
  };
}

std::optional<Session> LoadSession(Connection& conn, const std::string& session_id) {
  auto stmt = conn.Prepare(std::string("SELECT ") + kSessionColumns + " FROM agent_sessions WHERE session_id = ?1;");
  stmt.BindText(1, session_id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadSession(stmt);
}

}  // namespace

void TouchSession(Connection& conn,
                  const std::string& session_id,
                  AgentType agent_type,
                  const std::optional<std::string>& agent_context,
                  Timestamp now) {
  auto stmt = conn.Prepare(
      "INSERT INTO agent_sessions(session_id, agent_type, agent_context, created_at, last_accessed, is_active) "
      "VALUES(?1, ?2, ?3, ?4, ?4, 1) "
      "ON CONFLICT(session_id) DO UPDATE SET last_accessed = excluded.last_accessed, is_active = 1, "
      "agent_context = COALESCE(excluded.agent_context, agent_sessions.agent_context);");
  stmt.BindText(1, session_id);
  stmt.BindText(2, std::string(ToString(agent_type)));
  stmt.BindText(3, agent_context);
  stmt.BindText(4, FormatTimestamp(now));
  stmt.Step();
}

SessionStore::SessionStore(Database& db) : db_(db) {}

Session SessionStore::Get(const std::string& session_id) {
  auto session = db_.Read([&](Connection& conn) { return LoadSession(conn, session_id); });
  if (!session.has_value()) {
    throw NotFoundError("session", session_id);
  }
  return std::move(*session);
}

std::vector<Session> SessionStore::List(bool active_only) {
  return db_.Read([&](Connection& conn) {
    auto stmt = conn.Prepare(std::string("SELECT ") + kSessionColumns +
                             " FROM agent_sessions WHERE (?1 = 0 OR is_active = 1) "
                             "ORDER BY last_accessed DESC, session_id ASC;");
    stmt.BindInt64(1, active_only ? 1 : 0);
    std::vector<Session> out{};
    while (stmt.Step()) {
      out.push_back(ReadSession(stmt));
    }
    return out;
  });
}

Session SessionStore::Deactivate(const std::string& session_id) {
  return db_.Write([&](Connection& conn) {
    auto stmt = conn.Prepare("UPDATE agent_sessions SET is_active = 0 WHERE session_id = ?1;");
    stmt.BindText(1, session_id);
    stmt.Step();
    if (conn.Changes() == 0) {
      throw NotFoundError("session", session_id);
    }
    auto session = LoadSession(conn, session_id);
    if (!session.has_value()) {
      throw InternalError("session vanished during deactivate: " + session_id);
    }
    return std::move(*session);
  });
}

}  // namespace mycelic
