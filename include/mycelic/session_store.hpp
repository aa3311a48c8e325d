#pragma once

#include "mycelic/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mycelic {

class Connection;
class Database;

// Upsert inside the caller's write transaction: an existing session gets
// last_accessed bumped and is marked active; an unseen one is created.
void TouchSession(Connection& conn,
                  const std::string& session_id,
                  AgentType agent_type,
                  const std::optional<std::string>& agent_context,
                  Timestamp now);

class SessionStore {
 public:
  explicit SessionStore(Database& db);

  Session Get(const std::string& session_id);
  std::vector<Session> List(bool active_only);
  Session Deactivate(const std::string& session_id);

 private:
  Database& db_;
};

}  // namespace mycelic
