#pragma once

#include "mycelic/types.hpp"

#include <string>
#include <vector>

namespace mycelic {

class Connection;
class MonotonicClock;

struct AppliedMigration {
  int version = 0;
  std::string name;
  Timestamp applied_at{};
};

// Applies every migration newer than the ledger's highest version, each in
// its own transaction together with its ledger row. conn must not be inside
// a transaction.
void ApplyMigrations(Connection& conn, MonotonicClock& clock);

[[nodiscard]] int LatestSchemaVersion();
int SchemaVersion(Connection& conn);
std::vector<AppliedMigration> AppliedMigrations(Connection& conn);

}  // namespace mycelic
