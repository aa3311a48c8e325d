#pragma once

#include "mycelic/types.hpp"

namespace mycelic {

class Database;

// Read-only rollups, recomputed from current rows on every call.
class StatsAggregator {
 public:
  explicit StatsAggregator(Database& db);

  StatsSnapshot Collect();

 private:
  Database& db_;
};

}  // namespace mycelic
