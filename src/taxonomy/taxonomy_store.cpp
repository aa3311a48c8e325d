#include "mycelic/taxonomy_store.hpp"

#include "mycelic/clock.hpp"
#include "mycelic/errors.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/memory_store.hpp"
#include "mycelic/sqlite_database.hpp"
#include "mycelic/text.hpp"

#include <string_view>
#include <utility>

namespace mycelic {
namespace {

constexpr const char* kCategoryColumns =
    "id, name, description, parent_category_id, confidence_threshold, auto_generated, created_at";
constexpr const char* kCategorizationColumns = "memory_id, category_id, confidence, reasoning, created_at";
constexpr const char* kDomainColumns = "id, name, description, created_at, updated_at";

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("taxonomy");
  return logger;
}

void ValidateUnitInterval(double value, const char* field) {
  if (!(value >= 0.0 && value <= 1.0)) {
    throw ValidationError(std::string(field) + " must be within [0, 1]");
  }
}

Category ReadCategory(const Statement& stmt) {
  return Category{
      .id = stmt.ColumnText(0),
      .name = stmt.ColumnText(1),
      .description = stmt.ColumnText(2),
      .parent_category_id = stmt.ColumnOptionalText(3),
      .confidence_threshold = stmt.ColumnDouble(4),
      .auto_generated = stmt.ColumnInt64(5) != 0,
      .created_at = ParseTimestamp(stmt.ColumnText(6)),
  };
}

Categorization ReadCategorization(const Statement& stmt) {
  return Categorization{
      .memory_id = stmt.ColumnText(0),
      .category_id = stmt.ColumnText(1),
      .confidence = stmt.ColumnDouble(2),
      .reasoning = stmt.ColumnOptionalText(3),
      .created_at = ParseTimestamp(stmt.ColumnText(4)),
  };
}

Domain ReadDomain(const Statement& stmt) {
  return Domain{
      .id = stmt.ColumnText(0),
      .name = stmt.ColumnText(1),
      .description = stmt.ColumnOptionalText(2),
      .created_at = ParseTimestamp(stmt.ColumnText(3)),
      .updated_at = ParseTimestamp(stmt.ColumnText(4)),
  };
}

std::optional<Category> LoadCategory(Connection& conn, const std::string& id) {
  auto stmt = conn.Prepare(std::string("SELECT ") + kCategoryColumns + " FROM categories WHERE id = ?1;");
  stmt.BindText(1, id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadCategory(stmt);
}

std::optional<Domain> LoadDomain(Connection& conn, const std::string& name_or_id) {
  auto stmt =
      conn.Prepare(std::string("SELECT ") + kDomainColumns + " FROM domains WHERE id = ?1 OR name = ?1 LIMIT 1;");
  stmt.BindText(1, name_or_id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadDomain(stmt);
}

Domain InsertDomain(Connection& conn, const std::string& name, const std::optional<std::string>& description,
                    Timestamp now) {
  Domain domain{
      .id = NewId(),
      .name = name,
      .description = description,
      .created_at = now,
      .updated_at = now,
  };
  auto stmt = conn.Prepare(
      "INSERT INTO domains(id, name, description, created_at, updated_at) VALUES(?1, ?2, ?3, ?4, ?4);");
  stmt.BindText(1, domain.id);
  stmt.BindText(2, domain.name);
  stmt.BindText(3, domain.description);
  stmt.BindText(4, FormatTimestamp(now));
  stmt.Step();
  Log()->debug("created domain {}", domain.name);
  return domain;
}

}  // namespace

std::string EnsureDomain(Connection& conn, const std::string& name, Timestamp now) {
  auto lookup = conn.Prepare("SELECT name FROM domains WHERE name = ?1;");
  lookup.BindText(1, name);
  if (lookup.Step()) {
    return lookup.ColumnText(0);
  }
  return InsertDomain(conn, name, std::nullopt, now).name;
}

TaxonomyStore::TaxonomyStore(Database& db) : db_(db) {}

Category TaxonomyStore::CreateCategory(const CreateCategoryRequest& request) {
  auto name = Trim(request.name);
  if (name.empty()) {
    throw ValidationError("category name must not be empty");
  }
  const double threshold = request.confidence_threshold.value_or(kDefaultConfidenceThreshold);
  ValidateUnitInterval(threshold, "confidence threshold");

  try {
    return db_.Write([&](Connection& conn) {
      if (request.parent_category_id.has_value() && !LoadCategory(conn, *request.parent_category_id).has_value()) {
        throw NotFoundError("parent category", *request.parent_category_id);
      }
      Category category{
          .id = NewId(),
          .name = name,
          .description = request.description,
          .parent_category_id = request.parent_category_id,
          .confidence_threshold = threshold,
          .auto_generated = request.auto_generated,
          .created_at = db_.clock().Now(),
      };
      auto stmt = conn.Prepare(
          "INSERT INTO categories(id, name, description, parent_category_id, confidence_threshold, auto_generated, "
          "created_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7);");
      stmt.BindText(1, category.id);
      stmt.BindText(2, category.name);
      stmt.BindText(3, category.description);
      stmt.BindText(4, category.parent_category_id);
      stmt.BindDouble(5, category.confidence_threshold);
      stmt.BindInt64(6, category.auto_generated ? 1 : 0);
      stmt.BindText(7, FormatTimestamp(category.created_at));
      stmt.Step();
      return category;
    });
  } catch (const ConstraintError& ex) {
    if (std::string_view(ex.what()).find("categories.name") != std::string_view::npos) {
      throw ConstraintError("category name already exists: " + name);
    }
    throw;
  }
}

Category TaxonomyStore::GetCategory(const std::string& id) {
  auto category = db_.Read([&](Connection& conn) { return LoadCategory(conn, id); });
  if (!category.has_value()) {
    throw NotFoundError("category", id);
  }
  return std::move(*category);
}

std::vector<Category> TaxonomyStore::ListCategories(const CategoryFilter& filter) {
  if (filter.roots_only && filter.parent_category_id.has_value()) {
    throw ValidationError("roots_only and parent_category_id are mutually exclusive");
  }
  return db_.Read([&](Connection& conn) {
    auto stmt = conn.Prepare(std::string("SELECT ") + kCategoryColumns +
                             " FROM categories "
                             "WHERE (?1 IS NULL OR parent_category_id = ?1) "
                             "AND (?2 = 0 OR parent_category_id IS NULL) "
                             "AND (?3 IS NULL OR auto_generated = ?3) "
                             "ORDER BY name ASC;");
    stmt.BindText(1, filter.parent_category_id);
    stmt.BindInt64(2, filter.roots_only ? 1 : 0);
    if (filter.auto_generated.has_value()) {
      stmt.BindInt64(3, *filter.auto_generated ? 1 : 0);
    } else {
      stmt.BindNull(3);
    }
    std::vector<Category> out{};
    while (stmt.Step()) {
      out.push_back(ReadCategory(stmt));
    }
    return out;
  });
}

void TaxonomyStore::DeleteCategory(const std::string& id) {
  db_.Write([&](Connection& conn) {
    auto stmt = conn.Prepare("DELETE FROM categories WHERE id = ?1;");
    stmt.BindText(1, id);
    stmt.Step();
    if (conn.Changes() == 0) {
      throw NotFoundError("category", id);
    }
  });
}

Categorization TaxonomyStore::Categorize(const std::string& memory_id,
                                         const std::string& category_id,
                                         double confidence,
                                         const std::optional<std::string>& reasoning) {
  ValidateUnitInterval(confidence, "confidence");
  return db_.Write([&](Connection& conn) {
    if (!MemoryExists(conn, memory_id)) {
      throw NotFoundError("memory", memory_id);
    }
    if (!LoadCategory(conn, category_id).has_value()) {
      throw NotFoundError("category", category_id);
    }
    auto upsert = conn.Prepare(
        "INSERT INTO memory_categorizations(memory_id, category_id, confidence, reasoning, created_at) "
        "VALUES(?1, ?2, ?3, ?4, ?5) "
        "ON CONFLICT(memory_id, category_id) DO UPDATE SET confidence = excluded.confidence, "
        "reasoning = excluded.reasoning;");
    upsert.BindText(1, memory_id);
    upsert.BindText(2, category_id);
    upsert.BindDouble(3, confidence);
    upsert.BindText(4, reasoning);
    upsert.BindText(5, FormatTimestamp(db_.clock().Now()));
    upsert.Step();

    auto read = conn.Prepare(std::string("SELECT ") + kCategorizationColumns +
                             " FROM memory_categorizations WHERE memory_id = ?1 AND category_id = ?2;");
    read.BindText(1, memory_id);
    read.BindText(2, category_id);
    if (!read.Step()) {
      throw InternalError("categorization vanished after upsert");
    }
    return ReadCategorization(read);
  });
}

void TaxonomyStore::Uncategorize(const std::string& memory_id, const std::string& category_id) {
  db_.Write([&](Connection& conn) {
    auto stmt = conn.Prepare("DELETE FROM memory_categorizations WHERE memory_id = ?1 AND category_id = ?2;");
    stmt.BindText(1, memory_id);
    stmt.BindText(2, category_id);
    stmt.Step();
    if (conn.Changes() == 0) {
      throw NotFoundError("categorization", memory_id + "/" + category_id);
    }
  });
}

std::vector<Categorization> TaxonomyStore::CategoriesForMemory(const std::string& memory_id) {
  return db_.Read([&](Connection& conn) {
    if (!MemoryExists(conn, memory_id)) {
      throw NotFoundError("memory", memory_id);
    }
    auto stmt = conn.Prepare(std::string("SELECT ") + kCategorizationColumns +
                             " FROM memory_categorizations WHERE memory_id = ?1 "
                             "ORDER BY confidence DESC, category_id ASC;");
    stmt.BindText(1, memory_id);
    std::vector<Categorization> out{};
    while (stmt.Step()) {
      out.push_back(ReadCategorization(stmt));
    }
    return out;
  });
}

std::vector<Memory> TaxonomyStore::MemoriesInCategory(const std::string& category_id, int limit, int offset) {
  if (limit <= 0 || offset < 0) {
    throw ValidationError("limit must be positive and offset not negative");
  }
  return db_.Read([&](Connection& conn) {
    if (!LoadCategory(conn, category_id).has_value()) {
      throw NotFoundError("category", category_id);
    }
    auto stmt = conn.Prepare(std::string("SELECT ") + kMemoryColumns +
                             " FROM memory_categorizations mc JOIN memories m ON m.id = mc.memory_id "
                             "WHERE mc.category_id = ?1 "
                             "ORDER BY mc.confidence DESC, m.created_at DESC, m.id ASC LIMIT ?2 OFFSET ?3;");
    stmt.BindText(1, category_id);
    stmt.BindInt64(2, limit);
    stmt.BindInt64(3, offset);
    std::vector<Memory> out{};
    while (stmt.Step()) {
      out.push_back(ReadMemoryRow(stmt));
    }
    return out;
  });
}

Domain TaxonomyStore::CreateDomain(const std::string& name, const std::optional<std::string>& description) {
  const auto trimmed = Trim(name);
  if (trimmed.empty()) {
    throw ValidationError("domain name must not be empty");
  }
  return db_.Write([&](Connection& conn) {
    auto lookup = conn.Prepare(std::string("SELECT ") + kDomainColumns + " FROM domains WHERE name = ?1;");
    lookup.BindText(1, trimmed);
    if (lookup.Step()) {
      return ReadDomain(lookup);
    }
    return InsertDomain(conn, trimmed, description, db_.clock().Now());
  });
}

Domain TaxonomyStore::GetDomain(const std::string& name_or_id) {
  auto domain = db_.Read([&](Connection& conn) { return LoadDomain(conn, name_or_id); });
  if (!domain.has_value()) {
    throw NotFoundError("domain", name_or_id);
  }
  return std::move(*domain);
}

std::vector<Domain> TaxonomyStore::ListDomains() {
  return db_.Read([&](Connection& conn) {
    auto stmt = conn.Prepare(std::string("SELECT ") + kDomainColumns + " FROM domains ORDER BY name ASC;");
    std::vector<Domain> out{};
    while (stmt.Step()) {
      out.push_back(ReadDomain(stmt));
    }
    return out;
  });
}

void TaxonomyStore::DeleteDomain(const std::string& name_or_id) {
  db_.Write([&](Connection& conn) {
    auto stmt = conn.Prepare("DELETE FROM domains WHERE id = ?1 OR name = ?1;");
    stmt.BindText(1, name_or_id);
    stmt.Step();
    if (conn.Changes() == 0) {
      throw NotFoundError("domain", name_or_id);
    }
  });
}

}  // namespace mycelic
