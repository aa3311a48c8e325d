#pragma once

#include "mycelic/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mycelic {

class Connection;
class Database;

// Finds the domain by case-insensitive name or creates it; returns the
// stored spelling of the name.
std::string EnsureDomain(Connection& conn, const std::string& name, Timestamp now);

class TaxonomyStore {
 public:
  explicit TaxonomyStore(Database& db);

  Category CreateCategory(const CreateCategoryRequest& request);
  Category GetCategory(const std::string& id);
  std::vector<Category> ListCategories(const CategoryFilter& filter);
  // Children keep existing with no parent.
  void DeleteCategory(const std::string& id);

  Categorization Categorize(const std::string& memory_id,
                            const std::string& category_id,
                            double confidence,
                            const std::optional<std::string>& reasoning);
  void Uncategorize(const std::string& memory_id, const std::string& category_id);
  std::vector<Categorization> CategoriesForMemory(const std::string& memory_id);
  std::vector<Memory> MemoriesInCategory(const std::string& category_id, int limit, int offset);

  // Idempotent by case-insensitive name.
  Domain CreateDomain(const std::string& name, const std::optional<std::string>& description);
  Domain GetDomain(const std::string& name_or_id);
  std::vector<Domain> ListDomains();
  void DeleteDomain(const std::string& name_or_id);

 private:
  Database& db_;
};

}  // namespace mycelic
