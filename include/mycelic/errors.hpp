#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mycelic {

enum class ErrorKind {
  kValidation,
  kNotFound,
  kConstraint,
  kDependencyUnavailable,
  kInternal,
};

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

class ValidationError final : public Error {
 public:
  explicit ValidationError(const std::string& message) : Error(ErrorKind::kValidation, message) {}
};

// entity is the kind of record ("memory", "source memory", "category", ...).
class NotFoundError final : public Error {
 public:
  NotFoundError(std::string entity, std::string id)
      : Error(ErrorKind::kNotFound, entity + " not found: " + id), entity_(std::move(entity)), id_(std::move(id)) {}

  [[nodiscard]] const std::string& entity() const noexcept { return entity_; }
  [[nodiscard]] const std::string& id() const noexcept { return id_; }

 private:
  std::string entity_;
  std::string id_;
};

class ConstraintError final : public Error {
 public:
  explicit ConstraintError(const std::string& message) : Error(ErrorKind::kConstraint, message) {}
};

class DependencyUnavailableError final : public Error {
 public:
  explicit DependencyUnavailableError(const std::string& message)
      : Error(ErrorKind::kDependencyUnavailable, message) {}
};

class InternalError final : public Error {
 public:
  InternalError(const std::string& message, int sqlite_code = 0)
      : Error(ErrorKind::kInternal, message), sqlite_code_(sqlite_code) {}

  [[nodiscard]] int sqlite_code() const noexcept { return sqlite_code_; }

 private:
  int sqlite_code_;
};

}  // namespace mycelic
