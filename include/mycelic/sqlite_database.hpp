#pragma once

#include "mycelic/clock.hpp"
#include "mycelic/config.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace mycelic {

class Statement final {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  void BindText(int index, const std::string& value);
  void BindText(int index, const std::optional<std::string>& value);
  void BindInt64(int index, std::int64_t value);
  void BindDouble(int index, double value);
  void BindBlob(int index, const void* data, std::size_t size);
  void BindNull(int index);

  // true when a row is available, false once the statement is done.
  bool Step();
  void Reset();

  [[nodiscard]] bool ColumnIsNull(int index) const;
  [[nodiscard]] std::string ColumnText(int index) const;
  [[nodiscard]] std::optional<std::string> ColumnOptionalText(int index) const;
  [[nodiscard]] std::int64_t ColumnInt64(int index) const;
  [[nodiscard]] double ColumnDouble(int index) const;
  [[nodiscard]] std::vector<std::byte> ColumnBlob(int index) const;

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

class Connection final {
 public:
  Connection(const std::filesystem::path& path, const DatabaseConfig& config);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  void Exec(const std::string& sql);
  Statement Prepare(const std::string& sql);
  [[nodiscard]] std::int64_t Changes() const;

 private:
  sqlite3* db_ = nullptr;
};

// Text for binding a string list to json_each(?): ["a","b\"c"].
std::string JsonStringArray(const std::vector<std::string>& values);

// Decodes a stored JSON string array; NULL yields an empty list.
std::vector<std::string> ParseJsonStringArray(const std::optional<std::string>& text);

// Pool of SQLite connections to one database file. Every Read/Write call
// leases a connection and wraps the callback in its own transaction.
class Database final {
 public:
  static std::unique_ptr<Database> Open(const DatabaseConfig& config);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Deferred transaction; retried once on InternalError.
  template <typename Fn>
  auto Read(Fn&& fn) {
    using Result = std::invoke_result_t<Fn&, Connection&>;
    if constexpr (std::is_void_v<Result>) {
      RunRead([&](Connection& conn) { fn(conn); });
    } else {
      std::optional<Result> out{};
      RunRead([&](Connection& conn) { out.emplace(fn(conn)); });
      return std::move(*out);
    }
  }

  // BEGIN IMMEDIATE; commits on return, rolls back and rethrows on exception.
  template <typename Fn>
  auto Write(Fn&& fn) {
    using Result = std::invoke_result_t<Fn&, Connection&>;
    if constexpr (std::is_void_v<Result>) {
      RunWrite([&](Connection& conn) { fn(conn); });
    } else {
      std::optional<Result> out{};
      RunWrite([&](Connection& conn) { out.emplace(fn(conn)); });
      return std::move(*out);
    }
  }

  MonotonicClock& clock() { return clock_; }
  const std::filesystem::path& path() const { return config_.path; }
  void Close();

 private:
  class Lease;

  explicit Database(DatabaseConfig config);

  void RunRead(const std::function<void(Connection&)>& body);
  void RunWrite(const std::function<void(Connection&)>& body);
  std::unique_ptr<Connection> Acquire();
  void Release(std::unique_ptr<Connection> conn);

  DatabaseConfig config_;
  MonotonicClock clock_{};
  std::mutex pool_mutex_{};
  std::condition_variable pool_cv_{};
  std::vector<std::unique_ptr<Connection>> idle_{};
  int open_count_ = 0;
  bool closed_ = false;
};

}  // namespace mycelic
