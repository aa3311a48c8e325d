#include "mycelic/sqlite_database.hpp"

#include "mycelic/errors.hpp"
#include "mycelic/logging.hpp"
#include "mycelic/schema.hpp"

#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "sqlite3.h"

namespace mycelic {
namespace {

std::shared_ptr<spdlog::logger> Log() {
  static const auto logger = GetLogger("database");
  return logger;
}

[[noreturn]] void ThrowSqlite(sqlite3* db, int rc, const std::string& what) {
  const std::string message = what + ": " + (db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    throw ConstraintError(message);
  }
  throw InternalError(message, rc);
}

}  // namespace

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    ThrowSqlite(db_, rc, "sqlite prepare failed");
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
    db_ = std::exchange(other.db_, nullptr);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

void Statement::BindText(int index, const std::string& value) {
  const int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    ThrowSqlite(db_, rc, "sqlite bind failed");
  }
}

void Statement::BindText(int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    BindText(index, *value);
  } else {
    BindNull(index);
  }
}

void Statement::BindInt64(int index, std::int64_t value) {
  const int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
  if (rc != SQLITE_OK) {
    ThrowSqlite(db_, rc, "sqlite bind failed");
  }
}

void Statement::BindDouble(int index, double value) {
  const int rc = sqlite3_bind_double(stmt_, index, value);
  if (rc != SQLITE_OK) {
    ThrowSqlite(db_, rc, "sqlite bind failed");
  }
}

void Statement::BindBlob(int index, const void* data, std::size_t size) {
  const int rc = sqlite3_bind_blob(stmt_, index, data, static_cast<int>(size), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    ThrowSqlite(db_, rc, "sqlite bind failed");
  }
}

void Statement::BindNull(int index) {
  const int rc = sqlite3_bind_null(stmt_, index);
  if (rc != SQLITE_OK) {
    ThrowSqlite(db_, rc, "sqlite bind failed");
  }
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  ThrowSqlite(db_, rc, "sqlite step failed");
}

void Statement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

bool Statement::ColumnIsNull(int index) const {
  return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

std::string Statement::ColumnText(int index) const {
  const auto* text = sqlite3_column_text(stmt_, index);
  if (text == nullptr) {
    return {};
  }
  const int size = sqlite3_column_bytes(stmt_, index);
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size));
}

std::optional<std::string> Statement::ColumnOptionalText(int index) const {
  if (ColumnIsNull(index)) {
    return std::nullopt;
  }
  return ColumnText(index);
}

std::int64_t Statement::ColumnInt64(int index) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

double Statement::ColumnDouble(int index) const {
  return sqlite3_column_double(stmt_, index);
}

std::vector<std::byte> Statement::ColumnBlob(int index) const {
  const void* data = sqlite3_column_blob(stmt_, index);
  const int size = sqlite3_column_bytes(stmt_, index);
  std::vector<std::byte> out(static_cast<std::size_t>(size));
  if (data != nullptr && size > 0) {
    std::memcpy(out.data(), data, out.size());
  }
  return out;
}

Connection::Connection(const std::filesystem::path& path, const DatabaseConfig& config) {
  const int rc = sqlite3_open_v2(path.string().c_str(),
                                 &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    const std::string message = std::string("sqlite open failed for ") + path.string() + ": " +
                                (db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw InternalError(message, rc);
  }
  try {
    sqlite3_busy_timeout(db_, static_cast<int>(config.busy_timeout.count()));
    sqlite3_extended_result_codes(db_, 1);
    Exec("PRAGMA foreign_keys=ON;");
    if (config.enable_wal) {
      Exec("PRAGMA journal_mode=WAL;");
    }
    Exec("PRAGMA synchronous=NORMAL;");
  } catch (const Error&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Connection::~Connection() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void Connection::Exec(const std::string& sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    throw ConstraintError(message);
  }
  throw InternalError(message, rc);
}

Statement Connection::Prepare(const std::string& sql) {
  return Statement(db_, sql);
}

std::int64_t Connection::Changes() const {
  return static_cast<std::int64_t>(sqlite3_changes(db_));
}

std::string JsonStringArray(const std::vector<std::string>& values) {
  try {
    return nlohmann::json(values).dump();
  } catch (const nlohmann::json::exception& ex) {
    throw ValidationError(std::string("text is not valid UTF-8: ") + ex.what());
  }
}

std::vector<std::string> ParseJsonStringArray(const std::optional<std::string>& text) {
  if (!text.has_value() || text->empty()) {
    return {};
  }
  try {
    return nlohmann::json::parse(*text).get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception& ex) {
    throw InternalError(std::string("stored value is not a JSON string array: ") + ex.what());
  }
}

// Returns the connection to the pool when the call finishes, however it ends.
class Database::Lease final {
 public:
  explicit Lease(Database& owner) : owner_(owner), conn_(owner.Acquire()) {}
  ~Lease() { owner_.Release(std::move(conn_)); }

  Lease(const Lease&) = delete;
  Lease& operator=(const Lease&) = delete;

  Connection& operator*() const { return *conn_; }

 private:
  Database& owner_;
  std::unique_ptr<Connection> conn_;
};

std::unique_ptr<Database> Database::Open(const DatabaseConfig& config) {
  if (config.path.empty()) {
    throw ValidationError("database path is required");
  }
  if (config.pool_size <= 0) {
    throw ValidationError("database pool size must be positive");
  }
  const auto parent = config.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec{};
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw InternalError("cannot create database directory " + parent.string() + ": " + ec.message());
    }
  }

  std::unique_ptr<Database> db(new Database(config));
  {
    // The first connection also applies pending migrations.
    Lease lease(*db);
    ApplyMigrations(*lease, db->clock_);
  }
  Log()->info("opened database {} (pool size {})", config.path.string(), config.pool_size);
  return db;
}

Database::Database(DatabaseConfig config) : config_(std::move(config)) {}

Database::~Database() {
  Close();
}

void Database::Close() {
  std::vector<std::unique_ptr<Connection>> to_close{};
  {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    to_close.swap(idle_);
    open_count_ -= static_cast<int>(to_close.size());
  }
  pool_cv_.notify_all();
  Log()->info("closed database {}", config_.path.string());
}

std::unique_ptr<Connection> Database::Acquire() {
  std::unique_lock<std::mutex> lock(pool_mutex_);
  pool_cv_.wait(lock, [this] { return closed_ || !idle_.empty() || open_count_ < config_.pool_size; });
  if (closed_) {
    throw InternalError("database is closed");
  }
  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return conn;
  }
  ++open_count_;
  const int opened = open_count_;
  lock.unlock();
  try {
    auto conn = std::make_unique<Connection>(config_.path, config_);
    Log()->debug("pool grew to {} connection(s)", opened);
    return conn;
  } catch (const Error&) {
    lock.lock();
    --open_count_;
    lock.unlock();
    pool_cv_.notify_one();
    throw;
  }
}

void Database::Release(std::unique_ptr<Connection> conn) {
  {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (closed_) {
      --open_count_;
      conn.reset();
    } else {
      idle_.push_back(std::move(conn));
    }
  }
  pool_cv_.notify_one();
}

void Database::RunRead(const std::function<void(Connection&)>& body) {
  for (int attempt = 0;; ++attempt) {
    Lease lease(*this);
    Connection& conn = *lease;
    conn.Exec("BEGIN DEFERRED;");
    try {
      body(conn);
      conn.Exec("COMMIT;");
      return;
    } catch (const InternalError& ex) {
      try {
        conn.Exec("ROLLBACK;");
      } catch (const Error& rollback_error) {
        Log()->warn("read rollback failed: {}", rollback_error.what());
      }
      if (attempt > 0) {
        throw;
      }
      Log()->debug("retrying read after storage error: {}", ex.what());
    } catch (const std::exception&) {
      try {
        conn.Exec("ROLLBACK;");
      } catch (const Error& rollback_error) {
        Log()->warn("read rollback failed: {}", rollback_error.what());
      }
      throw;
    }
  }
}

void Database::RunWrite(const std::function<void(Connection&)>& body) {
  Lease lease(*this);
  Connection& conn = *lease;
  conn.Exec("BEGIN IMMEDIATE;");
  try {
    body(conn);
    conn.Exec("COMMIT;");
  } catch (const std::exception&) {
    try {
      conn.Exec("ROLLBACK;");
    } catch (const Error& rollback_error) {
      Log()->warn("write rollback failed: {}", rollback_error.what());
    }
    throw;
  }
}

}  // namespace mycelic
