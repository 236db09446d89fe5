#include "mysql_store.h"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "platform_log.h"

#ifdef SENDKEY_ENABLE_MYSQL
#include <mysql.h>
#endif

namespace sendkey::server {

namespace {

#ifdef SENDKEY_ENABLE_MYSQL

namespace pl = sendkey::platform::log;

constexpr char kLogTag[] = "mysql";

// Owns one prepared statement and its stored result.
class Statement {
 public:
  explicit Statement(MYSQL* conn) : stmt_(mysql_stmt_init(conn)) {}
  ~Statement() {
    if (stmt_) {
      if (stored_) {
        mysql_stmt_free_result(stmt_);
      }
      mysql_stmt_close(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepare(const char* query, std::string& error) {
    if (!stmt_) {
      error = "mysql_stmt_init failed";
      return false;
    }
    if (mysql_stmt_prepare(stmt_, query, std::strlen(query)) != 0) {
      error = "mysql_stmt_prepare failed";
      return false;
    }
    return true;
  }

  bool Execute(MYSQL_BIND* params, std::string& error) {
    if (params && mysql_stmt_bind_param(stmt_, params) != 0) {
      error = "mysql_stmt_bind_param failed";
      return false;
    }
    if (mysql_stmt_execute(stmt_) != 0) {
      error = "mysql_stmt_execute failed";
      return false;
    }
    return true;
  }

  bool BindAndStore(MYSQL_BIND* result, std::string& error) {
    if (mysql_stmt_bind_result(stmt_, result) != 0) {
      error = "mysql_stmt_bind_result failed";
      return false;
    }
    if (mysql_stmt_store_result(stmt_) != 0) {
      error = "mysql_stmt_store_result failed";
      return false;
    }
    stored_ = true;
    return true;
  }

  // Returns false on error; out_row is false once the rows are exhausted.
  bool Fetch(bool& out_row, std::string& error) {
    out_row = false;
    const int status = mysql_stmt_fetch(stmt_);
    if (status == MYSQL_NO_DATA) {
      return true;
    }
    if (status != 0) {
      error = status == MYSQL_DATA_TRUNCATED ? "mysql column truncated"
                                             : "mysql_stmt_fetch failed";
      return false;
    }
    out_row = true;
    return true;
  }

  std::uint64_t AffectedRows() const {
    return static_cast<std::uint64_t>(mysql_stmt_affected_rows(stmt_));
  }

 private:
  MYSQL_STMT* stmt_{nullptr};
  bool stored_{false};
};

void BindBytes(MYSQL_BIND& b, const std::uint8_t* data, std::size_t len) {
  b.buffer_type = MYSQL_TYPE_BLOB;
  b.buffer = const_cast<std::uint8_t*>(data);
  b.buffer_length = static_cast<unsigned long>(len);
  b.length = &b.buffer_length;
}

void BindUuid(MYSQL_BIND& b, const Uuid& id) {
  BindBytes(b, id.bytes.data(), id.bytes.size());
}

void BindString(MYSQL_BIND& b, const std::string& s) {
  b.buffer_type = MYSQL_TYPE_STRING;
  b.buffer = const_cast<char*>(s.c_str());
  b.buffer_length = static_cast<unsigned long>(s.size());
  b.length = &b.buffer_length;
}

void BindLong(MYSQL_BIND& b, std::int32_t* v) {
  b.buffer_type = MYSQL_TYPE_LONG;
  b.buffer = v;
  b.is_unsigned = false;
}

void BindTiny(MYSQL_BIND& b, std::int8_t* v) {
  b.buffer_type = MYSQL_TYPE_TINY;
  b.buffer = v;
  b.is_unsigned = false;
}

void BindTime(MYSQL_BIND& b, MYSQL_TIME* t) {
  b.buffer_type = MYSQL_TYPE_DATETIME;
  b.buffer = t;
  b.buffer_length = sizeof(MYSQL_TIME);
}

MYSQL_TIME ToMysqlTime(Timestamp ts) {
  MYSQL_TIME out{};
  const std::time_t secs = static_cast<std::time_t>(ToUnixSeconds(ts));
  std::tm tm{};
  gmtime_r(&secs, &tm);
  out.year = static_cast<unsigned int>(tm.tm_year + 1900);
  out.month = static_cast<unsigned int>(tm.tm_mon + 1);
  out.day = static_cast<unsigned int>(tm.tm_mday);
  out.hour = static_cast<unsigned int>(tm.tm_hour);
  out.minute = static_cast<unsigned int>(tm.tm_min);
  out.second = static_cast<unsigned int>(tm.tm_sec);
  out.time_type = MYSQL_TIMESTAMP_DATETIME;
  return out;
}

Timestamp FromMysqlTime(const MYSQL_TIME& t) {
  std::tm tm{};
  tm.tm_year = static_cast<int>(t.year) - 1900;
  tm.tm_mon = static_cast<int>(t.month) - 1;
  tm.tm_mday = static_cast<int>(t.day);
  tm.tm_hour = static_cast<int>(t.hour);
  tm.tm_min = static_cast<int>(t.minute);
  tm.tm_sec = static_cast<int>(t.second);
  return FromUnixSeconds(static_cast<std::int64_t>(timegm(&tm)));
}

// Output buffers for one row of a result set.
struct BytesCol {
  explicit BytesCol(std::size_t cap) : buf(cap) {}
  void Bind(MYSQL_BIND& b) {
    b.buffer_type = MYSQL_TYPE_BLOB;
    b.buffer = buf.data();
    b.buffer_length = static_cast<unsigned long>(buf.size());
    b.length = &len;
  }
  std::string Str() const {
    return std::string(reinterpret_cast<const char*>(buf.data()), len);
  }
  std::vector<std::uint8_t> Bytes() const {
    return std::vector<std::uint8_t>(buf.begin(), buf.begin() + len);
  }
  bool ToUuid(Uuid& out) const {
    return Uuid::FromBytes(buf.data(), len, out);
  }

  std::vector<std::uint8_t> buf;
  unsigned long len{0};
};

constexpr std::size_t kTextCap = 1024;

struct EntryRow {
  BytesCol id{16};
  BytesCol name{kTextCap};
  BytesCol owner{16};
  BytesCol email{kTextCap};
  BytesCol nonce{kEntryNonceBytes};
  BytesCol value{kMaxStoredValueBytes};
  std::int32_t attempts{0};
  MYSQL_TIME created{};
  MYSQL_TIME expires{};
  MYSQL_BIND binds[9]{};

  MYSQL_BIND* Bind() {
    id.Bind(binds[0]);
    name.Bind(binds[1]);
    owner.Bind(binds[2]);
    email.Bind(binds[3]);
    nonce.Bind(binds[4]);
    value.Bind(binds[5]);
    BindLong(binds[6], &attempts);
    BindTime(binds[7], &created);
    BindTime(binds[8], &expires);
    return binds;
  }

  bool ToEntry(Entry& out, std::string& error) const {
    if (!id.ToUuid(out.id) || !owner.ToUuid(out.sent_by_user_id) ||
        nonce.len != kEntryNonceBytes) {
      error = "mysql entry row invalid";
      return false;
    }
    out.name = name.Str();
    out.sent_to_email = email.Str();
    std::memcpy(out.nonce.data(), nonce.buf.data(), kEntryNonceBytes);
    out.value = value.Bytes();
    out.invalid_attempts = attempts;
    out.created_at = FromMysqlTime(created);
    out.expires_at = FromMysqlTime(expires);
    return true;
  }
};

constexpr char kEntryColumns[] =
    "id, name, sentByUserId, sentToEmail, nonce, value, invalidAttempts, "
    "createdAtUtc, expiresAtUtc";

struct RefreshTokenRow {
  BytesCol id{16};
  BytesCol user{16};
  BytesCol token{kTextCap};
  MYSQL_TIME created{};
  MYSQL_TIME expires{};
  MYSQL_BIND binds[5]{};

  MYSQL_BIND* Bind() {
    id.Bind(binds[0]);
    user.Bind(binds[1]);
    token.Bind(binds[2]);
    BindTime(binds[3], &created);
    BindTime(binds[4], &expires);
    return binds;
  }

  bool ToToken(RefreshToken& out, std::string& error) const {
    if (!id.ToUuid(out.id) || !user.ToUuid(out.user_id)) {
      error = "mysql refresh token row invalid";
      return false;
    }
    out.token = token.Str();
    out.created_at = FromMysqlTime(created);
    out.expires_at = FromMysqlTime(expires);
    return true;
  }
};

struct UserRow {
  BytesCol id{16};
  BytesCol email{kTextCap};
  std::int8_t verified{0};
  BytesCol first{kTextCap};
  BytesCol last{kTextCap};
  BytesCol password{kTextCap};
  MYSQL_TIME created{};
  MYSQL_BIND binds[7]{};

  MYSQL_BIND* Bind() {
    id.Bind(binds[0]);
    email.Bind(binds[1]);
    BindTiny(binds[2], &verified);
    first.Bind(binds[3]);
    last.Bind(binds[4]);
    password.Bind(binds[5]);
    BindTime(binds[6], &created);
    return binds;
  }

  bool ToUser(User& out, std::string& error) const {
    if (!id.ToUuid(out.id)) {
      error = "mysql user row invalid";
      return false;
    }
    out.email = email.Str();
    out.email_verified = verified != 0;
    out.first_name = first.Str();
    out.last_name = last.Str();
    out.password = password.Str();
    out.created_at = FromMysqlTime(created);
    return true;
  }
};

constexpr char kUserColumns[] =
    "id, email, emailVerified+0, firstName, lastName, `password`, "
    "createdAtUtc";

class MysqlStore final : public Store {
 public:
  explicit MysqlStore(MYSQL* conn) : conn_(conn) {}

  ~MysqlStore() override {
    if (conn_) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
  }

  bool Find(const Uuid& id, std::optional<Entry>& out,
            std::string& error) override {
    error.clear();
    out.reset();
    const std::string query =
        std::string("SELECT ") + kEntryColumns + " FROM entries WHERE id=?";
    MYSQL_BIND params[1]{};
    BindUuid(params[0], id);
    std::vector<Entry> rows;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!QueryEntries(query.c_str(), params, rows, error)) {
      return false;
    }
    if (!rows.empty()) {
      out = std::move(rows.front());
    }
    return true;
  }

  bool FindByOwner(const Uuid& owner_id, std::vector<Entry>& out,
                   std::string& error) override {
    error.clear();
    const std::string query = std::string("SELECT ") + kEntryColumns +
                              " FROM entries WHERE sentByUserId=? "
                              "ORDER BY createdAtUtc";
    MYSQL_BIND params[1]{};
    BindUuid(params[0], owner_id);
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryEntries(query.c_str(), params, out, error);
  }

  bool FindExpired(Timestamp now, std::vector<Entry>& out,
                   std::string& error) override {
    error.clear();
    const std::string query = std::string("SELECT ") + kEntryColumns +
                              " FROM entries WHERE expiresAtUtc<=?";
    MYSQL_TIME now_time = ToMysqlTime(now);
    MYSQL_BIND params[1]{};
    BindTime(params[0], &now_time);
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryEntries(query.c_str(), params, out, error);
  }

  bool Create(const Entry& entry, std::string& error) override {
    error.clear();
    const char* query =
        "INSERT INTO entries (id, name, sentByUserId, sentToEmail, nonce, "
        "value, invalidAttempts, createdAtUtc, expiresAtUtc) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";
    std::int32_t attempts = entry.invalid_attempts;
    MYSQL_TIME created = ToMysqlTime(entry.created_at);
    MYSQL_TIME expires = ToMysqlTime(entry.expires_at);
    MYSQL_BIND params[9]{};
    BindUuid(params[0], entry.id);
    BindString(params[1], entry.name);
    BindUuid(params[2], entry.sent_by_user_id);
    BindString(params[3], entry.sent_to_email);
    BindBytes(params[4], entry.nonce.data(), entry.nonce.size());
    BindBytes(params[5], entry.value.data(), entry.value.size());
    BindLong(params[6], &attempts);
    BindTime(params[7], &created);
    BindTime(params[8], &expires);
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t affected = 0;
    return ExecLocked(query, params, affected, error);
  }

  bool Delete(const Uuid& id, std::string& error) override {
    error.clear();
    MYSQL_BIND params[1]{};
    BindUuid(params[0], id);
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t affected = 0;
    return ExecLocked("DELETE FROM entries WHERE id=?", params, affected,
                      error);
  }

  bool IncrementInvalidAttempts(const Uuid& id, bool& out_found,
                                std::int32_t& out_count,
                                std::string& error) override {
    error.clear();
    out_found = false;
    out_count = 0;
    MYSQL_BIND params[1]{};
    BindUuid(params[0], id);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!BeginLocked(error)) {
      return false;
    }
    std::uint64_t affected = 0;
    if (!ExecLocked(
            "UPDATE entries SET invalidAttempts=invalidAttempts+1 WHERE id=?",
            params, affected, error)) {
      RollbackLocked();
      return false;
    }
    if (affected == 0) {
      RollbackLocked();
      return true;
    }

    Statement stmt(conn_);
    if (!stmt.Prepare("SELECT invalidAttempts FROM entries WHERE id=?",
                      error) ||
        !stmt.Execute(params, error)) {
      RollbackLocked();
      return false;
    }
    std::int32_t count = 0;
    MYSQL_BIND result[1]{};
    BindLong(result[0], &count);
    bool row = false;
    if (!stmt.BindAndStore(result, error) || !stmt.Fetch(row, error)) {
      RollbackLocked();
      return false;
    }
    if (!row) {
      RollbackLocked();
      return true;
    }
    if (!CommitLocked(error)) {
      return false;
    }
    out_found = true;
    out_count = count;
    return true;
  }

  bool RecordClaim(const ClaimedEntry& claimed, bool& out_transitioned,
                   std::string& error) override {
    error.clear();
    const char* query =
        "INSERT INTO claimed_entries (entryId, name, sentByUserId, "
        "sentToEmail, claimedAtUtc) VALUES (?, ?, ?, ?, ?)";
    MYSQL_TIME claimed_at = ToMysqlTime(claimed.claimed_at);
    MYSQL_BIND params[5]{};
    BindUuid(params[0], claimed.entry_id);
    BindString(params[1], claimed.name);
    BindUuid(params[2], claimed.sent_by_user_id);
    BindString(params[3], claimed.sent_to_email);
    BindTime(params[4], &claimed_at);
    return Transition(claimed.entry_id, query, params, out_transitioned,
                      error);
  }

  bool RecordExpiry(const ExpiredEntry& expired, bool& out_transitioned,
                    std::string& error) override {
    error.clear();
    const char* query =
        "INSERT INTO expired_entries (entryId, name, sentByUserId, "
        "sentToEmail, tooManyAttempts, expiredAtUtc) "
        "VALUES (?, ?, ?, ?, ?, ?)";
    std::int8_t too_many = expired.too_many_attempts ? 1 : 0;
    MYSQL_TIME expired_at = ToMysqlTime(expired.expired_at);
    MYSQL_BIND params[6]{};
    BindUuid(params[0], expired.entry_id);
    BindString(params[1], expired.name);
    BindUuid(params[2], expired.sent_by_user_id);
    BindString(params[3], expired.sent_to_email);
    BindTiny(params[4], &too_many);
    BindTime(params[5], &expired_at);
    return Transition(expired.entry_id, query, params, out_transitioned,
                      error);
  }

  bool CreateRefreshToken(const RefreshToken& token,
                          std::string& error) override {
    error.clear();
    const char* query =
        "INSERT INTO refresh_tokens (id, userId, token, createdAtUtc, "
        "expiresAtUtc) VALUES (?, ?, ?, ?, ?)";
    MYSQL_TIME created = ToMysqlTime(token.created_at);
    MYSQL_TIME expires = ToMysqlTime(token.expires_at);
    MYSQL_BIND params[5]{};
    BindUuid(params[0], token.id);
    BindUuid(params[1], token.user_id);
    BindString(params[2], token.token);
    BindTime(params[3], &created);
    BindTime(params[4], &expires);
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t affected = 0;
    return ExecLocked(query, params, affected, error);
  }

  bool FindRefreshTokenByValueAndOwner(const std::string& value,
                                       const Uuid& owner_id,
                                       std::optional<RefreshToken>& out,
                                       std::string& error) override {
    error.clear();
    out.reset();
    const char* query =
        "SELECT id, userId, token, createdAtUtc, expiresAtUtc "
        "FROM refresh_tokens WHERE token=? AND userId=? LIMIT 1";
    MYSQL_BIND params[2]{};
    BindString(params[0], value);
    BindUuid(params[1], owner_id);

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(conn_);
    if (!stmt.Prepare(query, error) || !stmt.Execute(params, error)) {
      return false;
    }
    RefreshTokenRow row;
    bool has_row = false;
    if (!stmt.BindAndStore(row.Bind(), error) ||
        !stmt.Fetch(has_row, error)) {
      return false;
    }
    if (!has_row) {
      return true;
    }
    RefreshToken token;
    if (!row.ToToken(token, error)) {
      return false;
    }
    out = std::move(token);
    return true;
  }

  bool DeleteRefreshToken(const Uuid& id, std::string& error) override {
    error.clear();
    MYSQL_BIND params[1]{};
    BindUuid(params[0], id);
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t affected = 0;
    return ExecLocked("DELETE FROM refresh_tokens WHERE id=?", params,
                      affected, error);
  }

  bool FindUser(const Uuid& id, std::optional<User>& out,
                std::string& error) override {
    error.clear();
    const std::string query =
        std::string("SELECT ") + kUserColumns + " FROM users WHERE id=?";
    MYSQL_BIND params[1]{};
    BindUuid(params[0], id);
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryUser(query.c_str(), params, out, error);
  }

  bool FindUserByEmail(const std::string& email, std::optional<User>& out,
                       std::string& error) override {
    error.clear();
    const std::string query =
        std::string("SELECT ") + kUserColumns + " FROM users WHERE email=?";
    MYSQL_BIND params[1]{};
    BindString(params[0], email);
    std::lock_guard<std::mutex> lock(mutex_);
    return QueryUser(query.c_str(), params, out, error);
  }

  bool CreateUser(const User& user, std::string& error) override {
    error.clear();
    const char* query =
        "INSERT INTO users (id, email, emailVerified, firstName, lastName, "
        "`password`, createdAtUtc) VALUES (?, ?, ?, ?, ?, ?, ?)";
    std::int8_t verified = user.email_verified ? 1 : 0;
    MYSQL_TIME created = ToMysqlTime(user.created_at);
    MYSQL_BIND params[7]{};
    BindUuid(params[0], user.id);
    BindString(params[1], user.email);
    BindTiny(params[2], &verified);
    BindString(params[3], user.first_name);
    BindString(params[4], user.last_name);
    BindString(params[5], user.password);
    BindTime(params[6], &created);
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t affected = 0;
    return ExecLocked(query, params, affected, error);
  }

 private:
  bool ExecLocked(const char* query, MYSQL_BIND* params,
                  std::uint64_t& out_affected, std::string& error) {
    out_affected = 0;
    Statement stmt(conn_);
    if (!stmt.Prepare(query, error) || !stmt.Execute(params, error)) {
      return false;
    }
    out_affected = stmt.AffectedRows();
    return true;
  }

  bool QueryEntries(const char* query, MYSQL_BIND* params,
                    std::vector<Entry>& out, std::string& error) {
    out.clear();
    Statement stmt(conn_);
    if (!stmt.Prepare(query, error) || !stmt.Execute(params, error)) {
      return false;
    }
    EntryRow row;
    if (!stmt.BindAndStore(row.Bind(), error)) {
      return false;
    }
    while (true) {
      bool has_row = false;
      if (!stmt.Fetch(has_row, error)) {
        out.clear();
        return false;
      }
      if (!has_row) {
        return true;
      }
      Entry entry;
      if (!row.ToEntry(entry, error)) {
        out.clear();
        return false;
      }
      out.push_back(std::move(entry));
    }
  }

  bool QueryUser(const char* query, MYSQL_BIND* params,
                 std::optional<User>& out, std::string& error) {
    out.reset();
    Statement stmt(conn_);
    if (!stmt.Prepare(query, error) || !stmt.Execute(params, error)) {
      return false;
    }
    UserRow row;
    bool has_row = false;
    if (!stmt.BindAndStore(row.Bind(), error) ||
        !stmt.Fetch(has_row, error)) {
      return false;
    }
    if (!has_row) {
      return true;
    }
    User user;
    if (!row.ToUser(user, error)) {
      return false;
    }
    out = std::move(user);
    return true;
  }

  // Deletes the active row first; the projection is written only when that
  // delete removed a row, and both commit together.
  bool Transition(const Uuid& entry_id, const char* insert_query,
                  MYSQL_BIND* insert_params, bool& out_transitioned,
                  std::string& error) {
    out_transitioned = false;
    MYSQL_BIND id_param[1]{};
    BindUuid(id_param[0], entry_id);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!BeginLocked(error)) {
      return false;
    }
    std::uint64_t affected = 0;
    if (!ExecLocked("DELETE FROM entries WHERE id=?", id_param, affected,
                    error)) {
      RollbackLocked();
      return false;
    }
    if (affected == 0) {
      RollbackLocked();
      return true;
    }
    if (!ExecLocked(insert_query, insert_params, affected, error)) {
      RollbackLocked();
      return false;
    }
    if (!CommitLocked(error)) {
      return false;
    }
    out_transitioned = true;
    return true;
  }

  bool BeginLocked(std::string& error) {
    if (mysql_query(conn_, "START TRANSACTION") != 0) {
      error = "mysql begin failed";
      return false;
    }
    return true;
  }

  bool CommitLocked(std::string& error) {
    if (mysql_commit(conn_) != 0) {
      error = "mysql commit failed";
      RollbackLocked();
      return false;
    }
    return true;
  }

  void RollbackLocked() {
    if (mysql_rollback(conn_) != 0) {
      pl::Log(pl::Level::kWarn, kLogTag, "rollback failed",
              {{"error", mysql_error(conn_)}});
    }
  }

  MYSQL* conn_{nullptr};
  std::mutex mutex_;
};

MYSQL* ConnectMysql(const MySqlConfig& cfg, std::string& error) {
  error.clear();
  constexpr int kMaxAttempts = 2;
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
      error = "mysql_init failed";
      return nullptr;
    }
    unsigned int timeout = 5;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &timeout);
    MYSQL* res = mysql_real_connect(conn, cfg.host.c_str(),
                                    cfg.username.c_str(),
                                    cfg.password.c_str(),
                                    cfg.database.c_str(), cfg.port, nullptr, 0);
    if (res) {
      return conn;
    }
    error = "mysql_connect failed";
    mysql_close(conn);
    if (attempt + 1 < kMaxAttempts) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  }
  return nullptr;
}

bool EnsureSchema(MYSQL* conn, std::string& error) {
  error.clear();
  const char* const statements[] = {
      "CREATE TABLE IF NOT EXISTS users ("
      "id BINARY(16) NOT NULL,"
      "email VARCHAR(100) NOT NULL,"
      "emailVerified BIT NOT NULL,"
      "firstName VARCHAR(100) NOT NULL,"
      "lastName VARCHAR(100) NOT NULL,"
      "`password` VARCHAR(255) NOT NULL,"
      "createdAtUtc DATETIME NOT NULL,"
      "PRIMARY KEY (id),"
      "UNIQUE (email)"
      ") ENGINE=InnoDB",

      "CREATE TABLE IF NOT EXISTS entries ("
      "id BINARY(16) NOT NULL,"
      "`name` VARCHAR(100) NOT NULL,"
      "sentByUserId BINARY(16) NOT NULL,"
      "sentToEmail VARCHAR(100) NOT NULL,"
      "nonce BINARY(12) NOT NULL,"
      "`value` VARBINARY(2500) NOT NULL,"
      "invalidAttempts INT NOT NULL,"
      "createdAtUtc DATETIME NOT NULL,"
      "expiresAtUtc DATETIME NOT NULL,"
      "PRIMARY KEY (id),"
      "INDEX (expiresAtUtc),"
      "FOREIGN KEY (sentByUserId) REFERENCES users(id) ON DELETE CASCADE"
      ") ENGINE=InnoDB",

      "CREATE TABLE IF NOT EXISTS claimed_entries ("
      "entryId BINARY(16) NOT NULL,"
      "`name` VARCHAR(100) NOT NULL,"
      "sentByUserId BINARY(16) NOT NULL,"
      "sentToEmail VARCHAR(100) NOT NULL,"
      "claimedAtUtc DATETIME NOT NULL,"
      "PRIMARY KEY (entryId),"
      "FOREIGN KEY (sentByUserId) REFERENCES users(id) ON DELETE CASCADE"
      ") ENGINE=InnoDB",

      "CREATE TABLE IF NOT EXISTS expired_entries ("
      "entryId BINARY(16) NOT NULL,"
      "`name` VARCHAR(100) NOT NULL,"
      "sentByUserId BINARY(16) NOT NULL,"
      "sentToEmail VARCHAR(100) NOT NULL,"
      "tooManyAttempts BIT NOT NULL,"
      "expiredAtUtc DATETIME NOT NULL,"
      "PRIMARY KEY (entryId),"
      "FOREIGN KEY (sentByUserId) REFERENCES users(id) ON DELETE CASCADE"
      ") ENGINE=InnoDB",

      "CREATE TABLE IF NOT EXISTS refresh_tokens ("
      "id BINARY(16) NOT NULL,"
      "userId BINARY(16) NOT NULL,"
      "token VARCHAR(50) NOT NULL,"
      "createdAtUtc DATETIME NOT NULL,"
      "expiresAtUtc DATETIME NOT NULL,"
      "PRIMARY KEY (id),"
      "INDEX (token),"
      "FOREIGN KEY (userId) REFERENCES users(id) ON DELETE CASCADE"
      ") ENGINE=InnoDB",
  };
  for (const char* query : statements) {
    if (mysql_query(conn, query) != 0) {
      error = "mysql schema create failed";
      return false;
    }
  }
  return true;
}

#endif  // SENDKEY_ENABLE_MYSQL

}  // namespace

std::unique_ptr<Store> CreateMysqlStore(const MySqlConfig& cfg,
                                        std::string& error) {
#ifdef SENDKEY_ENABLE_MYSQL
  MYSQL* conn = ConnectMysql(cfg, error);
  if (!conn) {
    return nullptr;
  }
  if (!EnsureSchema(conn, error)) {
    mysql_close(conn);
    return nullptr;
  }
  return std::make_unique<MysqlStore>(conn);
#else
  (void)cfg;
  error = "mysql backend disabled";
  return nullptr;
#endif
}

}  // namespace sendkey::server
