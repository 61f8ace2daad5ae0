#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace arkive::storage::sqlite {

struct connection_deleter final {
  void operator()(sqlite3* handle) const;
};

using connection_ptr = std::unique_ptr<sqlite3, connection_deleter>;

// Prepared statement. Binding indexes are 1-based and column indexes are
// 0-based, as in SQLite. Failures raise `sqlite_error`.
class statement final {
 public:
  statement(sqlite3* database, sqlite3_stmt* handle);
  ~statement();

  statement(const statement&) = delete;
  statement& operator=(const statement&) = delete;
  statement(statement&& other) noexcept;
  statement& operator=(statement&& other) noexcept;

  statement& bind(int index, int64_t value);
  statement& bind(int index, bool value);
  statement& bind(int index, std::string_view value);
  statement& bind(int index, const std::string& value);
  statement& bind(int index, const char* value);
  statement& bind(int index, const std::optional<std::string>& value);
  statement& bind_null(int index);

  bool step();

  void run();

  void reset();

  int64_t column_int64(int index) const;
  bool column_bool(int index) const;
  std::string column_text(int index) const;
  std::optional<std::string> column_optional_text(int index) const;
  bool column_is_null(int index) const;

 private:
  sqlite3* database_{};
  sqlite3_stmt* handle_{};
};

class connection final {
 public:
  explicit connection(sqlite3* handle) : handle_{handle} {}

  statement prepare(std::string_view sql) const;

  void exec(const std::string& sql) const;

  int64_t last_insert_rowid() const;
  int changes() const;

  sqlite3* native_handle() const { return handle_; }

 private:
  sqlite3* handle_{};
};

enum class transaction_mode : uint8_t { deferred, immediate };

class transaction final {
 public:
  transaction(const connection& conn, transaction_mode mode);
  ~transaction();

  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;

  void commit();

 private:
  const connection& connection_;
  bool open_{};
};

[[noreturn]] void throw_sqlite_error(sqlite3* database,
                                     int result_code,
                                     std::string_view context);

}  // namespace arkive::storage::sqlite
