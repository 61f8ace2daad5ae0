#include <arkive/common/critical.hpp>
#include <arkive/common/error.hpp>
#include <arkive/storage/sqlite/connection.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace arkive::storage::sqlite {

void connection_deleter::operator()(sqlite3* handle) const {
  if (handle == nullptr) {
    return;
  }
  if (sqlite3_close_v2(handle) != SQLITE_OK) {
    spdlog::error("Failed to close SQLite handle: {}", sqlite3_errmsg(handle));
  }
}

void throw_sqlite_error(sqlite3* database,
                        const int result_code,
                        const std::string_view context) {
  auto message = std::string{context};
  message += ": ";
  message += database != nullptr ? sqlite3_errmsg(database)
                                 : sqlite3_errstr(result_code);
  throw arkive::common::sqlite_error{result_code, message};
}

statement::statement(sqlite3* database, sqlite3_stmt* handle)
    : database_{database}, handle_{handle} {}

statement::~statement() {
  if (handle_ != nullptr) {
    sqlite3_finalize(handle_);
  }
}

statement::statement(statement&& other) noexcept
    : database_{std::exchange(other.database_, nullptr)},
      handle_{std::exchange(other.handle_, nullptr)} {}

statement& statement::operator=(statement&& other) noexcept {
  if (this != &other) {
    if (handle_ != nullptr) {
      sqlite3_finalize(handle_);
    }
    database_ = std::exchange(other.database_, nullptr);
    handle_ = std::exchange(other.handle_, nullptr);
  }
  return *this;
}

statement& statement::bind(const int index, const int64_t value) {
  const auto rc = sqlite3_bind_int64(handle_, index, value);
  if (rc != SQLITE_OK) {
    throw_sqlite_error(database_, rc, "bind");
  }
  return *this;
}

statement& statement::bind(const int index, const bool value) {
  return bind(index, static_cast<int64_t>(value ? 1 : 0));
}

statement& statement::bind(const int index, const std::string_view value) {
  const auto rc = sqlite3_bind_text(handle_, index, value.data(),
                                    static_cast<int>(value.size()),
                                    SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    throw_sqlite_error(database_, rc, "bind");
  }
  return *this;
}

statement& statement::bind(const int index, const std::string& value) {
  return bind(index, std::string_view{value});
}

statement& statement::bind(const int index, const char* value) {
  return bind(index, std::string_view{value});
}

statement& statement::bind(const int index,
                           const std::optional<std::string>& value) {
  if (!value.has_value()) {
    return bind_null(index);
  }
  return bind(index, std::string_view{*value});
}

statement& statement::bind_null(const int index) {
  const auto rc = sqlite3_bind_null(handle_, index);
  if (rc != SQLITE_OK) {
    throw_sqlite_error(database_, rc, "bind");
  }
  return *this;
}

bool statement::step() {
  const auto rc = sqlite3_step(handle_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw_sqlite_error(database_, rc, "step");
}

void statement::run() {
  while (step()) {
  }
}

void statement::reset() {
  sqlite3_reset(handle_);
  sqlite3_clear_bindings(handle_);
}

int64_t statement::column_int64(const int index) const {
  return sqlite3_column_int64(handle_, index);
}

bool statement::column_bool(const int index) const {
  return sqlite3_column_int64(handle_, index) != 0;
}

std::string statement::column_text(const int index) const {
  const auto* text = sqlite3_column_text(handle_, index);
  if (text == nullptr) {
    return {};
  }
  return std::string{reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(
                         sqlite3_column_bytes(handle_, index))};
}

std::optional<std::string> statement::column_optional_text(
    const int index) const {
  if (column_is_null(index)) {
    return std::nullopt;
  }
  return column_text(index);
}

bool statement::column_is_null(const int index) const {
  return sqlite3_column_type(handle_, index) == SQLITE_NULL;
}

statement connection::prepare(const std::string_view sql) const {
  auto* handle = static_cast<sqlite3_stmt*>(nullptr);
  const auto rc = sqlite3_prepare_v2(handle_, sql.data(),
                                     static_cast<int>(sql.size()), &handle,
                                     nullptr);
  if (rc != SQLITE_OK) {
    if (handle != nullptr) {
      sqlite3_finalize(handle);
    }
    throw_sqlite_error(handle_, rc, "prepare");
  }
  return statement{handle_, handle};
}

void connection::exec(const std::string& sql) const {
  auto* raw_error = static_cast<char*>(nullptr);
  const auto rc =
      sqlite3_exec(handle_, sql.c_str(), nullptr, nullptr, &raw_error);
  if (rc != SQLITE_OK) {
    auto message = std::string{"exec: "};
    message += raw_error != nullptr ? raw_error : sqlite3_errstr(rc);
    sqlite3_free(raw_error);
    throw arkive::common::sqlite_error{rc, message};
  }
}

int64_t connection::last_insert_rowid() const {
  return sqlite3_last_insert_rowid(handle_);
}

int connection::changes() const {
  return sqlite3_changes(handle_);
}

transaction::transaction(const connection& conn, const transaction_mode mode)
    : connection_{conn} {
  connection_.exec(mode == transaction_mode::immediate ? "BEGIN IMMEDIATE;"
                                                       : "BEGIN DEFERRED;");
  open_ = true;
}

transaction::~transaction() {
  if (!open_) {
    return;
  }
  if (sqlite3_get_autocommit(connection_.native_handle()) != 0) {
    // SQLite already rolled the transaction back (for example on SQLITE_FULL).
    return;
  }
  auto* raw_error = static_cast<char*>(nullptr);
  const auto rc = sqlite3_exec(connection_.native_handle(), "ROLLBACK;",
                               nullptr, nullptr, &raw_error);
  if (rc != SQLITE_OK) {
    spdlog::error("ROLLBACK failed: {}",
                  raw_error != nullptr ? raw_error : sqlite3_errstr(rc));
    sqlite3_free(raw_error);
    arkive::common::critical("transaction left open after failed rollback");
  }
}

void transaction::commit() {
  connection_.exec("COMMIT;");
  open_ = false;
}

}  // namespace arkive::storage::sqlite
