#include <arkive/common/error.hpp>
#include <arkive/storage/sqlite/schema.hpp>
#include <arkive/storage/sqlite/storage.hpp>

#include <spdlog/fmt/fmt.h>

#include <system_error>

namespace arkive::storage {

namespace {

sqlite::connection_ptr open_connection(const std::filesystem::path& path,
                                       const int flags) {
  auto* handle = static_cast<sqlite3*>(nullptr);
  const auto rc = sqlite3_open_v2(path.string().c_str(), &handle, flags,
                                  nullptr);
  auto database = sqlite::connection_ptr{handle};
  if (rc != SQLITE_OK) {
    sqlite::throw_sqlite_error(database.get(), rc,
                               "open " + path.string());
  }
  sqlite3_extended_result_codes(database.get(), 1);
  return database;
}

void apply_pragmas(const sqlite::connection& conn,
                   const storage_options& options) {
  conn.exec("PRAGMA journal_mode=WAL;");
  conn.exec(fmt::format(
      "PRAGMA synchronous=NORMAL;"
      "PRAGMA temp_store=MEMORY;"
      "PRAGMA cache_size=-{};"
      "PRAGMA foreign_keys=ON;"
      "PRAGMA wal_autocheckpoint={};",
      options.cache_size_kib, options.wal_autocheckpoint));
}

void initialize_schema(const sqlite::connection& conn) {
  auto tx = sqlite::transaction{conn, sqlite::transaction_mode::immediate};
  sqlite::apply_schema(conn);
  auto version = conn.prepare("PRAGMA user_version;");
  const auto current = version.step() ? version.column_int64(0) : int64_t{0};
  if (current == 0) {
    conn.exec(fmt::format("PRAGMA user_version={};", sqlite::kSchemaVersion));
  }
  tx.commit();
}

int64_t read_schema_version(const sqlite::connection& conn) {
  auto stmt = conn.prepare("PRAGMA schema_version;");
  return stmt.step() ? stmt.column_int64(0) : int64_t{0};
}

std::vector<std::string> query_strings(const std::filesystem::path& path,
                                       const std::string_view sql) {
  if (!std::filesystem::exists(path)) {
    throw arkive::common::not_found_error{"database not found: " +
                                          path.string()};
  }
  try {
    auto database = open_connection(path, SQLITE_OPEN_READONLY);
    auto conn = sqlite::connection{database.get()};
    auto stmt = conn.prepare(sql);
    auto rows = std::vector<std::string>{};
    while (stmt.step()) {
      rows.push_back(stmt.column_text(0));
    }
    return rows;
  } catch (const arkive::common::sqlite_error& ex) {
    throw arkive::common::validation_error{
        fmt::format("{} is not a readable database: {}", path.string(),
                    ex.what())};
  }
}

}  // namespace

template <>
storage<sqlite_storage_tag> make_storage<sqlite_storage_tag>(
    const std::filesystem::path& path,
    const storage_options& options) {
  auto store = storage<sqlite_storage_tag>{};
  store.path = path;
  store.options = options;

  const auto read_only = options.mode == open_mode::read_only;
  if (read_only) {
    if (!std::filesystem::exists(path)) {
      throw arkive::common::storage_init_error{"store does not exist: " +
                                               path.string()};
    }
  } else if (path.has_parent_path()) {
    auto ec = std::error_code{};
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      spdlog::error("Failed to create directory {}: {}",
                    path.parent_path().string(), ec.message());
      throw arkive::common::storage_init_error{
          "cannot create " + path.parent_path().string() + ": " +
          ec.message()};
    }
  }

  try {
    store.database = open_connection(
        path, read_only ? SQLITE_OPEN_READONLY
                        : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    sqlite3_busy_timeout(store.database.get(),
                         static_cast<int>(options.busy_timeout.count()));
    store.execute(
        [&](sqlite::connection& conn) {
          if (read_only) {
            // Forces a read of the header so a non-database fails here.
            read_schema_version(conn);
            return;
          }
          apply_pragmas(conn, options);
          initialize_schema(conn);
        },
        "initialize");
  } catch (const arkive::common::sqlite_error& ex) {
    spdlog::error("Failed to open SQLite store at {}: {}", path.string(),
                  ex.what());
    throw arkive::common::storage_init_error{
        "cannot open " + path.string() + ": " + ex.what()};
  }

  spdlog::info("Opened SQLite store at {}{}", path.string(),
               read_only ? " (read-only)" : "");
  return store;
}

int64_t storage<sqlite_storage_tag>::schema_version() const {
  return execute(
      [](sqlite::connection& conn) { return read_schema_version(conn); },
      "schema_version");
}

namespace sqlite {

void snapshot(const std::filesystem::path& source,
              const std::filesystem::path& destination,
              const retry_policy& retry) {
  if (!std::filesystem::exists(source)) {
    throw arkive::common::not_found_error{"store not found: " +
                                          source.string()};
  }
  retry.run(
      [&]() {
        auto ec = std::error_code{};
        std::filesystem::remove(destination, ec);
        auto from = open_connection(source, SQLITE_OPEN_READWRITE);
        auto to = open_connection(destination,
                                  SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        auto* backup =
            sqlite3_backup_init(to.get(), "main", from.get(), "main");
        if (backup == nullptr) {
          throw_sqlite_error(to.get(), sqlite3_extended_errcode(to.get()),
                             "backup init");
        }
        const auto step = sqlite3_backup_step(backup, -1);
        const auto finish = sqlite3_backup_finish(backup);
        if (step != SQLITE_DONE) {
          throw arkive::common::sqlite_error{
              step, std::string{"backup step: "} + sqlite3_errstr(step)};
        }
        if (finish != SQLITE_OK) {
          throw_sqlite_error(to.get(), finish, "backup finish");
        }
        // The copy is self-contained: no -wal or -shm companion files.
        auto conn = connection{to.get()};
        conn.exec("PRAGMA journal_mode=DELETE;");
      },
      "snapshot");
}

std::vector<std::string> integrity_check(const std::filesystem::path& path) {
  return query_strings(path, "PRAGMA integrity_check;");
}

std::vector<std::string> list_tables(const std::filesystem::path& path) {
  return query_strings(
      path, "SELECT name FROM sqlite_master WHERE type = 'table' ORDER BY name;");
}

std::vector<std::string> list_triggers(const std::filesystem::path& path) {
  return query_strings(
      path,
      "SELECT name FROM sqlite_master WHERE type = 'trigger' ORDER BY name;");
}

}  // namespace sqlite

}  // namespace arkive::storage
