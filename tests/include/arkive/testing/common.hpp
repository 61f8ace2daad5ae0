#pragma once

#include <arkive/schema/primitives.hpp>
#include <arkive/storage/sqlite/connection.hpp>
#include <arkive/storage/sqlite/storage.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace arkive::testing {

using storage_t = arkive::storage::sqlite_storage_t;

inline std::filesystem::path make_temp_dir(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter.fetch_add(1)));
  std::filesystem::create_directories(path);
  return path;
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline void write_file(const std::filesystem::path& path,
                       const std::string_view content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{in},
                     std::istreambuf_iterator<char>{}};
}

inline arkive::storage::storage_options fast_options() {
  auto options = arkive::storage::storage_options{};
  options.busy_timeout = std::chrono::milliseconds{2000};
  options.retry.backoff_step = std::chrono::milliseconds{5};
  return options;
}

// Run `sql` on a private connection, bypassing the storage object. Used to
// simulate out-of-band tampering.
inline void raw_exec(const std::filesystem::path& database,
                     const std::string& sql) {
  auto* handle = static_cast<sqlite3*>(nullptr);
  const auto rc = sqlite3_open_v2(database.string().c_str(), &handle,
                                  SQLITE_OPEN_READWRITE, nullptr);
  auto owned = arkive::storage::sqlite::connection_ptr{handle};
  if (rc != SQLITE_OK) {
    arkive::storage::sqlite::throw_sqlite_error(owned.get(), rc, "open");
  }
  sqlite3_busy_timeout(owned.get(), 2000);
  arkive::storage::sqlite::connection{owned.get()}.exec(sql);
}

// Sets an environment variable for the lifetime of the object, then puts the
// previous value back.
class scoped_env final {
 public:
  scoped_env(const char* name, const char* value) : name_{name} {
    if (const auto* previous = std::getenv(name)) {
      previous_ = previous;
    }
    ::setenv(name, value, 1);
  }
  scoped_env(const scoped_env&) = delete;
  scoped_env& operator=(const scoped_env&) = delete;
  ~scoped_env() {
    if (previous_) {
      ::setenv(name_, previous_->c_str(), 1);
    } else {
      ::unsetenv(name_);
    }
  }

 private:
  const char* name_;
  std::optional<std::string> previous_;
};

// Fresh store under a temporary directory, removed on destruction.
class store_fixture final {
 public:
  explicit store_fixture(
      const std::string_view prefix,
      const arkive::storage::storage_options& options = fast_options())
      : root_{make_temp_dir(prefix)},
        store_{arkive::storage::make_storage<
            arkive::storage::sqlite_storage_tag>(db_path(), options)} {}

  store_fixture(const store_fixture&) = delete;
  store_fixture& operator=(const store_fixture&) = delete;

  ~store_fixture() {
    store_.reset();
    remove_path(root_);
  }

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path db_path() const { return root_ / "arkive.db"; }
  std::filesystem::path files_root() const { return root_ / "files"; }

  storage_t& storage() { return *store_; }
  const storage_t& storage() const { return *store_; }

  void close() { store_.reset(); }

  void reopen(const arkive::storage::storage_options& options = fast_options()) {
    store_.reset();
    store_.emplace(
        arkive::storage::make_storage<arkive::storage::sqlite_storage_tag>(
            db_path(), options));
  }

 private:
  std::filesystem::path root_;
  std::optional<storage_t> store_;
};

}  // namespace arkive::testing
