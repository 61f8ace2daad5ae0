#pragma once
#include <spdlog/spdlog.h>
#include <arkive/common/critical.hpp>
#include <arkive/storage/sqlite/connection.hpp>
#include <arkive/storage/storage.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arkive::storage {

struct sqlite_storage_tag {};

template <>
struct storage<sqlite_storage_tag> final {
  sqlite::connection_ptr database;
  std::unique_ptr<std::mutex> mutex{std::make_unique<std::mutex>()};
  std::filesystem::path path;
  storage_options options;

  template <typename Operation>
  auto execute(Operation&& operation, std::string_view what) const
      -> decltype(operation(std::declval<sqlite::connection&>()));

  int64_t schema_version() const;
  const std::filesystem::path& location() const { return path; }
};

using sqlite_storage_t = storage<sqlite_storage_tag>;

template <>
storage<sqlite_storage_tag> make_storage<sqlite_storage_tag>(
    const std::filesystem::path& path,
    const storage_options& options);

template <typename Operation>
auto storage<sqlite_storage_tag>::execute(Operation&& operation,
                                          const std::string_view what) const
    -> decltype(operation(std::declval<sqlite::connection&>())) {
  if (!database || !mutex) {
    arkive::common::critical("SQLite database is not initialized");
  }
  return options.retry.run(
      [&]() {
        auto lock = std::scoped_lock{*mutex};
        auto conn = sqlite::connection{database.get()};
        return operation(conn);
      },
      what);
}

namespace sqlite {

// Consistent copy of the store at `source` into `destination` through the
// online backup API. The copy is taken under one read transaction, so WAL
// writers on the source keep going while it runs.
void snapshot(const std::filesystem::path& source,
              const std::filesystem::path& destination,
              const retry_policy& retry);

std::vector<std::string> integrity_check(const std::filesystem::path& path);

std::vector<std::string> list_tables(const std::filesystem::path& path);
std::vector<std::string> list_triggers(const std::filesystem::path& path);

}  // namespace sqlite

}  // namespace arkive::storage
