#include <arkive/audit/trail.hpp>
#include <arkive/backup/archive.hpp>
#include <arkive/backup/manager.hpp>
#include <arkive/backup/manifest.hpp>
#include <arkive/common/error.hpp>
#include <arkive/storage/sqlite/schema.hpp>
#include <arkive/storage/sqlite/storage.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <system_error>
#include <utility>

namespace arkive::backup {

namespace {

constexpr auto kManifestLimit = uint64_t{1024 * 1024};

// Removes the path it owns on destruction unless released.
class scoped_path final {
 public:
  explicit scoped_path(std::filesystem::path path) : path_{std::move(path)} {}
  ~scoped_path() {
    if (path_.empty()) {
      return;
    }
    auto ec = std::error_code{};
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      spdlog::warn("Failed to remove {}: {}", path_.string(), ec.message());
    }
  }

  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;

  const std::filesystem::path& get() const { return path_; }
  void release() { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path make_scratch_directory(const std::string_view purpose) {
  auto path = std::filesystem::temp_directory_path() /
              fmt::format("arkive-{}-{}", purpose, arkive::schema::make_uuid());
  std::filesystem::create_directories(path);
  return path;
}

std::vector<std::pair<std::string, std::filesystem::path>> collect_files(
    const std::filesystem::path& root) {
  auto files = std::vector<std::pair<std::string, std::filesystem::path>>{};
  if (root.empty() || !std::filesystem::is_directory(root)) {
    return files;
  }
  for (const auto& entry : std::filesystem::recursive_directory_iterator{root}) {
    if (entry.is_regular_file()) {
      files.emplace_back(
          std::filesystem::relative(entry.path(), root).generic_string(),
          entry.path());
    }
  }
  std::ranges::sort(files, {}, &std::pair<std::string,
                                          std::filesystem::path>::first);
  return files;
}

bool contains(const std::vector<std::string>& values,
              const std::string_view value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void require_healthy_database(const std::filesystem::path& path) {
  const auto rows = arkive::storage::sqlite::integrity_check(path);
  if (rows.size() != 1 || rows.front() != "ok") {
    throw arkive::common::validation_error{
        "database integrity check failed: " +
        (rows.empty() ? std::string{"no result"} : rows.front())};
  }
}

void require_schema(const std::filesystem::path& path) {
  const auto tables = arkive::storage::sqlite::list_tables(path);
  for (const auto table : arkive::storage::sqlite::kRequiredTables) {
    if (!contains(tables, table)) {
      throw arkive::common::validation_error{
          fmt::format("required table '{}' is missing", table)};
    }
  }
  const auto triggers = arkive::storage::sqlite::list_triggers(path);
  for (const auto trigger : arkive::storage::sqlite::kAuditTriggers) {
    if (!contains(triggers, trigger)) {
      throw arkive::common::validation_error{
          fmt::format("audit immutability trigger '{}' is missing", trigger)};
    }
  }
}

void require_intact_audit_chain(const std::filesystem::path& path) {
  auto options = arkive::storage::storage_options{};
  options.mode = arkive::storage::open_mode::read_only;
  try {
    const auto store =
        arkive::storage::make_storage<arkive::storage::sqlite_storage_tag>(
            path, options);
    const auto verification = arkive::audit::trail{store}.verify_chain();
    if (!verification.ok) {
      throw arkive::common::validation_error{fmt::format(
          "audit chain broken at sequence {}: {}",
          verification.failed_sequence_id.value_or(0), verification.error)};
    }
  } catch (const arkive::common::storage_init_error& ex) {
    throw arkive::common::validation_error{
        std::string{"snapshot cannot be opened: "} + ex.what()};
  }
}

}  // namespace

std::string archive_file_name(
    const arkive::schema::timestamp_milliseconds_t value) {
  // 2024-01-02T03:04:05.678Z
  const auto ts = arkive::schema::format_timestamp(value);
  return "arkive_backup_" + ts.substr(0, 4) + ts.substr(5, 2) +
         ts.substr(8, 2) + "_" + ts.substr(11, 2) + ts.substr(14, 2) +
         ts.substr(17, 2) + "_" + ts.substr(20, 3) + ".zip";
}

manager::manager(manager_options options) : options_{std::move(options)} {
  if (!options_.clock) {
    options_.clock = &arkive::schema::now_milliseconds;
  }
}

arkive::schema::backup_manifest_t manager::create(
    const std::filesystem::path& store_path,
    const std::filesystem::path& files_root,
    const std::filesystem::path& output_path) const {
  if (!std::filesystem::exists(store_path)) {
    throw arkive::common::backup_error{"store not found: " +
                                       store_path.string()};
  }
  spdlog::info("Creating backup of {} into {}", store_path.string(),
               output_path.string());

  try {
    if (output_path.has_parent_path()) {
      std::filesystem::create_directories(output_path.parent_path());
    }
    const auto scratch = scoped_path{make_scratch_directory("snapshot")};
    const auto snapshot_path = scratch.get() / kDatabaseEntry;
    arkive::storage::sqlite::snapshot(store_path, snapshot_path,
                                      options_.retry);

    auto partial = scoped_path{output_path.string() + ".partial"};
    auto checksum = size_checksum{};
    auto manifest = arkive::schema::backup_manifest_t{};
    {
      auto writer = archive_writer{partial.get()};
      manifest.database_size = writer.add_file(kDatabaseEntry, snapshot_path);
      checksum.add(manifest.database_size);

      const auto files = collect_files(files_root);
      for (const auto& [relative, source] : files) {
        const auto size =
            writer.add_file(std::string{kFilesPrefix} + relative, source);
        checksum.add(size);
      }

      manifest.created_at = arkive::schema::format_timestamp(options_.clock());
      manifest.version = ARKIVE_VERSION;
      manifest.files_count = files.size() + 1;
      manifest.checksum = checksum.finish();
      writer.add_bytes(kManifestEntry, encode_manifest(manifest));
      writer.close();
    }

    std::filesystem::rename(partial.get(), output_path);
    partial.release();

    spdlog::info("Backup {} created: {} bytes of store, {} items, checksum {}",
                 output_path.string(), manifest.database_size,
                 manifest.files_count, manifest.checksum.substr(0, 16));
    return manifest;
  } catch (const std::filesystem::filesystem_error& ex) {
    spdlog::error("Backup of {} failed: {}", store_path.string(), ex.what());
    throw arkive::common::backup_error{ex.what()};
  } catch (const arkive::common::sqlite_error& ex) {
    spdlog::error("Snapshot of {} failed: {}", store_path.string(), ex.what());
    throw arkive::common::backup_error{ex.what()};
  } catch (const arkive::common::error& ex) {
    spdlog::error("Backup of {} failed: {}", store_path.string(), ex.what());
    throw;
  }
}

arkive::schema::backup_manifest_t manager::verify(
    const std::filesystem::path& archive_path) const {
  try {
    return verify_archive(archive_path);
  } catch (const std::filesystem::filesystem_error& ex) {
    throw arkive::common::backup_error{"cannot verify " +
                                       archive_path.string() + ": " +
                                       ex.what()};
  }
}

arkive::schema::backup_manifest_t manager::verify_archive(
    const std::filesystem::path& archive_path) const {
  if (!std::filesystem::is_regular_file(archive_path)) {
    throw arkive::common::validation_error{"backup archive not found: " +
                                           archive_path.string()};
  }

  const auto scratch = scoped_path{make_scratch_directory("verify")};
  const auto snapshot_path = scratch.get() / kDatabaseEntry;

  auto database_size = std::optional<uint64_t>{};
  auto manifest_json = std::optional<std::string>{};
  auto file_sizes = std::vector<uint64_t>{};
  {
    auto reader = archive_reader{archive_path};
    while (const auto item = reader.next()) {
      if (!is_safe_entry_name(item->name)) {
        throw arkive::common::validation_error{"unsafe entry path '" +
                                               item->name + "'"};
      }
      if (item->is_directory) {
        continue;
      }
      if (item->name == kDatabaseEntry) {
        if (database_size) {
          throw arkive::common::validation_error{"duplicate database.db entry"};
        }
        database_size = reader.extract_to(snapshot_path);
      } else if (item->name == kManifestEntry) {
        manifest_json = reader.read_all(kManifestLimit);
      } else if (item->name.starts_with(kFilesPrefix)) {
        file_sizes.push_back(reader.drain());
      } else {
        spdlog::warn("Ignoring unexpected entry '{}' in {}", item->name,
                     archive_path.string());
        reader.drain();
      }
    }
  }

  if (!database_size) {
    throw arkive::common::validation_error{"required entry 'database.db' is missing"};
  }
  if (!manifest_json) {
    throw arkive::common::validation_error{
        "required entry 'backup_info.json' is missing"};
  }
  const auto manifest = decode_manifest(*manifest_json);

  if (*database_size != manifest.database_size) {
    throw arkive::common::validation_error{
        fmt::format("database size mismatch: manifest {} archive {}",
                    manifest.database_size, *database_size)};
  }
  if (file_sizes.size() + 1 != manifest.files_count) {
    throw arkive::common::validation_error{
        fmt::format("files count mismatch: manifest {} archive {}",
                    manifest.files_count, file_sizes.size() + 1)};
  }
  auto checksum = size_checksum{};
  checksum.add(*database_size);
  for (const auto size : file_sizes) {
    checksum.add(size);
  }
  if (checksum.finish() != manifest.checksum) {
    throw arkive::common::validation_error{"checksum mismatch"};
  }

  require_healthy_database(snapshot_path);
  require_schema(snapshot_path);
  require_intact_audit_chain(snapshot_path);

  spdlog::info("Backup {} verified (created {}, version {})",
               archive_path.string(), manifest.created_at, manifest.version);
  return manifest;
}

arkive::schema::backup_manifest_t manager::restore(
    const std::filesystem::path& archive_path,
    const std::filesystem::path& target_store_path,
    const std::filesystem::path& target_files_root) const {
  const auto manifest = verify(archive_path);
  spdlog::info("Restoring {} into {}", archive_path.string(),
               target_store_path.string());

  try {
    if (target_store_path.has_parent_path()) {
      std::filesystem::create_directories(target_store_path.parent_path());
    }
    auto staged = scoped_path{
        target_store_path.parent_path() /
        (target_store_path.filename().string() + ".restore-" +
         arkive::schema::make_uuid())};
    {
      auto reader = archive_reader{archive_path};
      while (const auto item = reader.next()) {
        if (item->name == kDatabaseEntry) {
          reader.extract_to(staged.get());
          break;
        }
      }
    }
    if (!std::filesystem::exists(staged.get())) {
      throw arkive::common::backup_error{"database.db vanished from " +
                                         archive_path.string()};
    }

    for (const auto suffix : std::array<std::string_view, 3>{"-wal", "-shm",
                                                             "-journal"}) {
      std::filesystem::remove(target_store_path.string() + std::string{suffix});
    }
    std::filesystem::rename(staged.get(), target_store_path);
    staged.release();

    std::filesystem::create_directories(target_files_root);
    auto restored = std::size_t{0};
    {
      auto reader = archive_reader{archive_path};
      while (const auto item = reader.next()) {
        if (item->is_directory || !item->name.starts_with(kFilesPrefix)) {
          continue;
        }
        const auto relative = item->name.substr(kFilesPrefix.size());
        if (relative.empty() || !is_safe_entry_name(relative)) {
          throw arkive::common::validation_error{"unsafe entry path '" +
                                                 item->name + "'"};
        }
        const auto destination =
            target_files_root / std::filesystem::path{relative};
        std::filesystem::create_directories(destination.parent_path());
        reader.extract_to(destination);
        ++restored;
      }
    }

    require_healthy_database(target_store_path);
    spdlog::info("Restored {} (created {}): store and {} files",
                 archive_path.string(), manifest.created_at, restored);
    return manifest;
  } catch (const std::filesystem::filesystem_error& ex) {
    spdlog::error("Restore of {} failed: {}", archive_path.string(), ex.what());
    throw arkive::common::backup_error{ex.what()};
  }
}

std::vector<backup_listing> manager::list(
    const std::filesystem::path& backup_dir) const {
  auto listings = std::vector<backup_listing>{};
  if (!std::filesystem::is_directory(backup_dir)) {
    return listings;
  }
  for (const auto& entry : std::filesystem::directory_iterator{backup_dir}) {
    if (!entry.is_regular_file() || entry.path().extension() != ".zip") {
      continue;
    }
    try {
      listings.push_back(backup_listing{entry.path(), verify(entry.path())});
    } catch (const arkive::common::error& ex) {
      spdlog::warn("Skipping invalid backup {}: {}", entry.path().string(),
                   ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
      spdlog::warn("Skipping unreadable backup {}: {}", entry.path().string(),
                   ex.what());
    }
  }
  std::ranges::sort(listings, [](const backup_listing& lhs,
                                 const backup_listing& rhs) {
    if (lhs.manifest.created_at != rhs.manifest.created_at) {
      return lhs.manifest.created_at > rhs.manifest.created_at;
    }
    return lhs.path.filename() > rhs.path.filename();
  });
  return listings;
}

std::size_t manager::cleanup(const std::filesystem::path& backup_dir,
                             const std::size_t keep_count) const {
  const auto listings = list(backup_dir);
  auto removed = std::size_t{0};
  for (auto i = keep_count; i < listings.size(); ++i) {
    auto ec = std::error_code{};
    std::filesystem::remove(listings[i].path, ec);
    if (ec) {
      throw arkive::common::backup_error{"cannot remove " +
                                         listings[i].path.string() + ": " +
                                         ec.message()};
    }
    spdlog::info("Removed old backup {} (created {})",
                 listings[i].path.filename().string(),
                 listings[i].manifest.created_at);
    ++removed;
  }
  return removed;
}

}  // namespace arkive::backup
