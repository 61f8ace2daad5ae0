#pragma once
#include <arkive/schema/backup_manifest.hpp>
#include <arkive/schema/primitives.hpp>
#include <arkive/storage/retry_policy.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace arkive::backup {

struct manager_options final {
  arkive::storage::retry_policy retry;
  std::function<arkive::schema::timestamp_milliseconds_t()> clock{
      &arkive::schema::now_milliseconds};
};

struct backup_listing final {
  std::filesystem::path path;
  arkive::schema::backup_manifest_t manifest;
};

/// `arkive_backup_YYYYMMDD_HHMMSS_mmm.zip` for the given instant.
std::string archive_file_name(arkive::schema::timestamp_milliseconds_t value);

/// Point-in-time backup and verified restore of a store plus its ancillary
/// file tree.
///
/// An archive holds `database.db` (a consistent snapshot), `files/<path>`
/// for every ancillary file, and `backup_info.json`. Nothing is restored
/// from an archive that fails `verify`, and an archive that fails `verify`
/// is never deleted by `cleanup`.
class manager final {
 public:
  explicit manager(manager_options options = {});

  /// Raises `backup_error` when the store is missing or the archive cannot
  /// be written. No partial archive is left at `output_path`.
  arkive::schema::backup_manifest_t create(
      const std::filesystem::path& store_path,
      const std::filesystem::path& files_root,
      const std::filesystem::path& output_path) const;

  /// Raises `validation_error` naming the first failed check, or
  /// `backup_error` when the archive cannot be read from disk.
  arkive::schema::backup_manifest_t verify(
      const std::filesystem::path& archive_path) const;

  /// Verify, then install the snapshot at `target_store_path` and the
  /// ancillary files under `target_files_root`. The target store must not
  /// be open while this runs.
  arkive::schema::backup_manifest_t restore(
      const std::filesystem::path& archive_path,
      const std::filesystem::path& target_store_path,
      const std::filesystem::path& target_files_root) const;

  /// Archives in `backup_dir` that verify, newest first. Anything else is
  /// skipped with a warning.
  std::vector<backup_listing> list(
      const std::filesystem::path& backup_dir) const;

  /// Delete verified archives beyond the `keep_count` newest. Returns the
  /// number removed.
  std::size_t cleanup(const std::filesystem::path& backup_dir,
                      std::size_t keep_count) const;

 private:
  arkive::schema::backup_manifest_t verify_archive(
      const std::filesystem::path& archive_path) const;

  manager_options options_;
};

}  // namespace arkive::backup
