#pragma once
#include <arkive/common/config.hpp>
#include <arkive/storage/retry_policy.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace arkive::storage {

enum class open_mode : uint8_t { read_write, read_only };

/// Connection tuning applied when a store is opened.
struct storage_options final {
  std::chrono::milliseconds busy_timeout{5000};
  int64_t cache_size_kib{8192};
  uint32_t wal_autocheckpoint{1000};
  open_mode mode{open_mode::read_write};
  retry_policy retry;
};

inline storage_options make_storage_options(const arkive::common::config& cfg) {
  auto options = storage_options{};
  options.busy_timeout = std::chrono::milliseconds{cfg.busy_timeout_ms};
  options.cache_size_kib = cfg.cache_size_kib;
  options.retry.max_attempts = cfg.retry_attempts;
  options.retry.backoff_step = std::chrono::milliseconds{cfg.retry_backoff_ms};
  return options;
}

template <typename Library>
struct storage {
  /// Run `operation(connection&)` with exclusive use of the handle,
  /// retrying busy/locked failures per `storage_options::retry`.
  template <typename Operation>
  auto execute(Operation&& operation, std::string_view what) const;

  /// Schema cookie. Changes whenever the schema is altered.
  int64_t schema_version() const;

  /// Path of the underlying database file.
  const std::filesystem::path& location() const;
};

/// Open (and for read_write, initialize) the store rooted at `path`.
/// Idempotent: opening an initialized store changes neither its schema nor
/// its data.
template <typename Library>
storage<Library> make_storage(const std::filesystem::path& path,
                              const storage_options& options = {});

}  // namespace arkive::storage
