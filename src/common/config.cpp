#include <arkive/common/config.hpp>
#include <arkive/common/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace po = boost::program_options;

namespace arkive::common {

namespace {

constexpr auto kEnvironmentPrefix = std::string_view{"ARKIVE_"};

}  // namespace

po::options_description config_options(config& target) {
  auto description = po::options_description{"Storage"};
  description.add_options()(
      "config,c", po::value<std::string>(&target.config_file),
      "INI file with any of these options")(
      "data-dir", po::value<std::string>(&target.data_dir)
                      ->default_value(target.data_dir),
      "Root for the store, files and backups")(
      "db", po::value<std::string>(&target.database_path),
      "Store path (default <data-dir>/arkive.db)")(
      "files", po::value<std::string>(&target.files_root),
      "Document files root (default <data-dir>/files)")(
      "backup-dir", po::value<std::string>(&target.backup_dir),
      "Backup directory (default <data-dir>/backups)")(
      "retries", po::value<uint32_t>(&target.retry_attempts)
                     ->default_value(target.retry_attempts),
      "Attempts for busy/locked operations")(
      "backoff-ms", po::value<uint32_t>(&target.retry_backoff_ms)
                        ->default_value(target.retry_backoff_ms),
      "Linear backoff step between attempts")(
      "busy-timeout-ms", po::value<uint32_t>(&target.busy_timeout_ms)
                             ->default_value(target.busy_timeout_ms),
      "SQLite busy timeout")(
      "cache-size-kib", po::value<int64_t>(&target.cache_size_kib)
                            ->default_value(target.cache_size_kib),
      "Page cache bound in KiB")(
      "keep", po::value<uint32_t>(&target.keep_backups)
                  ->default_value(target.keep_backups),
      "Backups kept by backup-cleanup")(
      "log-level", po::value<std::string>(&target.log_level)
                       ->default_value(target.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&target.log_file)
                      ->default_value(target.log_file),
      "Log file path, empty to disable");
  return description;
}

void store_config_sources(const po::options_description& description,
                          po::variables_map& vm) {
  if (vm.count("config") != 0) {
    const auto path = vm["config"].as<std::string>();
    auto in = std::ifstream{path};
    if (!in) {
      throw not_found_error{"cannot open config file: " + path};
    }
    po::store(po::parse_config_file(in, description, true), vm);
    spdlog::debug("Loaded configuration from '{}'", path);
  }

  po::store(po::parse_environment(
                description,
                [&description](const std::string& variable) -> std::string {
                  auto name = std::string_view{variable};
                  if (!name.starts_with(kEnvironmentPrefix)) {
                    return {};
                  }
                  name.remove_prefix(kEnvironmentPrefix.size());
                  auto option = std::string{name};
                  std::ranges::transform(option, std::begin(option),
                                         [](const unsigned char c) {
                                           return c == '_'
                                                      ? '-'
                                                      : static_cast<char>(
                                                            std::tolower(c));
                                         });
                  if (option == "config" ||
                      description.find_nothrow(option, false) == nullptr) {
                    return {};
                  }
                  return option;
                }),
            vm);
}

void finalize_config(config& value) {
  const auto root = std::filesystem::path{value.data_dir};
  if (value.database_path.empty()) {
    value.database_path = (root / "arkive.db").string();
  }
  if (value.files_root.empty()) {
    value.files_root = (root / "files").string();
  }
  if (value.backup_dir.empty()) {
    value.backup_dir = (root / "backups").string();
  }
  if (value.retry_attempts == 0) {
    throw validation_error{"retries must be at least 1"};
  }
  if (value.cache_size_kib <= 0) {
    throw validation_error{"cache-size-kib must be positive"};
  }
}

}  // namespace arkive::common
