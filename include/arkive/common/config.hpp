#pragma once

#include <boost/program_options.hpp>
#include <cstdint>
#include <string>

namespace arkive::common {

// Runtime settings shared by the CLI and embedding applications.
//
// Sources, highest precedence first: command line, the INI file named by
// `--config`, then `ARKIVE_*` environment variables (`ARKIVE_DATA_DIR`
// maps to `data-dir`). Empty paths are derived from `data_dir` by
// `finalize_config`.
struct config final {
  std::string data_dir{"data"};
  std::string database_path;
  std::string files_root;
  std::string backup_dir;
  std::string config_file;
  uint32_t retry_attempts{3};
  uint32_t retry_backoff_ms{100};
  uint32_t busy_timeout_ms{5000};
  int64_t cache_size_kib{8192};
  uint32_t keep_backups{5};
  std::string log_level{"info"};
  std::string log_file{"arkive.log"};
};

// Options bound to the fields of `target`. The description must outlive
// the `notify` call that writes into `target`.
boost::program_options::options_description config_options(config& target);

void store_config_sources(
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

void finalize_config(config& value);

}  // namespace arkive::common
