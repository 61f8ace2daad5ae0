#pragma once

#include <cstdint>
#include <string>

// Schema type: backup manifest.
// Written once as `backup_info.json` inside the archive and read back on
// verify/restore. `files_count` counts the store snapshot plus every
// ancillary file; `checksum` is SHA-256 over the little-endian 64-bit byte
// length of each captured item, in archive order.
namespace arkive::schema {

template <uint16_t Version>
struct backup_manifest;

template <>
struct backup_manifest<1> final {
  std::string created_at;
  std::string version;
  uint64_t database_size{};
  uint64_t files_count{};
  std::string checksum;
};

using backup_manifest_t = backup_manifest<1>;

}  // namespace arkive::schema
