#pragma once
#include <arkive/crypto/hash.hpp>
#include <arkive/schema/backup_manifest.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace arkive::backup {

inline constexpr auto kDatabaseEntry = std::string_view{"database.db"};
inline constexpr auto kManifestEntry = std::string_view{"backup_info.json"};
inline constexpr auto kFilesPrefix = std::string_view{"files/"};

std::string encode_manifest(const arkive::schema::backup_manifest_t& manifest);

arkive::schema::backup_manifest_t decode_manifest(std::string_view json);

// Coarse archive checksum: SHA-256 over the little-endian 64-bit length
// of each captured item, store snapshot first.
class size_checksum final {
 public:
  void add(uint64_t size);
  std::string finish();

 private:
  arkive::crypto::sha256_hasher hasher_;
};

}  // namespace arkive::backup
