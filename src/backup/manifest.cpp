#include <arkive/backup/manifest.hpp>
#include <arkive/common/error.hpp>

#include <boost/endian/buffers.hpp>
#include <nlohmann/json.hpp>

namespace arkive::backup {

std::string encode_manifest(const arkive::schema::backup_manifest_t& manifest) {
  auto json = nlohmann::json{{"created_at", manifest.created_at},
                             {"version", manifest.version},
                             {"database_size", manifest.database_size},
                             {"files_count", manifest.files_count},
                             {"checksum", manifest.checksum}};
  return json.dump(2);
}

arkive::schema::backup_manifest_t decode_manifest(const std::string_view json) {
  auto parsed = nlohmann::json::parse(json, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw arkive::common::validation_error{
        "backup_info.json is not a JSON object"};
  }

  auto require = [&](const char* key, auto check, const char* kind) {
    const auto it = parsed.find(key);
    if (it == parsed.end() || !check(*it)) {
      throw arkive::common::validation_error{
          std::string{"backup_info.json: '"} + key + "' must be " + kind};
    }
    return *it;
  };
  auto is_string = [](const nlohmann::json& v) { return v.is_string(); };
  auto is_unsigned = [](const nlohmann::json& v) {
    return v.is_number_unsigned();
  };

  auto manifest = arkive::schema::backup_manifest_t{};
  manifest.created_at =
      require("created_at", is_string, "a string").get<std::string>();
  manifest.version = require("version", is_string, "a string").get<std::string>();
  manifest.database_size =
      require("database_size", is_unsigned, "a non-negative integer")
          .get<uint64_t>();
  manifest.files_count =
      require("files_count", is_unsigned, "a non-negative integer")
          .get<uint64_t>();
  manifest.checksum =
      require("checksum", is_string, "a string").get<std::string>();
  if (!arkive::schema::is_hash_hex(manifest.checksum)) {
    throw arkive::common::validation_error{
        "backup_info.json: 'checksum' is not a SHA-256 hex digest"};
  }
  return manifest;
}

void size_checksum::add(const uint64_t size) {
  const auto encoded = boost::endian::little_uint64_buf_t{size};
  hasher_.update(arkive::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(encoded.data()), sizeof(encoded)});
}

std::string size_checksum::finish() {
  return arkive::schema::to_hex(hasher_.finish());
}

}  // namespace arkive::backup
