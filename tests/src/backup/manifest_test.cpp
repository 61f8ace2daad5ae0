#include <gtest/gtest.h>
#include <arkive/backup/archive.hpp>
#include <arkive/backup/manifest.hpp>
#include <arkive/common/error.hpp>

#include <nlohmann/json.hpp>

namespace {

arkive::schema::backup_manifest_t sample_manifest() {
  auto manifest = arkive::schema::backup_manifest_t{};
  manifest.created_at = "2024-05-01T10:00:00.000Z";
  manifest.version = "1.0.0";
  manifest.database_size = 8192;
  manifest.files_count = 3;
  manifest.checksum = std::string(64, 'a');
  return manifest;
}

}  // namespace

TEST(manifest, encode_then_decode_preserves_fields) {
  const auto manifest = sample_manifest();
  const auto decoded =
      arkive::backup::decode_manifest(arkive::backup::encode_manifest(manifest));
  EXPECT_EQ(decoded.created_at, manifest.created_at);
  EXPECT_EQ(decoded.version, manifest.version);
  EXPECT_EQ(decoded.database_size, manifest.database_size);
  EXPECT_EQ(decoded.files_count, manifest.files_count);
  EXPECT_EQ(decoded.checksum, manifest.checksum);
}

TEST(manifest, decode_rejects_non_object) {
  EXPECT_THROW(arkive::backup::decode_manifest("not json"),
               arkive::common::validation_error);
  EXPECT_THROW(arkive::backup::decode_manifest("[1, 2]"),
               arkive::common::validation_error);
}

TEST(manifest, decode_rejects_missing_field) {
  auto json = nlohmann::json::parse(
      arkive::backup::encode_manifest(sample_manifest()));
  json.erase("files_count");
  EXPECT_THROW(arkive::backup::decode_manifest(json.dump()),
               arkive::common::validation_error);
}

TEST(manifest, decode_rejects_negative_size) {
  auto json = nlohmann::json::parse(
      arkive::backup::encode_manifest(sample_manifest()));
  json["database_size"] = -1;
  EXPECT_THROW(arkive::backup::decode_manifest(json.dump()),
               arkive::common::validation_error);
}

TEST(manifest, decode_rejects_malformed_checksum) {
  auto json = nlohmann::json::parse(
      arkive::backup::encode_manifest(sample_manifest()));
  json["checksum"] = "abc";
  EXPECT_THROW(arkive::backup::decode_manifest(json.dump()),
               arkive::common::validation_error);
  json["checksum"] = std::string(64, 'A');
  EXPECT_THROW(arkive::backup::decode_manifest(json.dump()),
               arkive::common::validation_error);
}

TEST(manifest, size_checksum_hashes_little_endian_lengths) {
  auto checksum = arkive::backup::size_checksum{};
  checksum.add(0x0102);
  checksum.add(5);

  const auto expected_input = arkive::schema::bytes_t{
      0x02, 0x01, 0, 0, 0, 0, 0, 0,  //
      0x05, 0,    0, 0, 0, 0, 0, 0};
  EXPECT_EQ(checksum.finish(),
            arkive::schema::to_hex(arkive::crypto::sha256(
                arkive::schema::make_bytes_view(expected_input))));
}

TEST(manifest, size_checksum_depends_on_order) {
  auto first = arkive::backup::size_checksum{};
  first.add(1);
  first.add(2);
  auto second = arkive::backup::size_checksum{};
  second.add(2);
  second.add(1);
  EXPECT_NE(first.finish(), second.finish());
}

TEST(manifest, entry_names_inside_the_archive_are_safe) {
  EXPECT_TRUE(arkive::backup::is_safe_entry_name("database.db"));
  EXPECT_TRUE(arkive::backup::is_safe_entry_name("files/a/b..c.txt"));
  EXPECT_TRUE(arkive::backup::is_safe_entry_name("files/dir/"));
}

TEST(manifest, entry_names_escaping_the_archive_are_unsafe) {
  EXPECT_FALSE(arkive::backup::is_safe_entry_name(""));
  EXPECT_FALSE(arkive::backup::is_safe_entry_name("/etc/passwd"));
  EXPECT_FALSE(arkive::backup::is_safe_entry_name("\\windows\\evil"));
  EXPECT_FALSE(arkive::backup::is_safe_entry_name("C:/evil"));
  EXPECT_FALSE(arkive::backup::is_safe_entry_name("files/../../evil.txt"));
  EXPECT_FALSE(arkive::backup::is_safe_entry_name(".."));
  EXPECT_FALSE(arkive::backup::is_safe_entry_name("files\\..\\evil.txt"));
}
