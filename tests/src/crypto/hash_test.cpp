#include <gtest/gtest.h>
#include <arkive/common/error.hpp>
#include <arkive/crypto/hash.hpp>
#include <arkive/testing/common.hpp>

namespace {

std::string hex(const arkive::schema::hash32_t& hash) {
  return arkive::schema::to_hex(hash);
}

}  // namespace

TEST(hash, sha256_matches_known_vectors) {
  EXPECT_EQ(hex(arkive::crypto::sha256(arkive::schema::make_bytes_view(
                std::string_view{"abc"}))),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(hex(arkive::crypto::sha256(arkive::schema::make_bytes_view(
                std::string_view{""}))),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(hash, blake3_matches_known_vector) {
  EXPECT_EQ(hex(arkive::crypto::blake3(std::string_view{""})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(hash, blake3_and_sha256_differ) {
  const auto input = std::string_view{"arkive"};
  EXPECT_NE(arkive::crypto::blake3(input),
            arkive::crypto::sha256(arkive::schema::make_bytes_view(input)));
}

TEST(hash, incremental_sha256_matches_one_shot) {
  auto hasher = arkive::crypto::sha256_hasher{};
  hasher.update(arkive::schema::make_bytes_view(std::string_view{"hello "}));
  hasher.update(arkive::schema::make_bytes_view(std::string_view{"world"}));
  EXPECT_EQ(hasher.finish(),
            arkive::crypto::sha256(arkive::schema::make_bytes_view(
                std::string_view{"hello world"})));
}

TEST(hash, finished_hasher_rejects_more_input) {
  auto hasher = arkive::crypto::sha256_hasher{};
  static_cast<void>(hasher.finish());
  EXPECT_THROW(
      hasher.update(arkive::schema::make_bytes_view(std::string_view{"x"})),
      arkive::common::error);
}

TEST(hash, sha256_file_hashes_full_content) {
  const auto root = arkive::testing::make_temp_dir("arkive_hash");
  // Larger than one read block.
  const auto content = std::string(200 * 1024, 'q');
  arkive::testing::write_file(root / "blob.bin", content);

  EXPECT_EQ(arkive::crypto::sha256_file(root / "blob.bin"),
            arkive::crypto::sha256(arkive::schema::make_bytes_view(
                std::string_view{content})));

  arkive::testing::remove_path(root);
}

TEST(hash, sha256_file_reports_missing_file) {
  EXPECT_THROW(
      arkive::crypto::sha256_file(std::filesystem::temp_directory_path() /
                                  "arkive_hash_missing_file.bin"),
      arkive::common::not_found_error);
}
