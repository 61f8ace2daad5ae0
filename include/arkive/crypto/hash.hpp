#pragma once

#include <arkive/schema/primitives.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace arkive::crypto {

arkive::schema::hash32_t blake3(const arkive::schema::bytes_view_t& bytes);
arkive::schema::hash32_t blake3(const std::string_view& str);

arkive::schema::hash32_t sha256(const arkive::schema::bytes_view_t& bytes);

arkive::schema::hash32_t sha256_file(const std::filesystem::path& path);

class sha256_hasher final {
 public:
  sha256_hasher();
  ~sha256_hasher();

  sha256_hasher(const sha256_hasher&) = delete;
  sha256_hasher& operator=(const sha256_hasher&) = delete;
  sha256_hasher(sha256_hasher&&) noexcept;
  sha256_hasher& operator=(sha256_hasher&&) noexcept;

  void update(const arkive::schema::bytes_view_t& bytes);

  // Finalize. The hasher cannot be updated afterwards.
  arkive::schema::hash32_t finish();

 private:
  struct context;
  std::unique_ptr<context> context_;
};

}  // namespace arkive::crypto
