#include <arkive/common/error.hpp>
#include <arkive/crypto/hash.hpp>

#include <blake3.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>

namespace arkive::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

arkive::schema::hash32_t blake3(const arkive::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = arkive::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

arkive::schema::hash32_t blake3(const std::string_view& str) {
  return blake3(arkive::schema::make_bytes_view(str));
}

struct sha256_hasher::context final {
  evp_md_ctx_ptr md{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  bool finished{};
};

sha256_hasher::sha256_hasher() : context_{std::make_unique<context>()} {
  if (!context_->md ||
      EVP_DigestInit_ex(context_->md.get(), EVP_sha256(), nullptr) != 1) {
    throw arkive::common::error{arkive::common::error_code::backup,
                                "failed to initialize SHA-256 context"};
  }
}

sha256_hasher::~sha256_hasher() = default;
sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;
sha256_hasher& sha256_hasher::operator=(sha256_hasher&&) noexcept = default;

void sha256_hasher::update(const arkive::schema::bytes_view_t& bytes) {
  if (context_->finished) {
    throw arkive::common::error{arkive::common::error_code::backup,
                                "SHA-256 context already finalized"};
  }
  if (EVP_DigestUpdate(context_->md.get(), bytes.data(), bytes.size()) != 1) {
    throw arkive::common::error{arkive::common::error_code::backup,
                                "SHA-256 update failed"};
  }
}

arkive::schema::hash32_t sha256_hasher::finish() {
  auto output = arkive::schema::hash32_t{};
  auto length = 0u;
  if (context_->finished ||
      EVP_DigestFinal_ex(context_->md.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    throw arkive::common::error{arkive::common::error_code::backup,
                                "SHA-256 finalize failed"};
  }
  context_->finished = true;
  return output;
}

arkive::schema::hash32_t sha256(const arkive::schema::bytes_view_t& bytes) {
  auto hasher = sha256_hasher{};
  hasher.update(bytes);
  return hasher.finish();
}

arkive::schema::hash32_t sha256_file(const std::filesystem::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    throw arkive::common::not_found_error{"cannot open " + path.string()};
  }
  auto hasher = sha256_hasher{};
  auto buffer = std::array<char, 64 * 1024>{};
  while (in) {
    in.read(buffer.data(), buffer.size());
    const auto count = in.gcount();
    if (count > 0) {
      hasher.update(arkive::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(buffer.data()),
          static_cast<std::size_t>(count)});
    }
  }
  if (in.bad()) {
    throw arkive::common::backup_error{"read failed for " + path.string()};
  }
  return hasher.finish();
}

}  // namespace arkive::crypto
