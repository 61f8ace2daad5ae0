#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: user.
// `password_hash` arrives already hashed; the store never sees secrets.
namespace arkive::schema {

template <uint16_t Version>
struct user;

template <>
struct user<1> final {
  uint16_t version{1};
  std::string id;
  std::string username;
  std::string email;
  std::string password_hash;
  std::string created_at;
  std::optional<std::string> last_login;
};

using user_t = user<1>;

}  // namespace arkive::schema
