#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace arkive::common {

enum class error_code : uint32_t {
  storage_init = 1,
  contention = 2,
  audit_write = 3,
  validation = 4,
  backup = 5,
  not_found = 6,
  sqlite = 7,
  io = 8,
};

std::string_view to_string(error_code code);

class error : public std::runtime_error {
 public:
  error(error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

class storage_init_error final : public error {
 public:
  explicit storage_init_error(const std::string& message)
      : error{error_code::storage_init, message} {}
};

class contention_error final : public error {
 public:
  contention_error(const std::string& message, uint32_t attempts)
      : error{error_code::contention, message}, attempts_{attempts} {}

  uint32_t attempts() const noexcept { return attempts_; }

 private:
  uint32_t attempts_{};
};

class audit_write_error final : public error {
 public:
  explicit audit_write_error(const std::string& message)
      : error{error_code::audit_write, message} {}
};

// Integrity failure or rejected input. Never auto-corrected.
class validation_error final : public error {
 public:
  explicit validation_error(const std::string& reason)
      : error{error_code::validation, reason} {}

  std::string_view reason() const noexcept { return what(); }
};

class backup_error final : public error {
 public:
  explicit backup_error(const std::string& message)
      : error{error_code::backup, message} {}
};

// Reading or writing a plain output file failed.
class io_error final : public error {
 public:
  explicit io_error(const std::string& message)
      : error{error_code::io, message} {}
};

class not_found_error final : public error {
 public:
  explicit not_found_error(const std::string& message)
      : error{error_code::not_found, message} {}
};

class sqlite_error final : public error {
 public:
  sqlite_error(int result_code, const std::string& message)
      : error{error_code::sqlite, message}, result_code_{result_code} {}

  int result_code() const noexcept { return result_code_; }
  int primary_code() const noexcept { return result_code_ & 0xff; }

  bool is_contention() const noexcept;

 private:
  int result_code_{};
};

}  // namespace arkive::common
