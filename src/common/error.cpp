#include <arkive/common/error.hpp>

#include <sqlite3.h>

namespace arkive::common {

std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::storage_init:
      return "storage_init";
    case error_code::contention:
      return "contention";
    case error_code::audit_write:
      return "audit_write";
    case error_code::validation:
      return "validation";
    case error_code::backup:
      return "backup";
    case error_code::not_found:
      return "not_found";
    case error_code::sqlite:
      return "sqlite";
    case error_code::io:
      return "io";
  }
  return "unknown";
}

bool sqlite_error::is_contention() const noexcept {
  return primary_code() == SQLITE_BUSY || primary_code() == SQLITE_LOCKED;
}

}  // namespace arkive::common
