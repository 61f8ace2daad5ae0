#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: audit chain status.
// Result of a full chain scan plus the bounds of the recorded history.
namespace arkive::schema {

template <uint16_t Version>
struct chain_verification;

template <>
struct chain_verification<1> final {
  uint16_t version{1};
  bool ok{};
  uint64_t entries_checked{};
  std::optional<uint64_t> failed_sequence_id;
  std::string error;
};

using chain_verification_t = chain_verification<1>;

template <uint16_t Version>
struct audit_chain_status;

template <>
struct audit_chain_status<1> final {
  uint16_t version{1};
  bool is_valid{};
  uint64_t total_logs{};
  std::optional<std::string> first_log_date;
  std::optional<std::string> last_log_date;
  std::optional<uint64_t> failed_sequence_id;
  std::string error;
};

using audit_chain_status_t = audit_chain_status<1>;

}  // namespace arkive::schema
