#pragma once

#include <arkive/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: audit entry.
// One committed, immutable security record. `previous_hash` links to the
// entry with `sequence_id - 1`; `current_hash` covers every other field
// except `sequence_id`.
namespace arkive::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  uint64_t sequence_id{};
  std::string id;
  std::string user_id;
  std::string username;
  std::string action;
  std::string resource_type;
  std::optional<std::string> resource_id;
  std::optional<std::string> resource_name;
  std::optional<std::string> ip_address;
  std::optional<std::string> file_hash;
  std::string metadata{"{}"};
  std::string timestamp;
  bool is_success{true};
  std::string previous_hash;
  std::string current_hash;
};

using audit_entry_t = audit_entry<1>;

struct actor_t final {
  std::string user_id;
  std::string username;
};

struct resource_ref_t final {
  std::string resource_type;
  std::optional<std::string> resource_id;
  std::optional<std::string> resource_name;
};

struct audit_context_t final {
  std::optional<std::string> ip_address;
  std::optional<std::string> file_hash;
};

}  // namespace arkive::schema
