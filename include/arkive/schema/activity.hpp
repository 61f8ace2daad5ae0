#pragma once

#include <cstdint>
#include <string>

// Schema type: activity.
// Lightweight user-facing feed entry. Not hash-chained; the audit trail is
// the legal record.
namespace arkive::schema {

template <uint16_t Version>
struct activity;

template <>
struct activity<1> final {
  uint16_t version{1};
  std::string id;
  std::string user_id;
  std::string action;
  std::string resource_type;
  std::string resource_id;
  std::string details;
  std::string created_at;
};

using activity_t = activity<1>;

}  // namespace arkive::schema
