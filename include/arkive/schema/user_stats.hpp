#pragma once

#include <cstdint>

// Schema type: user stats.
namespace arkive::schema {

template <uint16_t Version>
struct user_stats;

template <>
struct user_stats<1> final {
  uint16_t version{1};
  int64_t total_documents{};
  int64_t uploads_today{};
  int64_t total_size{};
  int64_t active_documents{};
};

using user_stats_t = user_stats<1>;

}  // namespace arkive::schema
