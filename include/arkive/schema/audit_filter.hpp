#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: audit filter.
// Every populated field narrows the result with an exact match, except the
// dates, which form an inclusive timestamp range.
namespace arkive::schema {

enum class sort_order_t : uint8_t { descending = 0, ascending = 1 };

template <uint16_t Version>
struct audit_filter;

template <>
struct audit_filter<1> final {
  uint16_t version{1};
  std::optional<std::string> user_id;
  std::optional<std::string> action;
  std::optional<std::string> resource_type;
  std::optional<std::string> resource_id;
  std::optional<std::string> start_date;
  std::optional<std::string> end_date;
  // Shorthand for `start_date = now - days_back`; ignored when
  // `start_date` is set.
  std::optional<uint32_t> days_back;
  std::optional<uint32_t> limit;
  uint64_t offset{};
  sort_order_t order{sort_order_t::descending};
};

using audit_filter_t = audit_filter<1>;

}  // namespace arkive::schema
