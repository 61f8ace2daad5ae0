#pragma once

#include <arkive/schema/audit_entry.hpp>
#include <cstdint>
#include <vector>

// Schema type: audit page.
// One page of a filtered query plus the totals a paginated view needs.
namespace arkive::schema {

template <uint16_t Version>
struct audit_page;

template <>
struct audit_page<1> final {
  uint16_t version{1};
  std::vector<audit_entry_t> entries;
  uint64_t total{};
  uint32_t page{1};
  uint32_t total_pages{};
  bool has_next{};
  bool has_previous{};
};

using audit_page_t = audit_page<1>;

}  // namespace arkive::schema
