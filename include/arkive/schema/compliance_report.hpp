#pragma once

#include <arkive/schema/audit_chain_status.hpp>
#include <arkive/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: compliance report.
// Describes one audit export: what was written, the chain state at export
// time, and the SHA-256 of the written file.
namespace arkive::schema {

enum class export_format_t : uint8_t { json = 0, csv = 1 };

inline constexpr auto kExportFormatMappings = std::array{
    std::pair<std::string_view, export_format_t>{"json", export_format_t::json},
    std::pair<std::string_view, export_format_t>{"csv", export_format_t::csv}};

static_assert(is_bijective(kExportFormatMappings));

template <>
inline std::optional<export_format_t> try_from_string<export_format_t>(
    const std::string_view value) {
  return find_enum(kExportFormatMappings, value);
}

inline constexpr std::string_view to_string(const export_format_t value) {
  return find_name(kExportFormatMappings, value, "unknown");
}

template <uint16_t Version>
struct compliance_report;

template <>
struct compliance_report<1> final {
  uint16_t version{1};
  std::string export_date;
  export_format_t format{export_format_t::json};
  uint64_t total_logs{};
  audit_chain_status_t chain_integrity;
  std::string file_hash;
};

using compliance_report_t = compliance_report<1>;

}  // namespace arkive::schema
