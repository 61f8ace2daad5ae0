#pragma once
#include <nlohmann/json.hpp>
#include <arkive/schema/audit_action.hpp>
#include <arkive/schema/audit_chain_status.hpp>
#include <arkive/schema/audit_entry.hpp>
#include <arkive/schema/audit_filter.hpp>
#include <arkive/schema/audit_page.hpp>
#include <arkive/schema/compliance_report.hpp>
#include <arkive/storage/sqlite/storage.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace arkive::audit {

using storage_t = arkive::storage::sqlite_storage_t;

/// BLAKE3 of the SCALE encoding of every field except `sequence_id` and
/// `current_hash`, as 64 lowercase hex characters.
std::string compute_entry_hash(const arkive::schema::audit_entry_t& entry);

nlohmann::json to_json(const arkive::schema::audit_entry_t& entry);
nlohmann::json to_json(const arkive::schema::audit_chain_status_t& status);

/// Append-only, hash-chained log of security-relevant actions.
///
/// Each entry's `previous_hash` is the `current_hash` of the entry before
/// it (or 64 zeros for the first one). Rows are protected against UPDATE
/// and DELETE by store triggers, so the only mutation is `append`.
class trail final {
 public:
  explicit trail(const storage_t& store) : store_{store} {}

  /// Record one action atomically. Raises `audit_write_error` when the
  /// entry could not be committed; in that case nothing was recorded.
  arkive::schema::audit_entry_t append(
      const arkive::schema::actor_t& actor,
      arkive::schema::audit_action_t action,
      const arkive::schema::resource_ref_t& resource,
      const nlohmann::json& metadata,
      bool is_success,
      const arkive::schema::audit_context_t& context = {}) const;

  /// Full scan in sequence order. Stops at the first violation.
  arkive::schema::chain_verification_t verify_chain() const;

  arkive::schema::audit_chain_status_t chain_status() const;

  std::vector<arkive::schema::audit_entry_t> query(
      const arkive::schema::audit_filter_t& filter) const;

  /// Number of entries matching `filter`, ignoring limit and offset.
  uint64_t count(const arkive::schema::audit_filter_t& filter) const;

  /// `page` is 1-based.
  arkive::schema::audit_page_t query_page(
      const arkive::schema::audit_filter_t& filter,
      uint32_t page,
      uint32_t page_size) const;

  arkive::schema::compliance_report_t export_entries(
      const arkive::schema::audit_filter_t& filter,
      arkive::schema::export_format_t format,
      const std::filesystem::path& output_path) const;

 private:
  const storage_t& store_;
};

}  // namespace arkive::audit
