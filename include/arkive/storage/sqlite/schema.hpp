#pragma once
#include <arkive/storage/sqlite/connection.hpp>
#include <array>
#include <cstdint>
#include <string_view>

namespace arkive::storage::sqlite {

inline constexpr auto kSchemaVersion = int64_t{1};

inline constexpr auto kRequiredTables = std::array<std::string_view, 5>{
    "users", "documents", "activities", "audit_logs", "document_contents"};

inline constexpr auto kAuditTriggers = std::array<std::string_view, 2>{
    "audit_logs_no_update", "audit_logs_no_delete"};

// Create every table, index and trigger that is missing. Must run inside a
// write transaction.
void apply_schema(const connection& conn);

}  // namespace arkive::storage::sqlite
