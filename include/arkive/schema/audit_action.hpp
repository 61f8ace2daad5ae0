#pragma once

#include <arkive/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit action.
// Security-relevant verbs recorded by the audit trail. The persisted form is
// the upper-case name, which is also what the chain digest covers.
namespace arkive::schema {

enum class audit_action_t : uint8_t {
  login = 1,
  login_failed = 2,
  logout = 3,
  register_user = 4,
  upload = 5,
  download = 6,
  view = 7,
  search = 8,
  index = 9,
  document_create = 10,
  document_delete = 11,
  export_audit = 12,
  backup_create = 13,
  backup_restore = 14,
  verify_chain = 15,
};

inline constexpr auto kAuditActionMappings = std::array{
    std::pair<std::string_view, audit_action_t>{"LOGIN", audit_action_t::login},
    std::pair<std::string_view, audit_action_t>{"LOGIN_FAILED",
                                                audit_action_t::login_failed},
    std::pair<std::string_view, audit_action_t>{"LOGOUT",
                                                audit_action_t::logout},
    std::pair<std::string_view, audit_action_t>{"REGISTER",
                                                audit_action_t::register_user},
    std::pair<std::string_view, audit_action_t>{"UPLOAD",
                                                audit_action_t::upload},
    std::pair<std::string_view, audit_action_t>{"DOWNLOAD",
                                                audit_action_t::download},
    std::pair<std::string_view, audit_action_t>{"VIEW", audit_action_t::view},
    std::pair<std::string_view, audit_action_t>{"SEARCH",
                                                audit_action_t::search},
    std::pair<std::string_view, audit_action_t>{"INDEX",
                                                audit_action_t::index},
    std::pair<std::string_view, audit_action_t>{
        "DOCUMENT_CREATE", audit_action_t::document_create},
    std::pair<std::string_view, audit_action_t>{
        "DOCUMENT_DELETE", audit_action_t::document_delete},
    std::pair<std::string_view, audit_action_t>{"EXPORT_AUDIT",
                                                audit_action_t::export_audit},
    std::pair<std::string_view, audit_action_t>{"BACKUP_CREATE",
                                                audit_action_t::backup_create},
    std::pair<std::string_view, audit_action_t>{
        "BACKUP_RESTORE", audit_action_t::backup_restore},
    std::pair<std::string_view, audit_action_t>{"VERIFY_CHAIN",
                                                audit_action_t::verify_chain}};

static_assert(is_bijective(kAuditActionMappings));

template <>
inline std::optional<audit_action_t> try_from_string<audit_action_t>(
    const std::string_view value) {
  return find_enum(kAuditActionMappings, value);
}

inline constexpr std::string_view to_string(const audit_action_t value) {
  return find_name(kAuditActionMappings, value, "UNKNOWN");
}

}  // namespace arkive::schema
