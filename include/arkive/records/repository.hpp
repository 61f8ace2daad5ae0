#pragma once
#include <nlohmann/json.hpp>
#include <arkive/schema/activity.hpp>
#include <arkive/schema/document.hpp>
#include <arkive/schema/document_content.hpp>
#include <arkive/schema/user.hpp>
#include <arkive/schema/user_stats.hpp>
#include <arkive/storage/sqlite/storage.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace arkive::records {

using storage_t = arkive::storage::sqlite_storage_t;

// Business records read and written by the surrounding application:
// users, documents, the activity feed and document search content.
// Every call goes through the store's contention policy.
class repository final {
 public:
  explicit repository(const storage_t& store) : store_{store} {}

  arkive::schema::user_t create_user(std::string_view username,
                                     std::string_view email,
                                     std::string_view password_hash) const;
  std::optional<arkive::schema::user_t> find_user(std::string_view id) const;
  std::optional<arkive::schema::user_t> find_user_by_username(
      std::string_view username) const;
  void record_login(std::string_view user_id) const;

  // Assigns `id`, `created_at` and `updated_at` when they are empty.
  arkive::schema::document_t create_document(
      arkive::schema::document_t document) const;
  std::optional<arkive::schema::document_t> find_document(
      std::string_view id) const;
  std::vector<arkive::schema::document_t> list_documents(
      std::string_view user_id) const;
  void soft_delete_document(std::string_view id) const;
  void delete_document(std::string_view id) const;
  // Active documents whose name, extracted text or fields contain `text`.
  std::vector<arkive::schema::document_t> search_documents(
      std::string_view user_id,
      std::string_view text) const;

  arkive::schema::activity_t create_activity(std::string_view user_id,
                                             std::string_view action,
                                             std::string_view resource_type,
                                             std::string_view resource_id,
                                             std::string_view details) const;
  std::vector<arkive::schema::activity_t> recent_activities(
      std::string_view user_id,
      uint32_t limit) const;

  arkive::schema::user_stats_t user_stats(std::string_view user_id) const;

  // Insert or replace the search content of `document_id`. Running it
  // again with the same input leaves a single, identical row.
  arkive::schema::document_content_t index(std::string_view document_id,
                                           std::string_view extracted_text,
                                           std::string_view document_type,
                                           const nlohmann::json& fields) const;
  std::optional<arkive::schema::document_content_t> find_content(
      std::string_view document_id) const;

 private:
  const storage_t& store_;
};

}  // namespace arkive::records
