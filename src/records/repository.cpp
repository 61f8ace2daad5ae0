#include <arkive/common/error.hpp>
#include <arkive/records/repository.hpp>
#include <arkive/schema/primitives.hpp>

#include <spdlog/spdlog.h>

namespace arkive::records {

namespace {

using arkive::storage::sqlite::connection;
using arkive::storage::sqlite::statement;
using arkive::storage::sqlite::transaction;
using arkive::storage::sqlite::transaction_mode;

constexpr auto kUserColumns = std::string_view{
    "SELECT id, username, email, password_hash, created_at, last_login "
    "FROM users"};

constexpr auto kDocumentColumns = std::string_view{
    "SELECT d.id, d.user_id, d.name, d.file_path, d.file_type, d.file_size, "
    "d.category, d.tags, d.is_active, d.created_at, d.updated_at "
    "FROM documents d"};

std::string now_text() {
  return arkive::schema::format_timestamp(arkive::schema::now_milliseconds());
}

arkive::schema::user_t read_user(const statement& stmt) {
  auto user = arkive::schema::user_t{};
  user.id = stmt.column_text(0);
  user.username = stmt.column_text(1);
  user.email = stmt.column_text(2);
  user.password_hash = stmt.column_text(3);
  user.created_at = stmt.column_text(4);
  user.last_login = stmt.column_optional_text(5);
  return user;
}

std::vector<std::string> parse_tags(const std::string& text) {
  auto tags = std::vector<std::string>{};
  const auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (!parsed.is_array()) {
    spdlog::warn("Ignoring malformed document tags: {}", text);
    return tags;
  }
  for (const auto& tag : parsed) {
    if (tag.is_string()) {
      tags.push_back(tag.get<std::string>());
    }
  }
  return tags;
}

arkive::schema::document_t read_document(const statement& stmt) {
  auto document = arkive::schema::document_t{};
  document.id = stmt.column_text(0);
  document.user_id = stmt.column_text(1);
  document.name = stmt.column_text(2);
  document.file_path = stmt.column_text(3);
  document.file_type = stmt.column_text(4);
  document.file_size = stmt.column_int64(5);
  document.category = stmt.column_text(6);
  document.tags = parse_tags(stmt.column_text(7));
  document.is_active = stmt.column_bool(8);
  document.created_at = stmt.column_text(9);
  document.updated_at = stmt.column_text(10);
  return document;
}

arkive::schema::activity_t read_activity(const statement& stmt) {
  auto activity = arkive::schema::activity_t{};
  activity.id = stmt.column_text(0);
  activity.user_id = stmt.column_text(1);
  activity.action = stmt.column_text(2);
  activity.resource_type = stmt.column_text(3);
  activity.resource_id = stmt.column_text(4);
  activity.details = stmt.column_text(5);
  activity.created_at = stmt.column_text(6);
  return activity;
}

arkive::schema::document_content_t read_content(const statement& stmt) {
  auto content = arkive::schema::document_content_t{};
  content.document_id = stmt.column_text(0);
  content.extracted_text = stmt.column_text(1);
  content.document_type = stmt.column_text(2);
  content.fields = stmt.column_text(3);
  content.indexed_at = stmt.column_text(4);
  return content;
}

std::vector<arkive::schema::document_t> read_documents(statement& stmt) {
  auto documents = std::vector<arkive::schema::document_t>{};
  while (stmt.step()) {
    documents.push_back(read_document(stmt));
  }
  return documents;
}

// `text` as a LIKE pattern matching any string that contains it.
std::string contains_pattern(const std::string_view text) {
  auto pattern = std::string{"%"};
  for (const auto c : text) {
    if (c == '%' || c == '_' || c == '\\') {
      pattern += '\\';
    }
    pattern += c;
  }
  pattern += '%';
  return pattern;
}

}  // namespace

arkive::schema::user_t repository::create_user(
    const std::string_view username,
    const std::string_view email,
    const std::string_view password_hash) const {
  auto user = arkive::schema::user_t{};
  user.id = arkive::schema::make_uuid();
  user.username = std::string{username};
  user.email = std::string{email};
  user.password_hash = std::string{password_hash};
  user.created_at = now_text();
  store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            "INSERT INTO users (id, username, email, password_hash, "
            "created_at, last_login) VALUES (?, ?, ?, ?, ?, NULL);");
        stmt.bind(1, user.id)
            .bind(2, user.username)
            .bind(3, user.email)
            .bind(4, user.password_hash)
            .bind(5, user.created_at);
        stmt.run();
      },
      "create user");
  spdlog::info("Created user {} ({})", user.username, user.id);
  return user;
}

std::optional<arkive::schema::user_t> repository::find_user(
    const std::string_view id) const {
  return store_.execute(
      [&](connection& conn) -> std::optional<arkive::schema::user_t> {
        auto stmt = conn.prepare(std::string{kUserColumns} + " WHERE id = ?;");
        stmt.bind(1, id);
        if (!stmt.step()) {
          return std::nullopt;
        }
        return read_user(stmt);
      },
      "find user");
}

std::optional<arkive::schema::user_t> repository::find_user_by_username(
    const std::string_view username) const {
  return store_.execute(
      [&](connection& conn) -> std::optional<arkive::schema::user_t> {
        auto stmt =
            conn.prepare(std::string{kUserColumns} + " WHERE username = ?;");
        stmt.bind(1, username);
        if (!stmt.step()) {
          return std::nullopt;
        }
        return read_user(stmt);
      },
      "find user");
}

void repository::record_login(const std::string_view user_id) const {
  const auto changed = store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare("UPDATE users SET last_login = ? WHERE id = ?;");
        stmt.bind(1, now_text()).bind(2, user_id);
        stmt.run();
        return conn.changes();
      },
      "record login");
  if (changed == 0) {
    throw arkive::common::not_found_error{"user not found: " +
                                          std::string{user_id}};
  }
}

arkive::schema::document_t repository::create_document(
    arkive::schema::document_t document) const {
  if (document.id.empty()) {
    document.id = arkive::schema::make_uuid();
  }
  if (document.created_at.empty()) {
    document.created_at = now_text();
  }
  if (document.updated_at.empty()) {
    document.updated_at = document.created_at;
  }
  const auto tags = nlohmann::json(document.tags).dump();
  store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            "INSERT INTO documents (id, user_id, name, file_path, file_type, "
            "file_size, category, tags, is_active, created_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        stmt.bind(1, document.id)
            .bind(2, document.user_id)
            .bind(3, document.name)
            .bind(4, document.file_path)
            .bind(5, document.file_type)
            .bind(6, document.file_size)
            .bind(7, document.category)
            .bind(8, tags)
            .bind(9, document.is_active)
            .bind(10, document.created_at)
            .bind(11, document.updated_at);
        stmt.run();
      },
      "create document");
  return document;
}

std::optional<arkive::schema::document_t> repository::find_document(
    const std::string_view id) const {
  return store_.execute(
      [&](connection& conn) -> std::optional<arkive::schema::document_t> {
        auto stmt =
            conn.prepare(std::string{kDocumentColumns} + " WHERE d.id = ?;");
        stmt.bind(1, id);
        if (!stmt.step()) {
          return std::nullopt;
        }
        return read_document(stmt);
      },
      "find document");
}

std::vector<arkive::schema::document_t> repository::list_documents(
    const std::string_view user_id) const {
  return store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            std::string{kDocumentColumns} +
            " WHERE d.user_id = ? AND d.is_active = 1"
            " ORDER BY d.created_at DESC, d.id DESC;");
        stmt.bind(1, user_id);
        return read_documents(stmt);
      },
      "list documents");
}

void repository::soft_delete_document(const std::string_view id) const {
  const auto changed = store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            "UPDATE documents SET is_active = 0, updated_at = ? WHERE id = ?;");
        stmt.bind(1, now_text()).bind(2, id);
        stmt.run();
        return conn.changes();
      },
      "soft delete document");
  if (changed == 0) {
    throw arkive::common::not_found_error{"document not found: " +
                                          std::string{id}};
  }
}

void repository::delete_document(const std::string_view id) const {
  const auto changed = store_.execute(
      [&](connection& conn) {
        auto tx = transaction{conn, transaction_mode::immediate};
        auto content =
            conn.prepare("DELETE FROM document_contents WHERE document_id = ?;");
        content.bind(1, id);
        content.run();
        auto document = conn.prepare("DELETE FROM documents WHERE id = ?;");
        document.bind(1, id);
        document.run();
        const auto removed = conn.changes();
        tx.commit();
        return removed;
      },
      "delete document");
  if (changed == 0) {
    throw arkive::common::not_found_error{"document not found: " +
                                          std::string{id}};
  }
}

std::vector<arkive::schema::document_t> repository::search_documents(
    const std::string_view user_id,
    const std::string_view text) const {
  const auto pattern = contains_pattern(text);
  return store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            std::string{kDocumentColumns} +
            " LEFT JOIN document_contents c ON c.document_id = d.id"
            " WHERE d.user_id = ? AND d.is_active = 1 AND ("
            "d.name LIKE ?2 ESCAPE '\\' OR "
            "c.extracted_text LIKE ?2 ESCAPE '\\' OR "
            "c.fields LIKE ?2 ESCAPE '\\')"
            " ORDER BY d.created_at DESC, d.id DESC;");
        stmt.bind(1, user_id).bind(2, pattern);
        return read_documents(stmt);
      },
      "search documents");
}

arkive::schema::activity_t repository::create_activity(
    const std::string_view user_id,
    const std::string_view action,
    const std::string_view resource_type,
    const std::string_view resource_id,
    const std::string_view details) const {
  auto activity = arkive::schema::activity_t{};
  activity.id = arkive::schema::make_uuid();
  activity.user_id = std::string{user_id};
  activity.action = std::string{action};
  activity.resource_type = std::string{resource_type};
  activity.resource_id = std::string{resource_id};
  activity.details = std::string{details};
  activity.created_at = now_text();
  store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            "INSERT INTO activities (id, user_id, action, resource_type, "
            "resource_id, details, created_at) VALUES (?, ?, ?, ?, ?, ?, ?);");
        stmt.bind(1, activity.id)
            .bind(2, activity.user_id)
            .bind(3, activity.action)
            .bind(4, activity.resource_type)
            .bind(5, activity.resource_id)
            .bind(6, activity.details)
            .bind(7, activity.created_at);
        stmt.run();
      },
      "create activity");
  return activity;
}

std::vector<arkive::schema::activity_t> repository::recent_activities(
    const std::string_view user_id,
    const uint32_t limit) const {
  return store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            "SELECT id, user_id, action, resource_type, resource_id, details, "
            "created_at FROM activities WHERE user_id = ? "
            "ORDER BY created_at DESC, rowid DESC LIMIT ?;");
        stmt.bind(1, user_id).bind(2, static_cast<int64_t>(limit));
        auto activities = std::vector<arkive::schema::activity_t>{};
        while (stmt.step()) {
          activities.push_back(read_activity(stmt));
        }
        return activities;
      },
      "recent activities");
}

arkive::schema::user_stats_t repository::user_stats(
    const std::string_view user_id) const {
  const auto today = arkive::schema::range_start(now_text().substr(0, 10));
  return store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            "SELECT COUNT(*), "
            "COALESCE(SUM(CASE WHEN created_at >= ? THEN 1 ELSE 0 END), 0), "
            "COALESCE(SUM(file_size), 0), "
            "COALESCE(SUM(CASE WHEN is_active = 1 THEN 1 ELSE 0 END), 0) "
            "FROM documents WHERE user_id = ?;");
        stmt.bind(1, today).bind(2, user_id);
        auto stats = arkive::schema::user_stats_t{};
        if (stmt.step()) {
          stats.total_documents = stmt.column_int64(0);
          stats.uploads_today = stmt.column_int64(1);
          stats.total_size = stmt.column_int64(2);
          stats.active_documents = stmt.column_int64(3);
        }
        return stats;
      },
      "user stats");
}

arkive::schema::document_content_t repository::index(
    const std::string_view document_id,
    const std::string_view extracted_text,
    const std::string_view document_type,
    const nlohmann::json& fields) const {
  auto content = arkive::schema::document_content_t{};
  content.document_id = std::string{document_id};
  content.extracted_text = std::string{extracted_text};
  content.document_type = std::string{document_type};
  content.fields = fields.is_null() ? std::string{"{}"} : fields.dump();
  content.indexed_at = now_text();

  const auto found = store_.execute(
      [&](connection& conn) {
        auto tx = transaction{conn, transaction_mode::immediate};
        auto exists = conn.prepare("SELECT 1 FROM documents WHERE id = ?;");
        exists.bind(1, content.document_id);
        if (!exists.step()) {
          return false;
        }
        auto stmt = conn.prepare(
            "INSERT INTO document_contents (document_id, extracted_text, "
            "document_type, fields, indexed_at) VALUES (?, ?, ?, ?, ?) "
            "ON CONFLICT(document_id) DO UPDATE SET "
            "extracted_text = excluded.extracted_text, "
            "document_type = excluded.document_type, "
            "fields = excluded.fields, "
            "indexed_at = excluded.indexed_at;");
        stmt.bind(1, content.document_id)
            .bind(2, content.extracted_text)
            .bind(3, content.document_type)
            .bind(4, content.fields)
            .bind(5, content.indexed_at);
        stmt.run();
        tx.commit();
        return true;
      },
      "index document");
  if (!found) {
    throw arkive::common::not_found_error{"document not found: " +
                                          content.document_id};
  }
  spdlog::debug("Indexed document {} as {}", content.document_id,
                content.document_type);
  return content;
}

std::optional<arkive::schema::document_content_t> repository::find_content(
    const std::string_view document_id) const {
  return store_.execute(
      [&](connection& conn)
          -> std::optional<arkive::schema::document_content_t> {
        auto stmt = conn.prepare(
            "SELECT document_id, extracted_text, document_type, fields, "
            "indexed_at FROM document_contents WHERE document_id = ?;");
        stmt.bind(1, document_id);
        if (!stmt.step()) {
          return std::nullopt;
        }
        return read_content(stmt);
      },
      "find content");
}

}  // namespace arkive::records
