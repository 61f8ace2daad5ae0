#include <gtest/gtest.h>
#include <arkive/common/error.hpp>
#include <arkive/records/repository.hpp>
#include <arkive/testing/common.hpp>

namespace {

arkive::schema::document_t make_document(const std::string& user_id,
                                         const std::string& name,
                                         const std::string& created_at,
                                         const int64_t size) {
  auto document = arkive::schema::document_t{};
  document.user_id = user_id;
  document.name = name;
  document.file_path = "uploads/" + name;
  document.file_type = "application/pdf";
  document.file_size = size;
  document.tags = {"tax", "2024"};
  document.created_at = created_at;
  return document;
}

}  // namespace

TEST(records, users_are_created_and_found) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};

  const auto user = repo.create_user("alice", "alice@example.com", "$2b$hash");
  EXPECT_EQ(user.id.size(), 36u);
  EXPECT_FALSE(user.last_login.has_value());

  const auto by_id = repo.find_user(user.id);
  ASSERT_TRUE(by_id.has_value());
  EXPECT_EQ(by_id->email, "alice@example.com");
  EXPECT_EQ(by_id->password_hash, "$2b$hash");

  const auto by_name = repo.find_user_by_username("alice");
  ASSERT_TRUE(by_name.has_value());
  EXPECT_EQ(by_name->id, user.id);
  EXPECT_FALSE(repo.find_user_by_username("nobody").has_value());
}

TEST(records, duplicate_email_is_rejected) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  repo.create_user("alice", "shared@example.com", "h");

  try {
    repo.create_user("alice2", "shared@example.com", "h");
    FAIL() << "expected sqlite_error";
  } catch (const arkive::common::sqlite_error& ex) {
    EXPECT_EQ(ex.primary_code(), SQLITE_CONSTRAINT);
  }
}

TEST(records, record_login_stamps_last_login) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  const auto user = repo.create_user("bob", "bob@example.com", "h");

  repo.record_login(user.id);
  const auto found = repo.find_user(user.id);
  ASSERT_TRUE(found.has_value());
  ASSERT_TRUE(found->last_login.has_value());
  EXPECT_GE(*found->last_login, user.created_at);

  EXPECT_THROW(repo.record_login("missing"), arkive::common::not_found_error);
}

TEST(records, documents_list_newest_first_and_hide_soft_deleted) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  const auto user = repo.create_user("carol", "carol@example.com", "h");

  const auto older = repo.create_document(
      make_document(user.id, "old.pdf", "2024-01-01T00:00:00.000Z", 10));
  const auto newer = repo.create_document(
      make_document(user.id, "new.pdf", "2024-02-01T00:00:00.000Z", 20));
  EXPECT_EQ(older.updated_at, older.created_at);

  auto listed = repo.list_documents(user.id);
  ASSERT_EQ(listed.size(), 2u);
  EXPECT_EQ(listed[0].id, newer.id);
  EXPECT_EQ(listed[1].tags, (std::vector<std::string>{"tax", "2024"}));
  EXPECT_EQ(listed[1].category, "General");

  repo.soft_delete_document(older.id);
  listed = repo.list_documents(user.id);
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0].id, newer.id);

  const auto hidden = repo.find_document(older.id);
  ASSERT_TRUE(hidden.has_value());
  EXPECT_FALSE(hidden->is_active);
}

TEST(records, document_owner_must_exist) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  EXPECT_THROW(repo.create_document(make_document(
                   "ghost", "x.pdf", "2024-01-01T00:00:00.000Z", 1)),
               arkive::common::sqlite_error);
}

TEST(records, hard_delete_removes_search_content) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  const auto user = repo.create_user("dave", "dave@example.com", "h");
  const auto document = repo.create_document(
      make_document(user.id, "w2.pdf", "2024-01-01T00:00:00.000Z", 5));
  repo.index(document.id, "wages", "W2", nlohmann::json{{"employer", "ACME"}});

  repo.delete_document(document.id);
  EXPECT_FALSE(repo.find_document(document.id).has_value());
  EXPECT_FALSE(repo.find_content(document.id).has_value());
  EXPECT_THROW(repo.delete_document(document.id),
               arkive::common::not_found_error);
}

TEST(records, index_is_idempotent) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  const auto user = repo.create_user("erin", "erin@example.com", "h");
  const auto document = repo.create_document(
      make_document(user.id, "1099.pdf", "2024-01-01T00:00:00.000Z", 5));
  const auto fields = nlohmann::json{{"payer", "Bank"}, {"amount", 12.5}};

  repo.index(document.id, "interest income", "1099-INT", fields);
  repo.index(document.id, "interest income", "1099-INT", fields);

  const auto count = fixture.storage().execute(
      [](arkive::storage::sqlite::connection& conn) {
        auto stmt = conn.prepare("SELECT COUNT(*) FROM document_contents;");
        return stmt.step() ? stmt.column_int64(0) : int64_t{0};
      },
      "test count");
  EXPECT_EQ(count, 1);

  const auto content = repo.find_content(document.id);
  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(content->extracted_text, "interest income");
  EXPECT_EQ(content->document_type, "1099-INT");
  EXPECT_EQ(nlohmann::json::parse(content->fields), fields);

  repo.index(document.id, "corrected", "1099-INT", nlohmann::json{});
  const auto replaced = repo.find_content(document.id);
  ASSERT_TRUE(replaced.has_value());
  EXPECT_EQ(replaced->extracted_text, "corrected");
  EXPECT_EQ(replaced->fields, "{}");
}

TEST(records, index_of_unknown_document_is_not_found) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  EXPECT_THROW(repo.index("missing", "text", "type", nlohmann::json{}),
               arkive::common::not_found_error);
}

TEST(records, search_matches_names_and_content) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  const auto user = repo.create_user("fay", "fay@example.com", "h");
  const auto receipt = repo.create_document(
      make_document(user.id, "receipt.pdf", "2024-01-01T00:00:00.000Z", 1));
  const auto statement = repo.create_document(
      make_document(user.id, "statement.pdf", "2024-01-02T00:00:00.000Z", 1));
  repo.index(statement.id, "Total due 100%", "statement",
             nlohmann::json{{"bank", "Northwind"}});

  EXPECT_EQ(repo.search_documents(user.id, "receipt").size(), 1u);
  EXPECT_EQ(repo.search_documents(user.id, "Northwind").size(), 1u);
  EXPECT_EQ(repo.search_documents(user.id, ".pdf").size(), 2u);

  // LIKE wildcards in the input are literal.
  const auto percent = repo.search_documents(user.id, "100%");
  ASSERT_EQ(percent.size(), 1u);
  EXPECT_EQ(percent[0].id, statement.id);
  EXPECT_TRUE(repo.search_documents(user.id, "_%").empty());

  repo.soft_delete_document(receipt.id);
  EXPECT_TRUE(repo.search_documents(user.id, "receipt").empty());
}

TEST(records, activities_are_listed_newest_first) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  const auto user = repo.create_user("gus", "gus@example.com", "h");

  for (auto i = 0; i < 5; ++i) {
    repo.create_activity(user.id, "upload", "document", std::to_string(i),
                         "uploaded " + std::to_string(i));
  }
  const auto recent = repo.recent_activities(user.id, 3);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent[0].resource_id, "4");
  EXPECT_EQ(recent[2].resource_id, "2");
}

TEST(records, user_stats_count_documents) {
  auto fixture = arkive::testing::store_fixture{"arkive_records"};
  const auto repo = arkive::records::repository{fixture.storage()};
  const auto user = repo.create_user("hal", "hal@example.com", "h");

  auto today = make_document(user.id, "today.pdf", "", 100);
  repo.create_document(today);
  const auto old = repo.create_document(
      make_document(user.id, "old.pdf", "2020-01-01T00:00:00.000Z", 50));
  repo.soft_delete_document(old.id);

  const auto stats = repo.user_stats(user.id);
  EXPECT_EQ(stats.total_documents, 2);
  EXPECT_EQ(stats.uploads_today, 1);
  EXPECT_EQ(stats.total_size, 150);
  EXPECT_EQ(stats.active_documents, 1);
}
