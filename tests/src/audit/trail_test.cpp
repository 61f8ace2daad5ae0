#include <gtest/gtest.h>
#include <arkive/audit/trail.hpp>
#include <arkive/common/error.hpp>
#include <arkive/crypto/hash.hpp>
#include <arkive/testing/common.hpp>

#include <sstream>

namespace {

using arkive::schema::audit_action_t;

const auto kAlice = arkive::schema::actor_t{"user-alice", "alice"};
const auto kBob = arkive::schema::actor_t{"user-bob", "bob"};

arkive::schema::resource_ref_t auth() {
  return arkive::schema::resource_ref_t{"auth", std::nullopt, std::nullopt};
}

arkive::schema::resource_ref_t document(const std::string& id) {
  return arkive::schema::resource_ref_t{"document", id, id + ".pdf"};
}

void append_logins(const arkive::audit::trail& trail, const int count) {
  for (auto i = 0; i < count; ++i) {
    trail.append(kAlice, audit_action_t::login, auth(),
                 nlohmann::json{{"attempt", i}}, true);
  }
}

std::string today() {
  return arkive::schema::format_timestamp(arkive::schema::now_milliseconds())
      .substr(0, 10);
}

}  // namespace

TEST(audit_trail, empty_chain_is_valid) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};

  const auto result = trail.verify_chain();
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.entries_checked, 0u);
  EXPECT_FALSE(result.failed_sequence_id.has_value());

  const auto status = trail.chain_status();
  EXPECT_TRUE(status.is_valid);
  EXPECT_EQ(status.total_logs, 0u);
  EXPECT_FALSE(status.first_log_date.has_value());
}

TEST(audit_trail, append_links_entries) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};

  const auto first = trail.append(kAlice, audit_action_t::login, auth(),
                                  nlohmann::json::object(), true,
                                  {std::string{"10.0.0.1"}, std::nullopt});
  const auto second =
      trail.append(kAlice, audit_action_t::upload, document("d1"),
                   nlohmann::json{{"size", 1024}}, true,
                   {std::nullopt, std::string(64, 'e')});

  EXPECT_EQ(first.sequence_id, 1u);
  EXPECT_EQ(first.previous_hash, arkive::schema::zero_hash_hex());
  EXPECT_EQ(first.current_hash, arkive::audit::compute_entry_hash(first));
  EXPECT_TRUE(arkive::schema::is_hash_hex(first.current_hash));
  EXPECT_EQ(first.action, "LOGIN");
  EXPECT_EQ(first.ip_address, std::optional<std::string>{"10.0.0.1"});

  EXPECT_EQ(second.sequence_id, 2u);
  EXPECT_EQ(second.previous_hash, first.current_hash);
  EXPECT_EQ(second.metadata, R"({"size":1024})");
  EXPECT_EQ(second.resource_name, std::optional<std::string>{"d1.pdf"});
  EXPECT_NE(first.id, second.id);
  EXPECT_LE(first.timestamp, second.timestamp);
}

TEST(audit_trail, stored_entries_match_returned_entries) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};

  const auto written = trail.append(kBob, audit_action_t::download,
                                    document("d9"), nlohmann::json{}, false);
  const auto stored = trail.query({});
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].id, written.id);
  EXPECT_EQ(stored[0].metadata, "{}");
  EXPECT_FALSE(stored[0].is_success);
  EXPECT_FALSE(stored[0].ip_address.has_value());
  EXPECT_EQ(stored[0].current_hash, written.current_hash);
}

TEST(audit_trail, entry_hash_covers_content_but_not_sequence) {
  auto entry = arkive::schema::audit_entry_t{};
  entry.id = "id";
  entry.user_id = "u";
  entry.username = "n";
  entry.action = "LOGIN";
  entry.resource_type = "auth";
  entry.timestamp = "2024-01-01T00:00:00.000Z";
  entry.previous_hash = arkive::schema::zero_hash_hex();
  const auto base = arkive::audit::compute_entry_hash(entry);

  auto resequenced = entry;
  resequenced.sequence_id = 99;
  EXPECT_EQ(arkive::audit::compute_entry_hash(resequenced), base);

  auto failed = entry;
  failed.is_success = false;
  EXPECT_NE(arkive::audit::compute_entry_hash(failed), base);

  // An absent field must not hash like an empty one.
  auto empty_resource = entry;
  empty_resource.resource_id = std::string{};
  EXPECT_NE(arkive::audit::compute_entry_hash(empty_resource), base);

  auto relinked = entry;
  relinked.previous_hash = std::string(64, '1');
  EXPECT_NE(arkive::audit::compute_entry_hash(relinked), base);
}

TEST(audit_trail, login_scenario_verifies_and_filters) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};

  trail.append(kAlice, audit_action_t::login, auth(), {}, true);
  trail.append(kBob, audit_action_t::login_failed, auth(),
               nlohmann::json{{"reason", "bad password"}}, false);
  trail.append(kAlice, audit_action_t::upload, document("d1"), {}, true);

  const auto result = trail.verify_chain();
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.entries_checked, 3u);

  auto failures = arkive::schema::audit_filter_t{};
  failures.action = "LOGIN_FAILED";
  const auto failed = trail.query(failures);
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].username, "bob");
  EXPECT_FALSE(failed[0].is_success);

  auto by_alice = arkive::schema::audit_filter_t{};
  by_alice.user_id = kAlice.user_id;
  EXPECT_EQ(trail.count(by_alice), 2u);

  auto by_resource = arkive::schema::audit_filter_t{};
  by_resource.resource_type = "document";
  by_resource.resource_id = "d1";
  EXPECT_EQ(trail.query(by_resource).size(), 1u);
}

TEST(audit_trail, query_orders_by_sequence) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 4);

  const auto newest_first = trail.query({});
  ASSERT_EQ(newest_first.size(), 4u);
  EXPECT_EQ(newest_first.front().sequence_id, 4u);

  auto ascending = arkive::schema::audit_filter_t{};
  ascending.order = arkive::schema::sort_order_t::ascending;
  ascending.limit = 2;
  ascending.offset = 1;
  const auto window = trail.query(ascending);
  ASSERT_EQ(window.size(), 2u);
  EXPECT_EQ(window[0].sequence_id, 2u);
  EXPECT_EQ(window[1].sequence_id, 3u);

  auto offset_only = arkive::schema::audit_filter_t{};
  offset_only.offset = 3;
  EXPECT_EQ(trail.query(offset_only).size(), 1u);
}

TEST(audit_trail, date_filters_use_inclusive_day_bounds) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 3);

  auto same_day = arkive::schema::audit_filter_t{};
  same_day.start_date = today();
  same_day.end_date = today();
  EXPECT_EQ(trail.count(same_day), 3u);

  auto future = arkive::schema::audit_filter_t{};
  future.start_date = "2999-01-01";
  EXPECT_EQ(trail.count(future), 0u);

  auto past = arkive::schema::audit_filter_t{};
  past.end_date = "2000-01-01";
  EXPECT_EQ(trail.count(past), 0u);

  auto recent = arkive::schema::audit_filter_t{};
  recent.days_back = 1;
  EXPECT_EQ(trail.count(recent), 3u);
}

TEST(audit_trail, second_precision_bounds_include_the_whole_second) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  const auto entry = trail.append(kAlice, audit_action_t::login, auth(),
                                  nlohmann::json::object(), true);
  const auto second = entry.timestamp.substr(0, 19);

  auto from = arkive::schema::audit_filter_t{};
  from.start_date = second + "Z";
  EXPECT_EQ(trail.count(from), 1u);

  auto to = arkive::schema::audit_filter_t{};
  to.end_date = second + "+00:00";
  EXPECT_EQ(trail.count(to), 1u);

  auto exact = arkive::schema::audit_filter_t{};
  exact.start_date = second;
  exact.end_date = second;
  EXPECT_EQ(trail.query(exact).size(), 1u);
}

TEST(audit_trail, malformed_date_bound_is_rejected) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 1);

  auto filter = arkive::schema::audit_filter_t{};
  filter.start_date = "last tuesday";
  EXPECT_THROW(trail.query(filter), arkive::common::validation_error);
}

TEST(audit_trail, pages_report_totals) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 7);

  const auto first = trail.query_page({}, 1, 3);
  EXPECT_EQ(first.total, 7u);
  EXPECT_EQ(first.total_pages, 3u);
  EXPECT_EQ(first.entries.size(), 3u);
  EXPECT_TRUE(first.has_next);
  EXPECT_FALSE(first.has_previous);
  EXPECT_EQ(first.entries.front().sequence_id, 7u);

  const auto last = trail.query_page({}, 3, 3);
  EXPECT_EQ(last.entries.size(), 1u);
  EXPECT_FALSE(last.has_next);
  EXPECT_TRUE(last.has_previous);
  EXPECT_EQ(last.entries.front().sequence_id, 1u);

  const auto clamped = trail.query_page({}, 0, 0);
  EXPECT_EQ(clamped.page, 1u);
  EXPECT_EQ(clamped.entries.size(), 1u);
  EXPECT_EQ(clamped.total_pages, 7u);
}

TEST(audit_trail, modified_entry_breaks_the_chain) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 5);

  arkive::testing::raw_exec(
      fixture.db_path(),
      "DROP TRIGGER audit_logs_no_update;"
      "UPDATE audit_logs SET metadata = '{\"attempt\":42}' "
      "WHERE sequence_id = 3;");

  const auto result = trail.verify_chain();
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.failed_sequence_id, std::optional<uint64_t>{3});
  EXPECT_EQ(result.entries_checked, 2u);

  const auto status = trail.chain_status();
  EXPECT_FALSE(status.is_valid);
  EXPECT_EQ(status.total_logs, 5u);
}

TEST(audit_trail, relinked_entry_breaks_the_chain) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 4);

  arkive::testing::raw_exec(
      fixture.db_path(),
      "DROP TRIGGER audit_logs_no_update;"
      "UPDATE audit_logs SET previous_hash = '" + std::string(64, 'b') +
          "' WHERE sequence_id = 4;");

  const auto result = trail.verify_chain();
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.failed_sequence_id, std::optional<uint64_t>{4});
}

TEST(audit_trail, deleted_entry_leaves_a_detected_gap) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 4);

  arkive::testing::raw_exec(fixture.db_path(),
                            "DROP TRIGGER audit_logs_no_delete;"
                            "DELETE FROM audit_logs WHERE sequence_id = 2;");

  const auto result = trail.verify_chain();
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.failed_sequence_id, std::optional<uint64_t>{3});
  EXPECT_NE(result.error.find("sequence gap"), std::string::npos);
}

TEST(audit_trail, triggers_keep_the_chain_intact) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 2);

  EXPECT_THROW(arkive::testing::raw_exec(
                   fixture.db_path(),
                   "UPDATE audit_logs SET username = 'mallory';"),
               arkive::common::sqlite_error);
  EXPECT_THROW(arkive::testing::raw_exec(fixture.db_path(),
                                         "DELETE FROM audit_logs;"),
               arkive::common::sqlite_error);
  EXPECT_TRUE(trail.verify_chain().ok);
}

TEST(audit_trail, append_on_read_only_store_records_nothing) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  append_logins(arkive::audit::trail{fixture.storage()}, 1);

  auto options = arkive::testing::fast_options();
  options.mode = arkive::storage::open_mode::read_only;
  auto reader =
      arkive::storage::make_storage<arkive::storage::sqlite_storage_tag>(
          fixture.db_path(), options);
  const auto trail = arkive::audit::trail{reader};

  EXPECT_THROW(trail.append(kAlice, audit_action_t::logout, auth(), {}, true),
               arkive::common::audit_write_error);
  EXPECT_EQ(trail.count({}), 1u);
}

TEST(audit_trail, json_export_is_hashed_and_complete) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 3);

  const auto output = fixture.root() / "exports" / "audit.json";
  const auto report = trail.export_entries(
      {}, arkive::schema::export_format_t::json, output);

  EXPECT_EQ(report.total_logs, 3u);
  EXPECT_TRUE(report.chain_integrity.is_valid);
  EXPECT_EQ(report.file_hash,
            arkive::schema::to_hex(arkive::crypto::sha256_file(output)));

  const auto document = nlohmann::json::parse(arkive::testing::read_file(output));
  EXPECT_EQ(document.at("total_logs"), 3);
  EXPECT_EQ(document.at("logs").size(), 3u);
  EXPECT_TRUE(document.at("chain_integrity").at("is_valid").get<bool>());
  EXPECT_EQ(document.at("logs").at(0).at("metadata").at("attempt"), 2);
}

TEST(audit_trail, csv_export_escapes_fields) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  trail.append(kAlice, audit_action_t::search, {"search", std::nullopt,
                                                std::string{"a, \"b\""}},
               nlohmann::json{{"q", "x"}}, true);
  trail.append(kAlice, audit_action_t::logout, auth(), {}, true);

  const auto output = fixture.root() / "audit.csv";
  auto filter = arkive::schema::audit_filter_t{};
  filter.action = "SEARCH";
  const auto report = trail.export_entries(
      filter, arkive::schema::export_format_t::csv, output);
  EXPECT_EQ(report.total_logs, 1u);
  EXPECT_EQ(report.file_hash,
            arkive::schema::to_hex(arkive::crypto::sha256_file(output)));

  auto lines = std::istringstream{arkive::testing::read_file(output)};
  auto header = std::string{};
  auto row = std::string{};
  ASSERT_TRUE(std::getline(lines, header));
  ASSERT_TRUE(std::getline(lines, row));
  EXPECT_EQ(header.rfind("sequence_id,id,timestamp", 0), 0u);
  EXPECT_NE(row.find("\"a, \"\"b\"\"\""), std::string::npos);
  EXPECT_NE(row.find("\"{\"\"q\"\":\"\"x\"\"}\""), std::string::npos);
  auto extra = std::string{};
  EXPECT_FALSE(std::getline(lines, extra));
}

TEST(audit_trail, export_into_unwritable_location_raises_io_error) {
  auto fixture = arkive::testing::store_fixture{"arkive_audit"};
  const auto trail = arkive::audit::trail{fixture.storage()};
  append_logins(trail, 1);
  arkive::testing::write_file(fixture.root() / "blocker", "plain file");

  EXPECT_THROW(trail.export_entries({}, arkive::schema::export_format_t::json,
                                    fixture.root() / "blocker" / "audit.json"),
               arkive::common::io_error);
}

TEST(audit_trail, entry_json_carries_parsed_metadata) {
  auto entry = arkive::schema::audit_entry_t{};
  entry.sequence_id = 7;
  entry.metadata = R"({"k":[1,2]})";
  const auto json = arkive::audit::to_json(entry);
  EXPECT_EQ(json.at("sequence_id"), 7);
  EXPECT_TRUE(json.at("metadata").is_object());
  EXPECT_TRUE(json.at("resource_id").is_null());
}
