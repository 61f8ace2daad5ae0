#include <arkive/audit/trail.hpp>
#include <arkive/common/error.hpp>
#include <arkive/crypto/hash.hpp>
#include <arkive/schema/encoding/scale/encoder.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <tuple>
#include <variant>

namespace arkive::audit {

namespace {

using arkive::schema::audit_entry_t;
using arkive::schema::audit_filter_t;
using arkive::storage::sqlite::connection;
using arkive::storage::sqlite::statement;
using arkive::storage::sqlite::transaction;
using arkive::storage::sqlite::transaction_mode;

using encoder_t = arkive::schema::encoding::encoder<
    arkive::schema::encoding::scale_encoder_tag>;

constexpr auto kMillisecondsPerDay = uint64_t{86'400'000};

constexpr auto kEntryColumns = std::string_view{
    "sequence_id, id, user_id, username, action, resource_type, resource_id, "
    "resource_name, ip_address, file_hash, metadata, timestamp, is_success, "
    "previous_hash, current_hash"};

audit_entry_t read_entry(const statement& stmt) {
  auto entry = audit_entry_t{};
  entry.sequence_id = static_cast<uint64_t>(stmt.column_int64(0));
  entry.id = stmt.column_text(1);
  entry.user_id = stmt.column_text(2);
  entry.username = stmt.column_text(3);
  entry.action = stmt.column_text(4);
  entry.resource_type = stmt.column_text(5);
  entry.resource_id = stmt.column_optional_text(6);
  entry.resource_name = stmt.column_optional_text(7);
  entry.ip_address = stmt.column_optional_text(8);
  entry.file_hash = stmt.column_optional_text(9);
  entry.metadata = stmt.column_text(10);
  entry.timestamp = stmt.column_text(11);
  entry.is_success = stmt.column_bool(12);
  entry.previous_hash = stmt.column_text(13);
  entry.current_hash = stmt.column_text(14);
  return entry;
}

using parameter_t = std::variant<std::string, int64_t>;

struct where_clause final {
  std::string sql;
  std::vector<parameter_t> parameters;
};

where_clause make_where(const audit_filter_t& filter) {
  auto clause = where_clause{};
  auto add = [&](const std::string_view condition, parameter_t value) {
    clause.sql += clause.sql.empty() ? " WHERE " : " AND ";
    clause.sql += condition;
    clause.parameters.push_back(std::move(value));
  };
  if (filter.user_id) {
    add("user_id = ?", *filter.user_id);
  }
  if (filter.action) {
    add("action = ?", *filter.action);
  }
  if (filter.resource_type) {
    add("resource_type = ?", *filter.resource_type);
  }
  if (filter.resource_id) {
    add("resource_id = ?", *filter.resource_id);
  }
  if (filter.start_date) {
    add("timestamp >= ?", arkive::schema::range_start(*filter.start_date));
  } else if (filter.days_back) {
    const auto now = arkive::schema::now_milliseconds();
    const auto span = kMillisecondsPerDay * *filter.days_back;
    add("timestamp >= ?",
        arkive::schema::format_timestamp(now > span ? now - span : 0));
  }
  if (filter.end_date) {
    add("timestamp <= ?", arkive::schema::range_end(*filter.end_date));
  }
  return clause;
}

void bind_parameters(statement& stmt,
                     const std::vector<parameter_t>& parameters) {
  auto index = 1;
  for (const auto& parameter : parameters) {
    std::visit([&](const auto& value) { stmt.bind(index, value); }, parameter);
    ++index;
  }
}

uint64_t count_matching(const connection& conn, const where_clause& where) {
  auto stmt = conn.prepare("SELECT COUNT(*) FROM audit_logs" + where.sql + ";");
  bind_parameters(stmt, where.parameters);
  return stmt.step() ? static_cast<uint64_t>(stmt.column_int64(0)) : 0;
}

std::string csv_field(const std::string_view value) {
  if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string{value};
  }
  auto quoted = std::string{"\""};
  for (const auto c : value) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void write_json(std::ostream& out,
                const std::vector<audit_entry_t>& entries,
                const arkive::schema::compliance_report_t& report) {
  auto logs = nlohmann::json::array();
  for (const auto& entry : entries) {
    logs.push_back(to_json(entry));
  }
  auto document = nlohmann::json{
      {"export_date", report.export_date},
      {"total_logs", report.total_logs},
      {"chain_integrity", to_json(report.chain_integrity)},
      {"logs", std::move(logs)}};
  out << document.dump(2) << '\n';
}

void write_csv(std::ostream& out, const std::vector<audit_entry_t>& entries) {
  out << "sequence_id,id,timestamp,user_id,username,action,resource_type,"
         "resource_id,resource_name,ip_address,file_hash,is_success,metadata,"
         "previous_hash,current_hash\n";
  for (const auto& entry : entries) {
    out << entry.sequence_id << ',' << csv_field(entry.id) << ','
        << csv_field(entry.timestamp) << ',' << csv_field(entry.user_id) << ','
        << csv_field(entry.username) << ',' << csv_field(entry.action) << ','
        << csv_field(entry.resource_type) << ','
        << csv_field(entry.resource_id.value_or("")) << ','
        << csv_field(entry.resource_name.value_or("")) << ','
        << csv_field(entry.ip_address.value_or("")) << ','
        << csv_field(entry.file_hash.value_or("")) << ','
        << (entry.is_success ? "true" : "false") << ','
        << csv_field(entry.metadata) << ',' << entry.previous_hash << ','
        << entry.current_hash << '\n';
  }
}

}  // namespace

nlohmann::json to_json(const arkive::schema::audit_entry_t& entry) {
  auto optional_text = [](const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
  };
  auto metadata = nlohmann::json::parse(entry.metadata, nullptr, false);
  return nlohmann::json{
      {"sequence_id", entry.sequence_id},
      {"id", entry.id},
      {"user_id", entry.user_id},
      {"username", entry.username},
      {"action", entry.action},
      {"resource_type", entry.resource_type},
      {"resource_id", optional_text(entry.resource_id)},
      {"resource_name", optional_text(entry.resource_name)},
      {"ip_address", optional_text(entry.ip_address)},
      {"file_hash", optional_text(entry.file_hash)},
      {"metadata", metadata.is_discarded() ? nlohmann::json(entry.metadata)
                                           : metadata},
      {"timestamp", entry.timestamp},
      {"is_success", entry.is_success},
      {"previous_hash", entry.previous_hash},
      {"current_hash", entry.current_hash}};
}

nlohmann::json to_json(const arkive::schema::audit_chain_status_t& status) {
  auto json = nlohmann::json{{"is_valid", status.is_valid},
                             {"total_logs", status.total_logs}};
  json["first_log_date"] = status.first_log_date
                               ? nlohmann::json(*status.first_log_date)
                               : nlohmann::json(nullptr);
  json["last_log_date"] = status.last_log_date
                              ? nlohmann::json(*status.last_log_date)
                              : nlohmann::json(nullptr);
  if (status.failed_sequence_id) {
    json["failed_sequence_id"] = *status.failed_sequence_id;
    json["error"] = status.error;
  }
  return json;
}

std::string compute_entry_hash(const audit_entry_t& entry) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{
      entry.id, entry.user_id, entry.username, entry.action,
      entry.resource_type, entry.resource_id, entry.resource_name,
      entry.ip_address, entry.file_hash, entry.metadata, entry.timestamp,
      entry.is_success, entry.previous_hash});
  return arkive::schema::to_hex(
      arkive::crypto::blake3(arkive::schema::make_bytes_view(encoded)));
}

arkive::schema::audit_entry_t trail::append(
    const arkive::schema::actor_t& actor,
    const arkive::schema::audit_action_t action,
    const arkive::schema::resource_ref_t& resource,
    const nlohmann::json& metadata,
    const bool is_success,
    const arkive::schema::audit_context_t& context) const {
  auto entry = audit_entry_t{};
  entry.user_id = actor.user_id;
  entry.username = actor.username;
  entry.action = std::string{arkive::schema::to_string(action)};
  entry.resource_type = resource.resource_type;
  entry.resource_id = resource.resource_id;
  entry.resource_name = resource.resource_name;
  entry.ip_address = context.ip_address;
  entry.file_hash = context.file_hash;
  entry.metadata = metadata.is_null() ? std::string{"{}"} : metadata.dump();
  entry.is_success = is_success;

  try {
    return store_.execute(
        [&](connection& conn) {
          auto tx = transaction{conn, transaction_mode::immediate};

          auto last = conn.prepare(
              "SELECT sequence_id, current_hash FROM audit_logs "
              "ORDER BY sequence_id DESC LIMIT 1;");
          auto previous_sequence = int64_t{0};
          auto record = entry;
          record.previous_hash = arkive::schema::zero_hash_hex();
          if (last.step()) {
            previous_sequence = last.column_int64(0);
            record.previous_hash = last.column_text(1);
          }

          record.id = arkive::schema::make_uuid();
          record.timestamp = arkive::schema::format_timestamp(
              arkive::schema::now_milliseconds());
          record.current_hash = compute_entry_hash(record);

          auto insert = conn.prepare(fmt::format(
              "INSERT INTO audit_logs ({}) VALUES "
              "(NULL, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);",
              kEntryColumns));
          insert.bind(1, record.id)
              .bind(2, record.user_id)
              .bind(3, record.username)
              .bind(4, record.action)
              .bind(5, record.resource_type)
              .bind(6, record.resource_id)
              .bind(7, record.resource_name)
              .bind(8, record.ip_address)
              .bind(9, record.file_hash)
              .bind(10, record.metadata)
              .bind(11, record.timestamp)
              .bind(12, record.is_success)
              .bind(13, record.previous_hash)
              .bind(14, record.current_hash);
          insert.run();

          const auto assigned = conn.last_insert_rowid();
          if (assigned != previous_sequence + 1) {
            throw arkive::common::audit_write_error{fmt::format(
                "sequence gap: expected {} but store assigned {}",
                previous_sequence + 1, assigned)};
          }
          tx.commit();
          record.sequence_id = static_cast<uint64_t>(assigned);
          return record;
        },
        "audit append");
  } catch (const arkive::common::audit_write_error& ex) {
    spdlog::error("Audit append rejected: {}", ex.what());
    throw;
  } catch (const arkive::common::error& ex) {
    spdlog::error("Audit append failed for action {}: {}", entry.action,
                  ex.what());
    throw arkive::common::audit_write_error{
        std::string{"audit entry not recorded: "} + ex.what()};
  }
}

arkive::schema::chain_verification_t trail::verify_chain() const {
  return store_.execute(
      [&](connection& conn) {
        auto result = arkive::schema::chain_verification_t{};
        auto tx = transaction{conn, transaction_mode::deferred};
        auto stmt = conn.prepare(fmt::format(
            "SELECT {} FROM audit_logs ORDER BY sequence_id ASC;",
            kEntryColumns));

        auto fail = [&](const uint64_t sequence_id, std::string error) {
          result.ok = false;
          result.failed_sequence_id = sequence_id;
          result.error = std::move(error);
          spdlog::error("Audit chain broken at sequence {}: {}", sequence_id,
                        result.error);
        };

        auto expected_sequence = uint64_t{1};
        auto expected_previous = arkive::schema::zero_hash_hex();
        result.ok = true;
        while (stmt.step()) {
          const auto entry = read_entry(stmt);
          if (entry.sequence_id != expected_sequence) {
            fail(entry.sequence_id,
                 fmt::format("sequence gap: expected {} found {}",
                             expected_sequence, entry.sequence_id));
            break;
          }
          if (entry.previous_hash != expected_previous) {
            fail(entry.sequence_id,
                 "previous_hash does not match the preceding entry");
            break;
          }
          if (!arkive::schema::is_hash_hex(entry.current_hash) ||
              compute_entry_hash(entry) != entry.current_hash) {
            fail(entry.sequence_id,
                 "current_hash does not match the entry contents");
            break;
          }
          ++result.entries_checked;
          ++expected_sequence;
          expected_previous = entry.current_hash;
        }
        tx.commit();
        return result;
      },
      "audit verify");
}

arkive::schema::audit_chain_status_t trail::chain_status() const {
  const auto verification = verify_chain();
  auto status = arkive::schema::audit_chain_status_t{};
  status.is_valid = verification.ok;
  status.failed_sequence_id = verification.failed_sequence_id;
  status.error = verification.error;
  store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(
            "SELECT COUNT(*), MIN(timestamp), MAX(timestamp) FROM audit_logs;");
        if (stmt.step()) {
          status.total_logs = static_cast<uint64_t>(stmt.column_int64(0));
          status.first_log_date = stmt.column_optional_text(1);
          status.last_log_date = stmt.column_optional_text(2);
        }
      },
      "audit status");
  return status;
}

std::vector<arkive::schema::audit_entry_t> trail::query(
    const arkive::schema::audit_filter_t& filter) const {
  const auto where = make_where(filter);
  auto sql = fmt::format(
      "SELECT {} FROM audit_logs{} ORDER BY sequence_id {}", kEntryColumns,
      where.sql,
      filter.order == arkive::schema::sort_order_t::ascending ? "ASC"
                                                              : "DESC");
  auto parameters = where.parameters;
  if (filter.limit || filter.offset > 0) {
    sql += " LIMIT ? OFFSET ?";
    parameters.emplace_back(
        filter.limit ? static_cast<int64_t>(*filter.limit) : int64_t{-1});
    parameters.emplace_back(static_cast<int64_t>(filter.offset));
  }
  sql += ';';

  return store_.execute(
      [&](connection& conn) {
        auto stmt = conn.prepare(sql);
        bind_parameters(stmt, parameters);
        auto entries = std::vector<audit_entry_t>{};
        while (stmt.step()) {
          entries.push_back(read_entry(stmt));
        }
        return entries;
      },
      "audit query");
}

uint64_t trail::count(const arkive::schema::audit_filter_t& filter) const {
  const auto where = make_where(filter);
  return store_.execute(
      [&](connection& conn) { return count_matching(conn, where); },
      "audit count");
}

arkive::schema::audit_page_t trail::query_page(
    const arkive::schema::audit_filter_t& filter,
    const uint32_t page,
    const uint32_t page_size) const {
  auto result = arkive::schema::audit_page_t{};
  result.page = std::max(page, 1u);
  const auto size = std::max(page_size, 1u);

  result.total = count(filter);
  result.total_pages = static_cast<uint32_t>((result.total + size - 1) / size);

  auto window = filter;
  window.limit = size;
  window.offset = static_cast<uint64_t>(result.page - 1) * size;
  result.entries = query(window);
  result.has_next = result.page < result.total_pages;
  result.has_previous = result.page > 1;
  return result;
}

arkive::schema::compliance_report_t trail::export_entries(
    const arkive::schema::audit_filter_t& filter,
    const arkive::schema::export_format_t format,
    const std::filesystem::path& output_path) const {
  const auto entries = query(filter);

  auto report = arkive::schema::compliance_report_t{};
  report.export_date =
      arkive::schema::format_timestamp(arkive::schema::now_milliseconds());
  report.format = format;
  report.total_logs = entries.size();
  report.chain_integrity = chain_status();

  if (output_path.has_parent_path()) {
    auto ec = std::error_code{};
    std::filesystem::create_directories(output_path.parent_path(), ec);
    if (ec) {
      throw arkive::common::io_error{"cannot create " +
                                     output_path.parent_path().string() +
                                     ": " + ec.message()};
    }
  }
  {
    auto out = std::ofstream{output_path, std::ios::binary | std::ios::trunc};
    if (!out) {
      throw arkive::common::io_error{"cannot write " + output_path.string()};
    }
    if (format == arkive::schema::export_format_t::csv) {
      write_csv(out, entries);
    } else {
      write_json(out, entries, report);
    }
    out.flush();
    if (!out) {
      throw arkive::common::io_error{"write failed for " +
                                     output_path.string()};
    }
  }

  report.file_hash =
      arkive::schema::to_hex(arkive::crypto::sha256_file(output_path));
  spdlog::info("Exported {} audit entries to {} ({})", report.total_logs,
               output_path.string(), arkive::schema::to_string(format));
  return report;
}

}  // namespace arkive::audit
