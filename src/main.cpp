#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <arkive/audit/trail.hpp>
#include <arkive/backup/manager.hpp>
#include <arkive/backup/manifest.hpp>
#include <arkive/common/config.hpp>
#include <arkive/common/error.hpp>
#include <arkive/common/logging.hpp>
#include <arkive/records/repository.hpp>
#include <arkive/storage/sqlite/storage.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace po = boost::program_options;

namespace {

constexpr auto kExitOk = 0;
constexpr auto kExitUsage = 1;
constexpr auto kExitValidation = 2;
constexpr auto kExitFailure = 3;

constexpr auto kCommands =
    "Commands:\n"
    "  init             create or open the store\n"
    "  audit-append     record one audit entry\n"
    "  audit-verify     verify the audit hash chain\n"
    "  audit-query      list audit entries matching the filters\n"
    "  audit-export     write a JSON or CSV compliance export\n"
    "  index            store search content for a document\n"
    "  backup-create    write a verified point-in-time archive\n"
    "  backup-verify    check an archive without restoring it\n"
    "  backup-restore   verify and install an archive\n"
    "  backup-list      list valid archives, newest first\n"
    "  backup-cleanup   delete all but the newest --keep archives\n";

struct command_options final {
  std::string command;
  std::string user_id{"system"};
  std::string username{"system"};
  std::string action;
  std::string resource_type;
  std::string resource_id;
  std::string resource_name;
  std::string metadata{"{}"};
  std::string ip_address;
  std::string file_hash;
  std::string from;
  std::string to;
  uint32_t days{};
  uint32_t limit{};
  uint64_t offset{};
  uint32_t page{};
  uint32_t page_size{50};
  std::string format{"json"};
  std::string output;
  std::string archive;
  std::string document_id;
  std::string text;
  std::string document_type;
  std::string fields{"{}"};
};

po::options_description command_description(command_options& target) {
  auto description = po::options_description{"Command"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&target.command), "Command to run")(
      "user-id", po::value<std::string>(&target.user_id)
                     ->default_value(target.user_id),
      "Acting user id")(
      "username", po::value<std::string>(&target.username)
                      ->default_value(target.username),
      "Acting username")(
      "action", po::value<std::string>(&target.action),
      "Audit action (LOGIN, UPLOAD, ...)")(
      "resource-type", po::value<std::string>(&target.resource_type),
      "Resource type")(
      "resource-id", po::value<std::string>(&target.resource_id),
      "Resource id")(
      "resource-name", po::value<std::string>(&target.resource_name),
      "Resource display name")(
      "metadata", po::value<std::string>(&target.metadata)
                      ->default_value(target.metadata),
      "Audit metadata as a JSON object")(
      "failure", "Record the action as failed")(
      "ip", po::value<std::string>(&target.ip_address), "Client address")(
      "file-hash", po::value<std::string>(&target.file_hash),
      "Hash of the file involved")(
      "from", po::value<std::string>(&target.from),
      "Start, inclusive (YYYY-MM-DD or ISO 8601 timestamp)")(
      "to", po::value<std::string>(&target.to),
      "End, inclusive (YYYY-MM-DD or ISO 8601 timestamp)")(
      "days", po::value<uint32_t>(&target.days),
      "Only entries from the last N days")(
      "limit", po::value<uint32_t>(&target.limit), "Maximum entries")(
      "offset", po::value<uint64_t>(&target.offset), "Entries to skip")(
      "page", po::value<uint32_t>(&target.page), "1-based page number")(
      "page-size", po::value<uint32_t>(&target.page_size)
                       ->default_value(target.page_size),
      "Entries per page")("ascending", "Oldest first")(
      "format", po::value<std::string>(&target.format)
                    ->default_value(target.format),
      "Export format: json or csv")(
      "output,o", po::value<std::string>(&target.output), "Output file")(
      "archive,a", po::value<std::string>(&target.archive), "Backup archive")(
      "document-id", po::value<std::string>(&target.document_id),
      "Document to index")(
      "text", po::value<std::string>(&target.text), "Extracted text")(
      "type", po::value<std::string>(&target.document_type),
      "Document type")(
      "fields", po::value<std::string>(&target.fields)
                    ->default_value(target.fields),
      "Structured fields as a JSON object");
  return description;
}

std::optional<std::string> optional_value(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

const std::string& require(const std::string& value, const char* name) {
  if (value.empty()) {
    throw po::error{std::string{"--"} + name + " is required"};
  }
  return value;
}

nlohmann::json parse_json_object(const std::string& text, const char* name) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw po::error{std::string{"--"} + name + " must be a JSON object"};
  }
  return parsed;
}

std::optional<std::string> date_bound(const std::string& value,
                                      const char* name) {
  if (value.empty()) {
    return std::nullopt;
  }
  try {
    static_cast<void>(arkive::schema::range_start(value));
  } catch (const arkive::common::validation_error& ex) {
    throw po::error{std::string{"--"} + name + ": " + ex.what()};
  }
  return value;
}

arkive::schema::audit_filter_t make_filter(const command_options& options,
                                           const po::variables_map& vm) {
  auto filter = arkive::schema::audit_filter_t{};
  if (vm.contains("user-id") && !vm["user-id"].defaulted()) {
    filter.user_id = options.user_id;
  }
  filter.action = optional_value(options.action);
  filter.resource_type = optional_value(options.resource_type);
  filter.resource_id = optional_value(options.resource_id);
  filter.start_date = date_bound(options.from, "from");
  filter.end_date = date_bound(options.to, "to");
  if (vm.contains("days")) {
    filter.days_back = options.days;
  }
  if (vm.contains("limit")) {
    filter.limit = options.limit;
  }
  filter.offset = options.offset;
  if (vm.contains("ascending")) {
    filter.order = arkive::schema::sort_order_t::ascending;
  }
  return filter;
}

arkive::schema::actor_t make_actor(const command_options& options) {
  return arkive::schema::actor_t{options.user_id, options.username};
}

nlohmann::json to_json(const arkive::schema::backup_manifest_t& manifest) {
  return nlohmann::json::parse(arkive::backup::encode_manifest(manifest));
}

int run_command(const arkive::common::config& cfg,
                const command_options& options,
                const po::variables_map& vm) {
  const auto storage_options = arkive::storage::make_storage_options(cfg);
  auto backup_options = arkive::backup::manager_options{};
  backup_options.retry = storage_options.retry;
  const auto backups = arkive::backup::manager{backup_options};
  const auto& command = options.command;

  if (command == "backup-verify") {
    const auto manifest = backups.verify(require(options.archive, "archive"));
    std::cout << to_json(manifest).dump(2) << std::endl;
    return kExitOk;
  }
  if (command == "backup-list") {
    auto listing = nlohmann::json::array();
    for (const auto& item : backups.list(cfg.backup_dir)) {
      auto json = to_json(item.manifest);
      json["path"] = item.path.string();
      listing.push_back(std::move(json));
    }
    std::cout << listing.dump(2) << std::endl;
    return kExitOk;
  }
  if (command == "backup-cleanup") {
    const auto removed = backups.cleanup(cfg.backup_dir, cfg.keep_backups);
    std::cout << nlohmann::json{{"removed", removed}}.dump(2) << std::endl;
    return kExitOk;
  }
  if (command == "backup-restore") {
    const auto manifest = backups.restore(require(options.archive, "archive"),
                                          cfg.database_path, cfg.files_root);
    const auto store =
        arkive::storage::make_storage<arkive::storage::sqlite_storage_tag>(
            cfg.database_path, storage_options);
    arkive::audit::trail{store}.append(
        make_actor(options), arkive::schema::audit_action_t::backup_restore,
        {"backup", std::nullopt, options.archive},
        {{"created_at", manifest.created_at}, {"checksum", manifest.checksum}},
        true);
    std::cout << to_json(manifest).dump(2) << std::endl;
    return kExitOk;
  }

  const auto store =
      arkive::storage::make_storage<arkive::storage::sqlite_storage_tag>(
          cfg.database_path, storage_options);
  const auto trail = arkive::audit::trail{store};

  if (command == "init") {
    std::cout << nlohmann::json{{"database", cfg.database_path},
                                {"schema_version", store.schema_version()}}
                     .dump(2)
              << std::endl;
    return kExitOk;
  }
  if (command == "audit-append") {
    const auto action = arkive::schema::try_from_string<
        arkive::schema::audit_action_t>(require(options.action, "action"));
    if (!action) {
      throw po::error{"unknown audit action '" + options.action + "'"};
    }
    auto resource = arkive::schema::resource_ref_t{
        require(options.resource_type, "resource-type"),
        optional_value(options.resource_id),
        optional_value(options.resource_name)};
    auto context = arkive::schema::audit_context_t{
        optional_value(options.ip_address), optional_value(options.file_hash)};
    const auto entry = trail.append(
        make_actor(options), *action, resource,
        parse_json_object(options.metadata, "metadata"),
        !vm.contains("failure"), context);
    std::cout << arkive::audit::to_json(entry).dump(2) << std::endl;
    return kExitOk;
  }
  if (command == "audit-verify") {
    const auto status = trail.chain_status();
    std::cout << arkive::audit::to_json(status).dump(2) << std::endl;
    return status.is_valid ? kExitOk : kExitValidation;
  }
  if (command == "audit-query") {
    const auto filter = make_filter(options, vm);
    if (vm.contains("page")) {
      const auto page = trail.query_page(filter, options.page,
                                         options.page_size);
      auto entries = nlohmann::json::array();
      for (const auto& entry : page.entries) {
        entries.push_back(arkive::audit::to_json(entry));
      }
      std::cout << nlohmann::json{{"logs", std::move(entries)},
                                  {"total", page.total},
                                  {"page", page.page},
                                  {"total_pages", page.total_pages},
                                  {"has_next", page.has_next},
                                  {"has_previous", page.has_previous}}
                       .dump(2)
                << std::endl;
      return kExitOk;
    }
    auto entries = nlohmann::json::array();
    for (const auto& entry : trail.query(filter)) {
      entries.push_back(arkive::audit::to_json(entry));
    }
    std::cout << entries.dump(2) << std::endl;
    return kExitOk;
  }
  if (command == "audit-export") {
    const auto format = arkive::schema::try_from_string<
        arkive::schema::export_format_t>(options.format);
    if (!format) {
      throw po::error{"--format must be json or csv"};
    }
    const auto report = trail.export_entries(
        make_filter(options, vm), *format, require(options.output, "output"));
    trail.append(make_actor(options),
                 arkive::schema::audit_action_t::export_audit,
                 {"audit_logs", std::nullopt, options.output},
                 {{"format", options.format},
                  {"total_logs", report.total_logs},
                  {"file_hash", report.file_hash}},
                 true, {std::nullopt, report.file_hash});
    std::cout << nlohmann::json{{"export_date", report.export_date},
                                {"format", options.format},
                                {"total_logs", report.total_logs},
                                {"chain_integrity",
                                 arkive::audit::to_json(report.chain_integrity)},
                                {"file_hash", report.file_hash}}
                     .dump(2)
              << std::endl;
    return kExitOk;
  }
  if (command == "index") {
    const auto repository = arkive::records::repository{store};
    const auto content = repository.index(
        require(options.document_id, "document-id"), options.text,
        require(options.document_type, "type"),
        parse_json_object(options.fields, "fields"));
    trail.append(make_actor(options), arkive::schema::audit_action_t::index,
                 {"document", content.document_id, std::nullopt},
                 {{"document_type", content.document_type}}, true);
    std::cout << nlohmann::json{{"document_id", content.document_id},
                                {"document_type", content.document_type},
                                {"indexed_at", content.indexed_at}}
                     .dump(2)
              << std::endl;
    return kExitOk;
  }
  if (command == "backup-create") {
    const auto output =
        options.output.empty()
            ? (std::filesystem::path{cfg.backup_dir} /
               arkive::backup::archive_file_name(
                   arkive::schema::now_milliseconds()))
                  .string()
            : options.output;
    const auto manifest =
        backups.create(cfg.database_path, cfg.files_root, output);
    trail.append(make_actor(options),
                 arkive::schema::audit_action_t::backup_create,
                 {"backup", std::nullopt, output},
                 {{"created_at", manifest.created_at},
                  {"files_count", manifest.files_count},
                  {"checksum", manifest.checksum}},
                 true);
    auto json = to_json(manifest);
    json["path"] = output;
    std::cout << json.dump(2) << std::endl;
    return kExitOk;
  }

  throw po::error{"unknown command '" + command + "'"};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto cfg = arkive::common::config{};
  auto options = command_options{};

  const auto config_description = arkive::common::config_options(cfg);
  auto description = po::options_description{"Arkive"};
  description.add(command_description(options));
  description.add(config_description);
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("help") || !vm.contains("command")) {
      std::cout << "Usage: arkive <command> [options]\n\n"
                << kCommands << '\n'
                << description << std::endl;
      return vm.contains("help") ? kExitOk : kExitUsage;
    }
    arkive::common::store_config_sources(config_description, vm);
    po::notify(vm);
    arkive::common::finalize_config(cfg);
  } catch (const po::error& ex) {
    std::cerr << "arkive: " << ex.what() << std::endl;
    return kExitUsage;
  } catch (const arkive::common::error& ex) {
    std::cerr << "arkive: " << ex.what() << std::endl;
    return kExitUsage;
  }

  arkive::common::configure_logging(cfg);

  auto status = kExitOk;
  try {
    status = run_command(cfg, options, vm);
  } catch (const po::error& ex) {
    spdlog::error("{}", ex.what());
    status = kExitUsage;
  } catch (const arkive::common::validation_error& ex) {
    spdlog::error("Integrity failure: {}", ex.what());
    status = kExitValidation;
  } catch (const arkive::common::error& ex) {
    spdlog::error("{} failed ({}): {}", options.command,
                  arkive::common::to_string(ex.code()), ex.what());
    status = kExitFailure;
  } catch (const std::exception& ex) {
    spdlog::error("{} failed: {}", options.command, ex.what());
    status = kExitFailure;
  }

  spdlog::shutdown();
  return status;
}
