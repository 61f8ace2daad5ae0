#include <arkive/backup/archive.hpp>
#include <arkive/common/error.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <array>
#include <ctime>
#include <fstream>
#include <memory>

namespace arkive::backup {

namespace {

constexpr auto kBlockSize = std::size_t{64 * 1024};

using entry_ptr =
    std::unique_ptr<::archive_entry, decltype(&archive_entry_free)>;

std::string describe(::archive* handle, const std::string_view what) {
  auto message = std::string{what};
  const auto* detail = handle != nullptr ? archive_error_string(handle) : nullptr;
  if (detail != nullptr) {
    message += ": ";
    message += detail;
  }
  return message;
}

}  // namespace

archive_writer::archive_writer(const std::filesystem::path& path)
    : handle_{archive_write_new()}, path_{path} {
  if (handle_ == nullptr) {
    throw arkive::common::backup_error{"cannot allocate archive writer"};
  }
  if (archive_write_set_format_zip(handle_) != ARCHIVE_OK ||
      archive_write_zip_set_compression_deflate(handle_) != ARCHIVE_OK ||
      archive_write_open_filename(handle_, path.string().c_str()) !=
          ARCHIVE_OK) {
    auto message = describe(handle_, "cannot open " + path.string());
    archive_write_free(handle_);
    handle_ = nullptr;
    throw arkive::common::backup_error{message};
  }
}

archive_writer::~archive_writer() {
  if (handle_ == nullptr) {
    return;
  }
  if (!closed_) {
    spdlog::warn("Archive {} discarded before close", path_.string());
  }
  archive_write_free(handle_);
}

void archive_writer::write_header(const std::string_view name,
                                  const uint64_t size) {
  auto entry = entry_ptr{archive_entry_new(), &archive_entry_free};
  if (!entry) {
    throw arkive::common::backup_error{"cannot allocate archive entry"};
  }
  archive_entry_set_pathname(entry.get(), std::string{name}.c_str());
  archive_entry_set_filetype(entry.get(), AE_IFREG);
  archive_entry_set_perm(entry.get(), 0644);
  archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
  archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
  if (archive_write_header(handle_, entry.get()) != ARCHIVE_OK) {
    throw arkive::common::backup_error{
        describe(handle_, "cannot add entry " + std::string{name})};
  }
}

uint64_t archive_writer::add_file(const std::string_view name,
                                  const std::filesystem::path& source) {
  auto in = std::ifstream{source, std::ios::binary};
  if (!in) {
    throw arkive::common::backup_error{"cannot open " + source.string()};
  }
  const auto expected = std::filesystem::file_size(source);
  write_header(name, expected);

  auto buffer = std::array<char, kBlockSize>{};
  auto total = uint64_t{0};
  while (in) {
    in.read(buffer.data(), buffer.size());
    const auto count = in.gcount();
    if (count <= 0) {
      break;
    }
    if (archive_write_data(handle_, buffer.data(),
                           static_cast<std::size_t>(count)) < 0) {
      throw arkive::common::backup_error{
          describe(handle_, "write failed for " + std::string{name})};
    }
    total += static_cast<uint64_t>(count);
  }
  if (in.bad()) {
    throw arkive::common::backup_error{"read failed for " + source.string()};
  }
  if (total != expected) {
    throw arkive::common::backup_error{source.string() +
                                       " changed while being archived"};
  }
  return total;
}

void archive_writer::add_bytes(const std::string_view name,
                               const std::string_view content) {
  write_header(name, content.size());
  if (!content.empty() &&
      archive_write_data(handle_, content.data(), content.size()) < 0) {
    throw arkive::common::backup_error{
        describe(handle_, "write failed for " + std::string{name})};
  }
}

void archive_writer::close() {
  if (closed_) {
    return;
  }
  if (archive_write_close(handle_) != ARCHIVE_OK) {
    throw arkive::common::backup_error{
        describe(handle_, "cannot finalize " + path_.string())};
  }
  closed_ = true;
}

archive_reader::archive_reader(const std::filesystem::path& path)
    : handle_{archive_read_new()}, path_{path} {
  if (handle_ == nullptr) {
    throw arkive::common::backup_error{"cannot allocate archive reader"};
  }
  archive_read_support_format_zip(handle_);
  if (archive_read_open_filename(handle_, path.string().c_str(), 10240) !=
      ARCHIVE_OK) {
    auto message = describe(handle_, "unreadable archive " + path.string());
    archive_read_free(handle_);
    handle_ = nullptr;
    throw arkive::common::validation_error{message};
  }
}

archive_reader::~archive_reader() {
  if (handle_ != nullptr) {
    archive_read_free(handle_);
  }
}

std::optional<archive_item> archive_reader::next() {
  auto* entry = static_cast<::archive_entry*>(nullptr);
  const auto rc = archive_read_next_header(handle_, &entry);
  if (rc == ARCHIVE_EOF) {
    return std::nullopt;
  }
  if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
    throw arkive::common::validation_error{
        describe(handle_, "malformed archive " + path_.string())};
  }
  auto item = archive_item{};
  const auto* name = archive_entry_pathname(entry);
  item.name = name != nullptr ? name : "";
  item.is_directory = archive_entry_filetype(entry) == AE_IFDIR ||
                      (!item.name.empty() && item.name.back() == '/');
  return item;
}

template <typename Sink>
uint64_t archive_reader::read_data(Sink&& sink) {
  auto buffer = std::array<char, kBlockSize>{};
  auto total = uint64_t{0};
  while (true) {
    const auto count = archive_read_data(handle_, buffer.data(), buffer.size());
    if (count < 0) {
      throw arkive::common::validation_error{
          describe(handle_, "corrupt entry in " + path_.string())};
    }
    if (count == 0) {
      break;
    }
    sink(buffer.data(), static_cast<std::size_t>(count));
    total += static_cast<uint64_t>(count);
  }
  return total;
}

uint64_t archive_reader::extract_to(const std::filesystem::path& destination) {
  auto out = std::ofstream{destination, std::ios::binary | std::ios::trunc};
  if (!out) {
    throw arkive::common::backup_error{"cannot write " + destination.string()};
  }
  const auto total = read_data([&](const char* data, const std::size_t size) {
    out.write(data, static_cast<std::streamsize>(size));
  });
  out.flush();
  if (!out) {
    throw arkive::common::backup_error{"write failed for " +
                                       destination.string()};
  }
  return total;
}

std::string archive_reader::read_all(const uint64_t limit) {
  auto content = std::string{};
  read_data([&](const char* data, const std::size_t size) {
    if (content.size() + size > limit) {
      throw arkive::common::validation_error{"archive entry exceeds " +
                                             std::to_string(limit) + " bytes"};
    }
    content.append(data, size);
  });
  return content;
}

uint64_t archive_reader::drain() {
  return read_data([](const char*, std::size_t) {});
}

bool is_safe_entry_name(const std::string_view name) {
  if (name.empty() || name.front() == '/' || name.front() == '\\') {
    return false;
  }
  if (name.size() > 1 && name[1] == ':') {
    return false;
  }
  auto start = std::size_t{0};
  while (start <= name.size()) {
    const auto end = name.find_first_of("/\\", start);
    const auto part = name.substr(
        start, end == std::string_view::npos ? std::string_view::npos
                                             : end - start);
    if (part == "..") {
      return false;
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return true;
}

}  // namespace arkive::backup
