#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

struct archive;

namespace arkive::backup {

class archive_writer final {
 public:
  explicit archive_writer(const std::filesystem::path& path);
  ~archive_writer();

  archive_writer(const archive_writer&) = delete;
  archive_writer& operator=(const archive_writer&) = delete;

  uint64_t add_file(std::string_view name, const std::filesystem::path& source);

  void add_bytes(std::string_view name, std::string_view content);

  // Write the central directory. The archive is incomplete until then.
  void close();

 private:
  void write_header(std::string_view name, uint64_t size);

  ::archive* handle_{};
  std::filesystem::path path_;
  bool closed_{};
};

struct archive_item final {
  std::string name;
  bool is_directory{};
};

class archive_reader final {
 public:
  explicit archive_reader(const std::filesystem::path& path);
  ~archive_reader();

  archive_reader(const archive_reader&) = delete;
  archive_reader& operator=(const archive_reader&) = delete;

  std::optional<archive_item> next();

  uint64_t extract_to(const std::filesystem::path& destination);

  std::string read_all(uint64_t limit);

  uint64_t drain();

 private:
  template <typename Sink>
  uint64_t read_data(Sink&& sink);

  ::archive* handle_{};
  std::filesystem::path path_;
};

// True when `name` is relative and has no `..` component, so it cannot
// resolve outside the directory it is extracted into.
bool is_safe_entry_name(std::string_view name);

}  // namespace arkive::backup
