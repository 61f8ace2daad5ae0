#include <arkive/schema/primitives.hpp>
#include <arkive/common/error.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace arkive::schema {

namespace {

std::optional<uint32_t> read_digits(const std::string_view value,
                                    const std::size_t offset,
                                    const std::size_t count) {
  if (offset + count > value.size()) {
    return std::nullopt;
  }
  auto result = uint32_t{};
  for (auto i = offset; i < offset + count; ++i) {
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      return std::nullopt;
    }
    result = (result * 10) + static_cast<uint32_t>(value[i] - '0');
  }
  return result;
}

bool is_bare_date(const std::string_view value) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
    return false;
  }
  for (const auto index : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (std::isdigit(static_cast<unsigned char>(value[index])) == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

const std::string& zero_hash_hex() {
  static const auto zero = std::string(64, '0');
  return zero;
}

bool is_hash_hex(const std::string_view value) {
  return value.size() == 64 &&
         std::ranges::all_of(value, [](const char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

timestamp_milliseconds_t now_milliseconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::string format_timestamp(const timestamp_milliseconds_t value) {
  const auto seconds = static_cast<std::time_t>(value / 1000);
  auto parts = std::tm{};
  gmtime_r(&seconds, &parts);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
                     parts.tm_hour, parts.tm_min, parts.tm_sec, value % 1000);
}

std::optional<parsed_timestamp> try_parse_timestamp(
    const std::string_view value) {
  const auto year = read_digits(value, 0, 4);
  const auto month = read_digits(value, 5, 2);
  const auto day = read_digits(value, 8, 2);
  const auto hour = read_digits(value, 11, 2);
  const auto minute = read_digits(value, 14, 2);
  const auto second = read_digits(value, 17, 2);
  if (!year || !month || !day || !hour || !minute || !second ||
      value[4] != '-' || value[7] != '-' ||
      (value[10] != 'T' && value[10] != ' ') || value[13] != ':' ||
      value[16] != ':' || *hour > 23 || *minute > 59 || *second > 59) {
    return std::nullopt;
  }
  const auto date = std::chrono::year_month_day{
      std::chrono::year{static_cast<int>(*year)},
      std::chrono::month{*month}, std::chrono::day{*day}};
  if (!date.ok()) {
    return std::nullopt;
  }

  auto position = std::size_t{19};
  auto milliseconds = int64_t{};
  auto has_fraction = false;
  if (position < value.size() && value[position] == '.') {
    ++position;
    auto digits = 0;
    while (position < value.size() &&
           std::isdigit(static_cast<unsigned char>(value[position])) != 0) {
      if (digits < 3) {
        milliseconds = (milliseconds * 10) + (value[position] - '0');
      }
      ++digits;
      ++position;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 3; ++digits) {
      milliseconds *= 10;
    }
    has_fraction = true;
  }

  // No zone designator means UTC.
  auto offset_minutes = int64_t{};
  if (position < value.size()) {
    const auto zone = value.substr(position);
    if (zone == "Z" || zone == "z") {
      offset_minutes = 0;
    } else if (zone[0] == '+' || zone[0] == '-') {
      const auto compact = zone.size() == 5;
      const auto offset_hour = read_digits(zone, 1, 2);
      const auto offset_minute = read_digits(zone, compact ? 3 : 4, 2);
      if ((zone.size() != 6 && !compact) || (!compact && zone[3] != ':') ||
          !offset_hour || !offset_minute || *offset_hour > 23 ||
          *offset_minute > 59) {
        return std::nullopt;
      }
      offset_minutes = (*offset_hour * 60) + *offset_minute;
      if (zone[0] == '-') {
        offset_minutes = -offset_minutes;
      }
    } else {
      return std::nullopt;
    }
  }

  const auto local = std::chrono::sys_days{date}.time_since_epoch() +
                     std::chrono::hours{*hour} +
                     std::chrono::minutes{*minute} +
                     std::chrono::seconds{*second} +
                     std::chrono::milliseconds{milliseconds};
  const auto utc =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          local - std::chrono::minutes{offset_minutes})
          .count();
  if (utc < 0) {
    return std::nullopt;
  }
  return parsed_timestamp{static_cast<timestamp_milliseconds_t>(utc),
                          has_fraction};
}

std::string range_start(const std::string_view value) {
  if (is_bare_date(value)) {
    return std::string{value} + "T00:00:00.000Z";
  }
  const auto parsed = try_parse_timestamp(value);
  if (!parsed) {
    throw arkive::common::validation_error{
        fmt::format("invalid start date '{}'", value)};
  }
  return format_timestamp(parsed->value);
}

std::string range_end(const std::string_view value) {
  if (is_bare_date(value)) {
    return std::string{value} + "T23:59:59.999Z";
  }
  const auto parsed = try_parse_timestamp(value);
  if (!parsed) {
    throw arkive::common::validation_error{
        fmt::format("invalid end date '{}'", value)};
  }
  // Second precision covers the whole second.
  return format_timestamp(parsed->has_fraction ? parsed->value
                                               : parsed->value + 999);
}

std::string make_uuid() {
  thread_local auto generator = boost::uuids::random_generator{};
  return boost::uuids::to_string(generator());
}

}  // namespace arkive::schema
