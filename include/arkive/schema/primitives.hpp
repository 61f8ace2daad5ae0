#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace arkive::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);

const std::string& zero_hash_hex();

bool is_hash_hex(const std::string_view value);

timestamp_milliseconds_t now_milliseconds();

// `YYYY-MM-DDTHH:MM:SS.mmmZ`. String order equals time order.
std::string format_timestamp(timestamp_milliseconds_t value);

struct parsed_timestamp final {
  timestamp_milliseconds_t value{};
  bool has_fraction{};
};

// `YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]`, normalized to UTC.
std::optional<parsed_timestamp> try_parse_timestamp(std::string_view value);

// Inclusive filter bounds in stored form. A bare date covers the whole day;
// an unparseable bound raises validation_error.
std::string range_start(const std::string_view value);
std::string range_end(const std::string_view value);

std::string make_uuid();

}  // namespace arkive::schema
