#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

// Persisted enums are stored by name. Each one owns a constexpr name table
// and specializes `try_from_string`; an enum without a specialization fails
// to link instead of silently parsing to nothing.
namespace arkive::schema {

template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> find_enum(const enum_names_t<Enum, N>& names,
                                        const std::string_view name) {
  for (const auto& [candidate, value] : names) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view find_name(const enum_names_t<Enum, N>& names,
                                     const Enum value,
                                     const std::string_view fallback) {
  for (const auto& [name, candidate] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return fallback;
}

// Both columns of the table are unique, so lookups are reversible.
template <typename Enum, std::size_t N>
constexpr bool is_bijective(const enum_names_t<Enum, N>& names) {
  for (std::size_t i = 0; i < N; ++i) {
    for (std::size_t j = i + 1; j < N; ++j) {
      if (names[i].first == names[j].first ||
          names[i].second == names[j].second) {
        return false;
      }
    }
  }
  return true;
}

template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace arkive::schema
