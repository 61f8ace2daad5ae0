#pragma once

#include <arkive/common/error.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace arkive::storage {

// Contention policy shared by every caller of the store.
//
// An operation that fails with SQLITE_BUSY or SQLITE_LOCKED is attempted
// again after `backoff_step * attempt`, up to `max_attempts` attempts in
// total. Any other failure propagates on the first attempt. Exhaustion
// raises `contention_error`.
struct retry_policy final {
  uint32_t max_attempts{3};
  std::chrono::milliseconds backoff_step{100};

  std::chrono::milliseconds backoff_for(const uint32_t attempt) const {
    return backoff_step * attempt;
  }

  template <typename Operation>
  auto run(Operation&& operation, const std::string_view what) const
      -> decltype(operation());
};

template <typename Operation>
auto retry_policy::run(Operation&& operation, const std::string_view what) const
    -> decltype(operation()) {
  const auto attempts = max_attempts == 0 ? 1u : max_attempts;
  auto last_error = std::string{};
  for (auto attempt = 1u; attempt <= attempts; ++attempt) {
    try {
      return operation();
    } catch (const arkive::common::sqlite_error& ex) {
      if (!ex.is_contention()) {
        throw;
      }
      last_error = ex.what();
    }
    if (attempt < attempts) {
      const auto delay = backoff_for(attempt);
      spdlog::warn("{}: store busy (attempt {}/{}), retrying in {}ms", what,
                   attempt, attempts, delay.count());
      std::this_thread::sleep_for(delay);
    }
  }
  spdlog::error("{}: store still busy after {} attempts: {}", what, attempts,
                last_error);
  throw arkive::common::contention_error{
      std::string{what} + ": store busy after " + std::to_string(attempts) +
          " attempts: " + last_error,
      attempts};
}

}  // namespace arkive::storage
