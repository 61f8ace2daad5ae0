#include <arkive/common/logging.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace arkive::common {

void configure_logging(const config& value) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!value.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        value.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "arkive", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(value.log_level));
}

}  // namespace arkive::common
