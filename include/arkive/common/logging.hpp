#pragma once

#include <arkive/common/config.hpp>

namespace arkive::common {

void configure_logging(const config& value);

}  // namespace arkive::common
