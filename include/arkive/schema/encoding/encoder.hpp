#pragma once
#include <arkive/schema/primitives.hpp>

namespace arkive::schema::encoding {

template <typename Library>
struct encoder {
  template <typename T>
  arkive::schema::bytes_t encode(const T& obj);
};

}  // namespace arkive::schema::encoding
