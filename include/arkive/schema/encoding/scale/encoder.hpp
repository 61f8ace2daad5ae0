#pragma once
#include <arkive/common/critical.hpp>
#include <arkive/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>

namespace arkive::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  arkive::schema::bytes_t encode(const T& obj);
};

template <typename T>
arkive::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    arkive::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

}  // namespace arkive::schema::encoding
