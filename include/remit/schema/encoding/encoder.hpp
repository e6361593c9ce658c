#pragma once
#include <remit/schema/primitives.hpp>
#include <optional>
#include <span>

namespace remit::schema::encoding {

// Codec selection is a build time setting: callers name the library through a
// tag type (encoder<scale_encoder_tag>) and never the library API directly.
template <typename Library>
struct encoder {
  template <typename T>
  remit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, remit::schema::bytes_t& out);

  template <typename T>
  T decode(const remit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const remit::schema::bytes_view_t& bytes);
};

}  // namespace remit::schema::encoding
