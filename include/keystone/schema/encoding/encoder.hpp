#pragma once
#include <keystone/schema/primitives.hpp>
#include <optional>

namespace keystone::schema::encoding {

// Encoders are selected at build time by tag: the fixed-offset layout for
// on-account records, SCALE for host-side ledger values.
template <typename Library>
struct encoder {
  template <typename T>
  keystone::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const keystone::schema::bytes_view_t& bytes);
};

}  // namespace keystone::schema::encoding
