#pragma once
#include <keystone/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace keystone::sysvar {

/// Bytes every account is charged for on top of its data.
inline constexpr auto kAccountStorageOverhead = uint64_t{128};

/// lamports_per_byte_year:u64 LE | exemption_threshold:f64 LE |
/// burn_percent:u8
inline constexpr auto kRentSize = std::size_t{17};

struct rent_t final {
  uint64_t lamports_per_byte_year{3480};
  double exemption_threshold{2.0};
  uint8_t burn_percent{50};

  /// Balance an account of `data_len` bytes needs to be rent exempt.
  uint64_t minimum_balance(std::size_t data_len) const;

  bool operator==(const rent_t&) const = default;
};

std::optional<rent_t> try_decode_rent(const keystone::schema::bytes_view_t& bytes);
keystone::schema::bytes_t encode_rent(const rent_t& rent);

}  // namespace keystone::sysvar
