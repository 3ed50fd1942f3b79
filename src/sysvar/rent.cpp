#include <boost/endian/conversion.hpp>
#include <keystone/sysvar/rent.hpp>

#include <bit>
#include <cmath>
#include <limits>

namespace keystone::sysvar {

uint64_t rent_t::minimum_balance(const std::size_t data_len) const {
  auto bytes = kAccountStorageOverhead + static_cast<uint64_t>(data_len);
  auto balance = static_cast<double>(bytes) *
                 static_cast<double>(lamports_per_byte_year) *
                 exemption_threshold;
  // Saturate: NaN and negatives to zero, anything past u64 to its maximum.
  if (!(balance > 0.0)) {
    return 0;
  }
  if (balance >= 18446744073709551616.0) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(balance);
}

std::optional<rent_t> try_decode_rent(
    const keystone::schema::bytes_view_t& bytes) {
  if (bytes.size() != kRentSize) {
    return std::nullopt;
  }
  auto rent = rent_t{};
  rent.lamports_per_byte_year = boost::endian::load_little_u64(bytes.data());
  rent.exemption_threshold =
      std::bit_cast<double>(boost::endian::load_little_u64(bytes.data() + 8));
  rent.burn_percent = bytes[16];
  if (!std::isfinite(rent.exemption_threshold) ||
      rent.exemption_threshold < 0.0) {
    return std::nullopt;
  }
  return rent;
}

keystone::schema::bytes_t encode_rent(const rent_t& rent) {
  auto out = keystone::schema::bytes_t(kRentSize);
  boost::endian::store_little_u64(out.data(), rent.lamports_per_byte_year);
  boost::endian::store_little_u64(
      out.data() + 8, std::bit_cast<uint64_t>(rent.exemption_threshold));
  out[16] = rent.burn_percent;
  return out;
}

}  // namespace keystone::sysvar
