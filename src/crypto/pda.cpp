#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>
#include <keystone/crypto/hash.hpp>
#include <keystone/crypto/pda.hpp>

#include <array>
#include <iterator>
#include <string_view>
#include <vector>

namespace keystone::crypto {

namespace {

using boost::multiprecision::cpp_int;

constexpr auto kPdaMarker = std::string_view{"ProgramDerivedAddress"};

// 2^255 - 19
const cpp_int& field_prime() {
  static const cpp_int prime = (cpp_int{1} << 255) - 19;
  return prime;
}

// -121665 / 121666 mod p
const cpp_int& edwards_d() {
  static const cpp_int d{
      "37095705934669439343138083508754565189542113879843219016388785533085940"
      "283555"};
  return d;
}

cpp_int load_field_element(const keystone::schema::pubkey_t& key) {
  auto bytes = key;
  bytes[31] &= 0x7F;  // sign of x
  auto value = cpp_int{};
  // Little-endian on the wire; import_bits wants the most significant first.
  boost::multiprecision::import_bits(value, std::rbegin(bytes),
                                     std::rend(bytes));
  return value % field_prime();
}

}  // namespace

bool is_on_curve(const keystone::schema::pubkey_t& key) {
  const auto& p = field_prime();
  const cpp_int y = load_field_element(key);
  const cpp_int y2 = (y * y) % p;

  // x^2 = (y^2 - 1) / (d * y^2 + 1); d is a non-square so the denominator
  // never vanishes.
  const cpp_int u = (y2 + p - 1) % p;
  const cpp_int v = (edwards_d() * y2 + 1) % p;
  const cpp_int inverse_exponent = p - 2;
  const cpp_int v_inverse = boost::multiprecision::powm(v, inverse_exponent, p);
  const cpp_int x2 = (u * v_inverse) % p;
  if (x2 == 0) {
    return true;
  }
  const cpp_int euler_exponent = (p - 1) / 2;
  const cpp_int legendre = boost::multiprecision::powm(x2, euler_exponent, p);
  return legendre == 1;
}

std::optional<keystone::schema::pubkey_t> create_program_address(
    std::span<const keystone::schema::bytes_view_t> seeds,
    const keystone::schema::pubkey_t& program_id) {
  if (seeds.size() > kMaxSeeds) {
    return std::nullopt;
  }
  auto parts = std::vector<keystone::schema::bytes_view_t>{};
  parts.reserve(seeds.size() + 2);
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) {
      return std::nullopt;
    }
    parts.push_back(seed);
  }
  parts.push_back(keystone::schema::make_bytes_view(program_id));
  parts.push_back(keystone::schema::make_bytes_view(kPdaMarker));

  auto address = sha256(
      std::span<const keystone::schema::bytes_view_t>{parts.data(),
                                                      parts.size()});
  if (is_on_curve(address)) {
    return std::nullopt;
  }
  return address;
}

std::optional<std::pair<keystone::schema::pubkey_t, uint8_t>>
find_program_address(std::span<const keystone::schema::bytes_view_t> seeds,
                     const keystone::schema::pubkey_t& program_id) {
  if (seeds.size() >= kMaxSeeds) {
    return std::nullopt;
  }
  auto with_bump = std::vector<keystone::schema::bytes_view_t>{
      std::begin(seeds), std::end(seeds)};
  auto bump = std::array<uint8_t, 1>{};
  with_bump.push_back(keystone::schema::bytes_view_t{bump.data(), bump.size()});

  for (auto candidate = 255; candidate >= 0; --candidate) {
    bump[0] = static_cast<uint8_t>(candidate);
    auto address = create_program_address(
        std::span<const keystone::schema::bytes_view_t>{with_bump.data(),
                                                        with_bump.size()},
        program_id);
    if (address) {
      return std::pair{*address, bump[0]};
    }
  }
  return std::nullopt;
}

}  // namespace keystone::crypto
