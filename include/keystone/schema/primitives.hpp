#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keystone::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using mutable_bytes_view_t = std::span<uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using pubkey_t = hash32_t;
using lamports_t = uint64_t;

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
bytes_view_t make_bytes_view(const pubkey_t& key);

std::optional<pubkey_t> try_make_pubkey(const bytes_view_t& bytes);
/// Decode a base58 public key; std::nullopt unless it is exactly 32 bytes.
std::optional<pubkey_t> try_make_pubkey(const std::string_view& base58);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base58(const bytes_view_t& bytes);
std::string to_base58(const pubkey_t& key);
std::optional<bytes_t> try_from_base58(std::string_view encoded);

}  // namespace keystone::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
