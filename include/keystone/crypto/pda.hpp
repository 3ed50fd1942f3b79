#pragma once
#include <keystone/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

namespace keystone::crypto {

inline constexpr auto kMaxSeeds = std::size_t{16};
inline constexpr auto kMaxSeedLength = std::size_t{32};

/// True when `key` decompresses to a point on the ed25519 curve.
///
/// Program-derived addresses are required to be off-curve so that no private
/// key can sign for them.
bool is_on_curve(const keystone::schema::pubkey_t& key);

/// sha256(seeds || program_id || "ProgramDerivedAddress").
///
/// Returns std::nullopt when the seeds exceed `kMaxSeeds`/`kMaxSeedLength` or
/// the resulting address lies on the curve.
std::optional<keystone::schema::pubkey_t> create_program_address(
    std::span<const keystone::schema::bytes_view_t> seeds,
    const keystone::schema::pubkey_t& program_id);

/// Search bumps 255 down to 0 and return the first off-curve address with its
/// bump (the canonical bump).
std::optional<std::pair<keystone::schema::pubkey_t, uint8_t>>
find_program_address(std::span<const keystone::schema::bytes_view_t> seeds,
                     const keystone::schema::pubkey_t& program_id);

}  // namespace keystone::crypto
