#pragma once
#include <keystone/schema/lifecycle_state.hpp>
#include <keystone/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

namespace keystone::schema {

template <uint16_t Version>
struct state_record;

/// The record persisted in the program-owned state account.
///
/// On-account layout, fixed 70 bytes:
///   [0]      is_initialized  (0 or 1)
///   [1..33)  owner           (32-byte public key)
///   [33]     lifecycle_state (0, 1 or 2)
///   [34..66) payload         (32 opaque bytes)
///   [66..70) update_count    (u32, little-endian)
template <>
struct state_record<1> final {
  bool is_initialized{};
  pubkey_t owner{};
  lifecycle_state_t lifecycle_state{lifecycle_state_t::uninitialized};
  hash32_t payload{};
  uint32_t update_count{};

  bool operator==(const state_record<1>&) const = default;
};

using state_record_t = state_record<1>;

namespace state_record_layout {

inline constexpr auto kIsInitializedOffset = std::size_t{0};
inline constexpr auto kOwnerOffset = std::size_t{1};
inline constexpr auto kLifecycleStateOffset = std::size_t{33};
inline constexpr auto kPayloadOffset = std::size_t{34};
inline constexpr auto kUpdateCountOffset = std::size_t{66};
inline constexpr auto kSize = std::size_t{70};

static_assert(kOwnerOffset + sizeof(pubkey_t) == kLifecycleStateOffset);
static_assert(kPayloadOffset + sizeof(hash32_t) == kUpdateCountOffset);
static_assert(kUpdateCountOffset + sizeof(uint32_t) == kSize);

}  // namespace state_record_layout

}  // namespace keystone::schema
