#pragma once
#include <keystone/schema/primitives.hpp>

#include <string_view>

// Well-known account addresses.
namespace keystone::schema {

/// 4ipgdgYdX1oK2n3GgeMh43rPdrrhb4kbDyAmNTSF93JE
inline constexpr auto kProgramId = pubkey_t{
    0x37, 0x49, 0xca, 0x26, 0x8c, 0x6d, 0x1e, 0x6b, 0x18, 0x64, 0x7d,
    0x50, 0xb4, 0x17, 0x2a, 0xe2, 0xcf, 0xff, 0xc6, 0xdf, 0x01, 0x5a,
    0x37, 0x4c, 0xa2, 0x62, 0x8d, 0x59, 0x5a, 0x64, 0xf7, 0xef};

/// 11111111111111111111111111111111
inline constexpr auto kSystemProgramId = pubkey_t{};

/// Sysvar1111111111111111111111111111111111111
inline constexpr auto kSysvarOwnerId = pubkey_t{
    0x06, 0xa7, 0xd5, 0x17, 0x18, 0x75, 0xf7, 0x29, 0xc7, 0x3d, 0x93,
    0x40, 0x8f, 0x21, 0x61, 0x20, 0x06, 0x7e, 0xd8, 0x8c, 0x76, 0xe0,
    0x8c, 0x28, 0x7f, 0xc1, 0x94, 0x60, 0x00, 0x00, 0x00, 0x00};

/// SysvarRent111111111111111111111111111111111
inline constexpr auto kRentSysvarId = pubkey_t{
    0x06, 0xa7, 0xd5, 0x17, 0x19, 0x2c, 0x5c, 0x51, 0x21, 0x8c, 0xc9,
    0x4c, 0x3d, 0x4a, 0xf1, 0x7f, 0x58, 0xda, 0xee, 0x08, 0x9b, 0xa1,
    0xfd, 0x44, 0xe3, 0xdb, 0xd9, 0x8a, 0x00, 0x00, 0x00, 0x00};

/// Seed prefix of the per-payer state account address.
inline constexpr auto kStateSeed = std::string_view{"state"};

}  // namespace keystone::schema
