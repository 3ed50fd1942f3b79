#pragma once
#include <keystone/schema/primitives.hpp>
#include <span>

namespace keystone::crypto {

keystone::schema::hash32_t sha256(const keystone::schema::bytes_view_t& bytes);

/// Hash the concatenation of `parts` without materializing it.
keystone::schema::hash32_t sha256(
    std::span<const keystone::schema::bytes_view_t> parts);

}  // namespace keystone::crypto
