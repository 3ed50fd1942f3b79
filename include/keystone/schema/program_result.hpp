#pragma once

#include <keystone/schema/program_error.hpp>

#include <optional>
#include <string>
#include <utility>

namespace keystone::schema {

/// Outcome of one program invocation or one host collaborator call.
///
/// A failed result means the host must discard every account write made by
/// the invocation.
struct program_result final {
  std::optional<program_error> error;
  std::string log;

  bool ok() const { return !error.has_value(); }
};

inline program_result make_success() {
  return program_result{};
}

inline program_result make_failure(const program_error error,
                                   std::string log) {
  return program_result{.error = error, .log = std::move(log)};
}

}  // namespace keystone::schema
