#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: operation.
// Registry workflow: Identity of a caller-side write (kind, target record,
// uniqueness axis). Only make_operation builds one, so every fingerprint is
// derived from validated input.
namespace registrar::schema {

inline constexpr auto kOperationCreate = std::string_view{"Create"};
inline constexpr auto kOperationUpdate = std::string_view{"Update"};
inline constexpr auto kOperationDelete = std::string_view{"Delete"};

inline constexpr std::size_t kMaxOperationKindLength = 64;
inline constexpr std::size_t kMaxRecordIdLength = 1024;

template <uint16_t Version>
struct operation;

template <>
struct operation<1> final {
  uint16_t version{1};
  std::string kind;
  std::string record_id;
  nonce_t nonce{};

  bool operator==(const operation<1>&) const = default;
};

using operation_t = operation<1>;

/// Validate and build an operation.
///
/// Rejects an empty or oversized kind, a kind containing whitespace or
/// control characters, an empty or oversized record id, and a negative
/// nonce. On failure `error` holds the reason and std::nullopt is returned.
std::optional<operation_t> make_operation(const std::string_view kind,
                                          const std::string_view record_id,
                                          const int64_t nonce,
                                          std::string& error);

}  // namespace registrar::schema
