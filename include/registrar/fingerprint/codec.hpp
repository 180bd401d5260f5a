#pragma once

#include <registrar/schema/operation.hpp>
#include <registrar/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace registrar::fingerprint {

/// Domain tag folded into every pre-image so registry fingerprints never
/// alias digests produced for other purposes.
inline constexpr auto kFingerprintDomain =
    std::string_view{"registrar/fingerprint/v1"};

/// Deterministic, injective mapping from an operation to its fingerprint.
///
/// The pre-image is the SCALE encoding of (domain, kind, record_id, nonce).
/// SCALE prefixes every string with its compact length, so ("A", "BC") and
/// ("AB", "C") produce different pre-images. The fingerprint is the BLAKE3-256
/// digest of that pre-image.
struct codec final {
  /// Canonical pre-image bytes; this is also the message signers sign.
  static registrar::schema::bytes_t preimage(
      const registrar::schema::operation_t& operation);

  static registrar::schema::fingerprint_t encode(
      const registrar::schema::operation_t& operation);

  /// Validate raw input and encode it. Returns std::nullopt with `error` set
  /// when the input cannot be represented.
  static std::optional<registrar::schema::fingerprint_t> encode(
      const std::string_view kind,
      const std::string_view record_id,
      const int64_t nonce,
      std::string& error);
};

}  // namespace registrar::fingerprint
