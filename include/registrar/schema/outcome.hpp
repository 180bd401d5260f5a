#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace registrar::schema {

enum class outcome_code : uint32_t {
  accepted = 0,
  duplicate_fingerprint = 1,
  encoding_error = 2,
  backend_unavailable = 3,
  coalescer_timeout = 4,
  signature_verification_failed = 5,
};

std::string_view to_string(const outcome_code code);

template <uint16_t Version>
struct outcome;

/// Result of a submission at every layer (ledger, coalescer, registry).
///
/// `sequence` is the ledger sequence of the accepted row; for a
/// duplicate it is the sequence of the existing row when known, otherwise 0.
template <>
struct outcome<1> final {
  uint16_t version{1};
  outcome_code code{outcome_code::accepted};
  sequence_t sequence{};
  std::string log;

  bool accepted() const { return code == outcome_code::accepted; }
  bool rejected() const { return code == outcome_code::duplicate_fingerprint; }
};

using outcome_t = outcome<1>;

outcome_t make_accepted(const sequence_t sequence);
outcome_t make_rejected(const sequence_t sequence, std::string log);
outcome_t make_failure(const outcome_code code, std::string log);

}  // namespace registrar::schema
