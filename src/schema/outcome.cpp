#include <registrar/schema/outcome.hpp>

#include <utility>

namespace registrar::schema {

std::string_view to_string(const outcome_code code) {
  using enum outcome_code;
  switch (code) {
    case accepted:
      return "accepted";
    case duplicate_fingerprint:
      return "duplicate_fingerprint";
    case encoding_error:
      return "encoding_error";
    case backend_unavailable:
      return "backend_unavailable";
    case coalescer_timeout:
      return "coalescer_timeout";
    case signature_verification_failed:
      return "signature_verification_failed";
  }
  return "unknown";
}

outcome_t make_accepted(const sequence_t sequence) {
  return outcome_t{.code = outcome_code::accepted, .sequence = sequence};
}

outcome_t make_rejected(const sequence_t sequence, std::string log) {
  return outcome_t{.code = outcome_code::duplicate_fingerprint,
                   .sequence = sequence,
                   .log = std::move(log)};
}

outcome_t make_failure(const outcome_code code, std::string log) {
  return outcome_t{.code = code, .log = std::move(log)};
}

}  // namespace registrar::schema
