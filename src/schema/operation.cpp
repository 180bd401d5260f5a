#include <registrar/schema/operation.hpp>

#include <algorithm>
#include <fmt/format.h>

namespace registrar::schema {

namespace {

bool is_identifier_char(const char c) {
  const auto uc = static_cast<unsigned char>(c);
  return uc > 0x20 && uc != 0x7F;
}

}  // namespace

std::optional<operation_t> make_operation(const std::string_view kind,
                                          const std::string_view record_id,
                                          const int64_t nonce,
                                          std::string& error) {
  if (kind.empty()) {
    error = "operation kind must not be empty";
    return std::nullopt;
  }
  if (kind.size() > kMaxOperationKindLength) {
    error = fmt::format("operation kind exceeds {} bytes",
                        kMaxOperationKindLength);
    return std::nullopt;
  }
  if (!std::ranges::all_of(kind, is_identifier_char)) {
    error = "operation kind must not contain whitespace or control characters";
    return std::nullopt;
  }
  if (record_id.empty()) {
    error = "record id must not be empty";
    return std::nullopt;
  }
  if (record_id.size() > kMaxRecordIdLength) {
    error = fmt::format("record id exceeds {} bytes", kMaxRecordIdLength);
    return std::nullopt;
  }
  if (nonce < 0) {
    error = fmt::format("nonce must be non-negative, got {}", nonce);
    return std::nullopt;
  }
  return operation_t{.kind = std::string{kind},
                     .record_id = std::string{record_id},
                     .nonce = static_cast<nonce_t>(nonce)};
}

}  // namespace registrar::schema
