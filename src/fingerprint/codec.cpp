#include <registrar/blake3/hash.hpp>
#include <registrar/fingerprint/codec.hpp>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <string>
#include <tuple>

using namespace registrar::schema;

namespace registrar::fingerprint {

bytes_t codec::preimage(const operation_t& operation) {
  auto encoder = registrar::schema::encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{std::string{kFingerprintDomain},
                                   operation.kind, operation.record_id,
                                   operation.nonce});
}

fingerprint_t codec::encode(const operation_t& operation) {
  auto material = preimage(operation);
  return registrar::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<fingerprint_t> codec::encode(const std::string_view kind,
                                           const std::string_view record_id,
                                           const int64_t nonce,
                                           std::string& error) {
  auto operation = make_operation(kind, record_id, nonce, error);
  if (!operation) {
    return std::nullopt;
  }
  return encode(*operation);
}

}  // namespace registrar::fingerprint
