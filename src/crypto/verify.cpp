#include <registrar/crypto/verify.hpp>

#include <spdlog/spdlog.h>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

using namespace registrar::schema;

namespace registrar::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

evp_pkey_ptr make_public_key(const ed25519_signer_id& signer) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  signer.public_key.data(),
                                  signer.public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_public_key(const secp256k1_signer_id& signer) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

// 65-byte secp256k1 signatures carry a recovery id either first
// ([v || r || s]) or last ([r || s || v]). Valid ids are 0..3 or 27 and up.
std::optional<bytes_t> to_der(const secp256k1_signature_t& signature) {
  auto is_recovery_id = [](const uint8_t value) {
    return value <= 3 || value >= 27;
  };
  const auto* compact = static_cast<const uint8_t*>(nullptr);
  if (is_recovery_id(signature.front())) {
    compact = signature.data() + 1;
  } else if (is_recovery_id(signature.back())) {
    compact = signature.data();
  } else {
    return std::nullopt;
  }

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact, 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact + 32, 32, nullptr), BN_free};
  if (!ecdsa_sig || !r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = bytes_t(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* digest,
                   const bytes_view_t& signature,
                   const bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const bytes_view_t& message,
                      const signer_id_t& signer,
                      const signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const ed25519_signer_id& value) {
            const auto* raw = std::get_if<ed25519_signature_t>(&signature);
            if (raw == nullptr) {
              spdlog::debug("ed25519 signer presented a non-ed25519 signature");
              return false;
            }
            auto pkey = make_public_key(value);
            return pkey && digest_verify(pkey.get(), nullptr,
                                         bytes_view_t{*raw}, message);
          },
          [&](const secp256k1_signer_id& value) {
            const auto* raw = std::get_if<secp256k1_signature_t>(&signature);
            if (raw == nullptr) {
              spdlog::debug(
                  "secp256k1 signer presented a non-secp256k1 signature");
              return false;
            }
            auto der = to_der(*raw);
            if (!der) {
              return false;
            }
            auto pkey = make_public_key(value);
            return pkey && digest_verify(pkey.get(), EVP_sha256(),
                                         bytes_view_t{*der}, message);
          },
          [](const named_signer_t& value) {
            spdlog::debug("named signer '{}' cannot present a signature",
                          value);
            return false;
          }},
      signer);
}

}  // namespace registrar::crypto
