#include <gtest/gtest.h>
#include <registrar/blake3/hash.hpp>
#include <registrar/fingerprint/codec.hpp>
#include <registrar/schema/operation.hpp>

#include <set>
#include <string>

namespace {

registrar::schema::fingerprint_t encode(const std::string_view kind,
                                        const std::string_view record_id,
                                        const int64_t nonce) {
  auto error = std::string{};
  auto fingerprint =
      registrar::fingerprint::codec::encode(kind, record_id, nonce, error);
  EXPECT_TRUE(fingerprint.has_value()) << error;
  return fingerprint.value_or(registrar::schema::make_zero_hash());
}

}  // namespace

using registrar::schema::kOperationCreate;
using registrar::schema::kOperationDelete;
using registrar::schema::kOperationUpdate;

TEST(fingerprint_codec, is_deterministic) {
  EXPECT_EQ(encode(kOperationCreate, "user_1", 100),
            encode(kOperationCreate, "user_1", 100));
}

TEST(fingerprint_codec, shifting_bytes_between_fields_changes_fingerprint) {
  EXPECT_NE(encode("A", "BC", 1), encode("AB", "C", 1));
  EXPECT_NE(encode(kOperationUpdate, "data1", 23),
            encode(kOperationUpdate, "data12", 3));
}

TEST(fingerprint_codec, every_field_contributes) {
  auto base = encode(kOperationCreate, "user_1", 100);
  EXPECT_NE(base, encode(kOperationUpdate, "user_1", 100));
  EXPECT_NE(base, encode(kOperationCreate, "user_2", 100));
  EXPECT_NE(base, encode(kOperationCreate, "user_1", 101));
}

TEST(fingerprint_codec, preimage_length_prefixes_variable_fields) {
  auto error = std::string{};
  auto left = registrar::schema::make_operation("A", "BC", 1, error);
  auto right = registrar::schema::make_operation("AB", "C", 1, error);
  ASSERT_TRUE(left && right);
  auto left_bytes = registrar::fingerprint::codec::preimage(*left);
  auto right_bytes = registrar::fingerprint::codec::preimage(*right);
  EXPECT_EQ(left_bytes.size(), right_bytes.size());
  EXPECT_NE(left_bytes, right_bytes);
}

TEST(fingerprint_codec, fingerprint_is_blake3_of_preimage) {
  auto error = std::string{};
  auto operation =
      registrar::schema::make_operation(kOperationDelete, "order-9", 77, error);
  ASSERT_TRUE(operation.has_value());
  auto preimage = registrar::fingerprint::codec::preimage(*operation);
  EXPECT_EQ(registrar::fingerprint::codec::encode(*operation),
            registrar::blake3::hash(registrar::schema::bytes_view_t{
                preimage.data(), preimage.size()}));
}

TEST(fingerprint_codec, distinct_inputs_do_not_collide) {
  auto seen = std::set<registrar::schema::fingerprint_t>{};
  for (const auto* kind : {"Create", "Update", "Delete", "C", "Cr"}) {
    for (const auto* record : {"u", "u1", "1", "eate", "user_1"}) {
      for (int64_t nonce = 0; nonce < 4; ++nonce) {
        EXPECT_TRUE(seen.insert(encode(kind, record, nonce)).second)
            << kind << ":" << record << ":" << nonce;
      }
    }
  }
}

TEST(fingerprint_codec, reports_encoding_errors_for_invalid_input) {
  auto error = std::string{};
  EXPECT_FALSE(registrar::fingerprint::codec::encode("", "user_1", 1, error)
                   .has_value());
  EXPECT_FALSE(error.empty());
  error.clear();
  auto negative = registrar::fingerprint::codec::encode(kOperationCreate,
                                                        "user_1", -5, error);
  EXPECT_FALSE(negative.has_value());
  EXPECT_FALSE(error.empty());
}
