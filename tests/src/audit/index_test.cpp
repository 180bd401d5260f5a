#include <gtest/gtest.h>
#include <registrar/audit/index.hpp>
#include <registrar/testing/common.hpp>

using namespace registrar::schema;

namespace {

audit_event_t make_event(const signer_id_t& signer, const uint8_t seed,
                         const sequence_t sequence) {
  return audit_event_t{.signer = signer,
                       .fingerprint = registrar::testing::make_hash(seed),
                       .sequence = sequence,
                       .nonce = seed};
}

}  // namespace

TEST(audit_index, records_by_returns_signer_events_in_sequence_order) {
  auto index = registrar::audit::index{};
  auto alice = registrar::testing::make_named_signer("alice");
  auto bob = registrar::testing::make_named_signer("bob");
  index.record(make_event(alice, 1, 1));
  index.record(make_event(bob, 2, 2));
  index.record(make_event(alice, 3, 3));

  auto history = index.records_by(alice);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].sequence, 1u);
  EXPECT_EQ(history[1].sequence, 3u);
  EXPECT_EQ(history[1].fingerprint, registrar::testing::make_hash(3));
  EXPECT_EQ(index.records_by(bob).size(), 1u);
  EXPECT_EQ(index.size(), 3u);
}

TEST(audit_index, unknown_signer_has_empty_history) {
  auto index = registrar::audit::index{};
  EXPECT_TRUE(
      index.records_by(registrar::testing::make_named_signer("nobody")).empty());
  EXPECT_FALSE(index.event_for(registrar::testing::make_hash(1)).has_value());
}

TEST(audit_index, republishing_a_fingerprint_is_ignored) {
  auto index = registrar::audit::index{};
  auto alice = registrar::testing::make_named_signer("alice");
  auto bob = registrar::testing::make_named_signer("bob");
  index.record(make_event(alice, 1, 1));
  index.record(make_event(bob, 1, 9));

  EXPECT_EQ(index.size(), 1u);
  EXPECT_TRUE(index.records_by(bob).empty());
  auto event = index.event_for(registrar::testing::make_hash(1));
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->signer, alice);
}

TEST(audit_index, rebuild_orders_unsorted_entries) {
  auto index = registrar::audit::index{};
  auto signer = signer_id_t{registrar::testing::make_ed25519_signer(4)};
  index.record(make_event(registrar::testing::make_named_signer("stale"), 99,
                          1));

  auto entries = std::vector<ledger_entry_t>{
      ledger_entry_t{.fingerprint = registrar::testing::make_hash(30),
                     .signer = signer,
                     .nonce = 3,
                     .sequence = 3},
      ledger_entry_t{.fingerprint = registrar::testing::make_hash(10),
                     .signer = signer,
                     .nonce = 1,
                     .sequence = 1},
      ledger_entry_t{.fingerprint = registrar::testing::make_hash(20),
                     .signer = signer,
                     .nonce = 2,
                     .sequence = 2}};
  index.rebuild(entries);

  EXPECT_EQ(index.size(), 3u);
  EXPECT_FALSE(index.event_for(registrar::testing::make_hash(99)).has_value());
  auto history = index.records_by(signer);
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].nonce, 1u);
  EXPECT_EQ(history[1].nonce, 2u);
  EXPECT_EQ(history[2].nonce, 3u);
}
