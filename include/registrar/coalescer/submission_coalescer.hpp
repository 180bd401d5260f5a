#pragma once

#include <spdlog/spdlog.h>
#include <registrar/schema/outcome.hpp>
#include <registrar/schema/primitives.hpp>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <optional>

namespace registrar::coalescer {

/// Collapses concurrent submissions of the same fingerprint into a single
/// ledger write.
///
/// The first caller for a fingerprint owns the pending entry and performs
/// `Ledger::try_insert(fingerprint, signer, nonce)`; callers arriving while
/// that write is in flight attach to its shared outcome instead of touching
/// the ledger. Only the owner can be accepted: an attached caller observes
/// duplicate_fingerprint when the owner won, and the owner's failure
/// otherwise. The pending entry is removed on every exit path, including when
/// the ledger throws.
template <typename Ledger>
class submission_coalescer final {
 public:
  explicit submission_coalescer(Ledger& ledger) : ledger_{ledger} {}

  submission_coalescer(const submission_coalescer&) = delete;
  submission_coalescer& operator=(const submission_coalescer&) = delete;

  /// Submit a claim for `fingerprint`.
  ///
  /// `timeout` bounds how long an attached caller waits for the in-flight
  /// write; on expiry it gets coalescer_timeout while the write carries on.
  /// The owning caller always runs its write to completion.
  registrar::schema::outcome_t submit(
      const registrar::schema::fingerprint_t& fingerprint,
      const registrar::schema::signer_id_t& signer,
      const registrar::schema::nonce_t nonce,
      const std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
    auto promise = std::optional<std::promise<registrar::schema::outcome_t>>{};
    auto future = std::shared_future<registrar::schema::outcome_t>{};
    {
      auto lock = std::scoped_lock{mutex_};
      auto it = pending_.find(fingerprint);
      if (it != std::end(pending_)) {
        future = it->second;
      } else {
        promise.emplace();
        future = promise->get_future().share();
        pending_.emplace(fingerprint, future);
      }
    }

    if (!promise) {
      spdlog::debug("Fingerprint {} already in flight; attaching",
                    registrar::schema::to_hex(fingerprint));
      return attach(future, timeout);
    }

    auto result = registrar::schema::outcome_t{};
    try {
      result = ledger_.try_insert(fingerprint, signer, nonce);
    } catch (...) {
      release(fingerprint);
      promise->set_exception(std::current_exception());
      throw;
    }
    release(fingerprint);
    promise->set_value(result);
    return result;
  }

  /// Number of fingerprints with a write in flight.
  std::size_t pending_count() const {
    auto lock = std::scoped_lock{mutex_};
    return pending_.size();
  }

 private:
  registrar::schema::outcome_t attach(
      const std::shared_future<registrar::schema::outcome_t>& future,
      const std::optional<std::chrono::milliseconds> timeout) const {
    if (timeout.has_value() &&
        future.wait_for(*timeout) != std::future_status::ready) {
      return registrar::schema::make_failure(
          registrar::schema::outcome_code::coalescer_timeout,
          "timed out waiting for in-flight submission");
    }
    const auto& shared = future.get();
    switch (shared.code) {
      case registrar::schema::outcome_code::accepted:
      case registrar::schema::outcome_code::duplicate_fingerprint:
        return registrar::schema::make_rejected(
            shared.sequence, "fingerprint claimed by a concurrent submission");
      default:
        return shared;
    }
  }

  void release(const registrar::schema::fingerprint_t& fingerprint) {
    auto lock = std::scoped_lock{mutex_};
    pending_.erase(fingerprint);
  }

  mutable std::mutex mutex_;
  Ledger& ledger_;
  std::map<registrar::schema::fingerprint_t,
           std::shared_future<registrar::schema::outcome_t>>
      pending_;
};

}  // namespace registrar::coalescer
