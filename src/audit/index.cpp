#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <mutex>
#include <registrar/audit/index.hpp>

using namespace registrar::schema;

namespace registrar::audit {

void index::record(const audit_event_t& event) {
  auto lock = std::unique_lock{mutex_};
  record_unlocked(event);
}

void index::rebuild(const std::vector<ledger_entry_t>& entries) {
  auto ordered = entries;
  std::ranges::sort(ordered, {}, &ledger_entry_t::sequence);

  auto lock = std::unique_lock{mutex_};
  events_.clear();
  by_signer_.clear();
  for (const auto& entry : ordered) {
    record_unlocked(make_audit_event(entry));
  }
  spdlog::info("Audit index rebuilt with {} events", events_.size());
}

std::vector<audit_event_t> index::records_by(const signer_id_t& signer) const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<audit_event_t>{};
  auto it = by_signer_.find(signer);
  if (it == std::end(by_signer_)) {
    return out;
  }
  out.reserve(it->second.size());
  for (const auto& fingerprint : it->second) {
    out.push_back(events_.at(fingerprint));
  }
  return out;
}

std::optional<audit_event_t> index::event_for(
    const fingerprint_t& fingerprint) const {
  auto lock = std::shared_lock{mutex_};
  auto it = events_.find(fingerprint);
  if (it == std::end(events_)) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t index::size() const {
  auto lock = std::shared_lock{mutex_};
  return events_.size();
}

void index::record_unlocked(const audit_event_t& event) {
  auto [it, inserted] = events_.try_emplace(event.fingerprint, event);
  if (!inserted) {
    spdlog::warn("Audit event for fingerprint {} already indexed",
                 to_hex(event.fingerprint));
    return;
  }
  auto& fingerprints = by_signer_[event.signer];
  // Publication follows ledger order; keep the list sorted if a caller
  // records out of order.
  auto position = std::ranges::upper_bound(
      fingerprints, event.sequence, {},
      [this](const fingerprint_t& value) {
        return events_.at(value).sequence;
      });
  fingerprints.insert(position, event.fingerprint);
}

}  // namespace registrar::audit
