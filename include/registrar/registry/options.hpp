#pragma once

#include <chrono>
#include <optional>

namespace registrar::registry {

struct registry_options final {
  /// Default bound on waiting for a coalesced in-flight submission. Unset
  /// waits until the owner's write resolves.
  std::optional<std::chrono::milliseconds> wait_timeout;
};

}  // namespace registrar::registry
