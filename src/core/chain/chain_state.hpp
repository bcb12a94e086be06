#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/model/types.hpp"

namespace sealtrail {

// Cursor for the next append: (last_hash, block_number). Not internally synchronized;
// the ledger owns it and mutates it only inside its append critical section.
class ChainState {
public:
  enum class Phase {
    Uninitialized,
    Ready,
  };

  // Uninitialized -> Ready, exactly once. nullopt means an empty store: (0, genesis).
  Result initialize(const std::optional<ChainTip>& persisted_tip);

  void advance(std::string hash, std::uint64_t block_number);

  [[nodiscard]] Phase phase() const { return phase_; }
  [[nodiscard]] bool ready() const { return phase_ == Phase::Ready; }
  [[nodiscard]] std::uint64_t block_number() const { return tip_.block_number; }
  [[nodiscard]] const std::string& last_hash() const { return tip_.hash; }
  [[nodiscard]] const ChainTip& tip() const { return tip_; }

private:
  Phase phase_ = Phase::Uninitialized;
  ChainTip tip_{};
};

}  // namespace sealtrail
