#include "core/chain/chain_state.hpp"

#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/hash.hpp"

namespace sealtrail {

Result ChainState::initialize(const std::optional<ChainTip>& persisted_tip) {
  if (phase_ == Phase::Ready) {
    return Result::failure("Chain state is already initialized.", ErrorKind::Validation);
  }

  if (!persisted_tip) {
    tip_ = ChainTip{0, std::string{kGenesisHash}};
  } else {
    if (persisted_tip->block_number == 0 || !util::is_digest_hex(persisted_tip->hash)) {
      return Result::failure("Persisted chain tip is malformed (block " +
                                 std::to_string(persisted_tip->block_number) + ").",
                             ErrorKind::Store);
    }
    tip_ = *persisted_tip;
  }

  phase_ = Phase::Ready;
  return Result::success("Chain state ready at block " + std::to_string(tip_.block_number) + ".");
}

void ChainState::advance(std::string hash, std::uint64_t block_number) {
  tip_.hash = std::move(hash);
  tip_.block_number = block_number;
}

}  // namespace sealtrail
