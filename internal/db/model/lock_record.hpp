#pragma once

#include <cstdint>
#include <string>

#include "repricer/engine/v1/state.pb.h"

namespace repricer::db::model {

/*
  Processing lock.

  lock_key is unique; a row whose expires_at_ms <= now is treated as
  absent and may be reclaimed by another owner.
*/

struct LockRecord {
  std::string                   lock_key;
  repricer::engine::v1::LockType type = repricer::engine::v1::LOCK_TYPE_UNSPECIFIED;

  // holder token of one acquisition: "<process id>:lock-<uuid>"
  std::string owner;

  uint64_t expires_at_ms = 0;
  uint64_t created_at_ms = 0;
};

} // namespace repricer::db::model
