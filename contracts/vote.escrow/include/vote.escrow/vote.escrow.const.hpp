#pragma once

#include <cstdint>

namespace shibdao {

using int128 = __int128;

static constexpr uint64_t  DAY_SECONDS          = 24 * 60 * 60;
static constexpr uint64_t  WEEK                 = 7 * DAY_SECONDS;                // all future times are rounded by week
static constexpr uint64_t  MAXTIME              = 4 * 365 * DAY_SECONDS;          // 4 years
static constexpr int128    MULTIPLIER           = 1'000'000'000'000'000'000;      // 10^18, block slope precision

static constexpr uint32_t  MAX_WALK_WEEKS       = 255;      // weeks advanced per checkpoint call
static constexpr uint32_t  MAX_BISECT_ROUNDS    = 128;

enum deposit_type: uint8_t {
   DEPOSIT_FOR_TYPE        = 0,
   CREATE_LOCK_TYPE        = 1,
   INCREASE_LOCK_AMOUNT    = 2,
   INCREASE_UNLOCK_TIME    = 3
};

enum class err: uint8_t {
   NONE                 = 0,
   RECORD_NOT_FOUND     = 1,
   RECORD_EXISTING      = 2,
   CONTRACT_MISMATCH    = 3,
   SYMBOL_MISMATCH      = 4,
   PARAM_ERROR          = 5,
   MEMO_FORMAT_ERROR    = 6,
   PAUSED               = 7,
   NO_AUTH              = 8,
   NOT_POSITIVE         = 9,
   NOT_STARTED          = 10,
   OVERSIZED            = 11,
   TIME_EXPIRED         = 12,
   TIME_PREMATURE       = 13,
   ACTION_REDUNDANT     = 14,
   ACCOUNT_INVALID      = 15,
   TRANSFER_FAILED      = 16,
   REENTRANT            = 17
};

} //namespace shibdao
