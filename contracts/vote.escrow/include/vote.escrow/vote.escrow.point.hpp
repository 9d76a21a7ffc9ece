#pragma once

#include <vote.escrow/vote.escrow.const.hpp>

#include <cstdint>
#include <limits>

namespace shibdao {

/**
 * A sample of a decay line: the voting power is `bias` at `ts` and drops by
 * `slope` every second after, until the next slope change.
 */
struct point_t {
    int64_t             bias        = 0;
    int64_t             slope       = 0;        // -dweight / dt
    uint64_t            ts          = 0;
    uint64_t            blk         = 0;        // block number
};

struct locked_balance_st {
    int64_t             amount      = 0;
    uint64_t            end         = 0;        // unlock time, 0 when nothing is locked
};

inline uint64_t floor_week(const uint64_t& t) {
    return (t / WEEK) * WEEK;
}

inline int64_t clamp_bias(const int128& v) {
    if (v < 0) return 0;
    if (v > std::numeric_limits<int64_t>::max()) return std::numeric_limits<int64_t>::max();
    return (int64_t)v;
}

/**
 * Decay line of `amount` locked until `end`, sampled at `now`.
 * The slope is truncated, so the bias of a full MAXTIME lock is slightly below `amount`.
 */
inline point_t line_for(const int64_t& amount, const uint64_t& end, const uint64_t& now) {
    point_t p;
    if (end > now && amount > 0) {
        p.slope     = amount / (int64_t)MAXTIME;
        p.bias      = p.slope * (int64_t)(end - now);
    }
    p.ts            = now;
    return p;
}

/**
 * Moves `p` forward to time `t` along its own slope. Neither bias nor slope go below
 * zero. A line is never projected backwards: `t` before `p.ts` keeps the bias of `p`.
 */
inline point_t decay(const point_t& p, const uint64_t& t) {
    point_t ret     = p;
    int128 dt       = t > p.ts ? (int128)(t - p.ts) : 0;
    ret.bias        = clamp_bias((int128)p.bias - (int128)p.slope * dt);
    if (ret.slope < 0)
        ret.slope   = 0;
    ret.ts          = t;
    return ret;
}

} //namespace shibdao
