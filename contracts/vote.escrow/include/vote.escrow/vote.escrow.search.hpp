#pragma once

#include <vote.escrow/vote.escrow.const.hpp>

#include <cstdint>

namespace shibdao {

/**
 * Greatest index in [0, max_index] whose recorded key is <= `key`.
 * History points are searched this way by block number and by timestamp.
 *
 * @param key_of - key_of(i) returns the block number or timestamp stored at index i;
 *                 it must be non-decreasing in i
 *
 * Returns 0 when every index is past `key`.
 */
template<typename KeyOf>
uint64_t bisect_history(const uint64_t& key, const uint64_t& max_index, KeyOf&& key_of) {
    uint64_t min = 0;
    uint64_t max = max_index;
    for (uint32_t i = 0; i < MAX_BISECT_ROUNDS; i++) {
        if (min >= max)
            break;
        uint64_t mid = min + (max - min + 1) / 2;
        if (key_of(mid) <= key)
            min = mid;
        else
            max = mid - 1;
    }
    return min;
}

} //namespace shibdao
