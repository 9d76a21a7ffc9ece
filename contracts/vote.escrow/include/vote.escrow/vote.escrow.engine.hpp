#pragma once

#include <vote.escrow/vote.escrow.const.hpp>
#include <vote.escrow/vote.escrow.point.hpp>
#include <vote.escrow/vote.escrow.search.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace shibdao {

struct chain_clock_st {
    uint64_t            now         = 0;        // block time, seconds
    uint64_t            block       = 0;        // block number
};

/**
 * Voting escrow bookkeeping: lock ledger, global and per-account point history,
 * slope change schedule and the historical queries built on them.
 *
 * `Store` keeps the state and talks to the token. It must provide:
 *
 *    account_type
 *    uint64_t             epoch() const;                        set_epoch(e)
 *    point_t              point(epoch) const;                   set_point(epoch, p)
 *    uint64_t             user_epoch(owner) const;              set_user_epoch(owner, e)
 *    point_t              user_point(owner, e) const;           set_user_point(owner, e, p)
 *    int64_t              slope_change(ts) const;               set_slope_change(ts, dslope)
 *    locked_balance_st    locked(owner) const;                  set_locked(owner, l)
 *    int64_t              supply() const;                       set_supply(s)
 *    bool                 entered() const;                      set_entered(b)
 *    bool                 transfer_in(from, amount);            transfer_out(to, amount)
 *    bool                 is_contract(account) const;           is_approved(account) const
 *    void                 notify_deposit(owner, value, locktime, type, ts)
 *    void                 notify_withdraw(owner, value, ts)
 *    void                 notify_supply(prev_supply, supply)
 *
 * Missing points, epochs, slope changes and locks read as zero. Contract accounts
 * may only create, increase or extend a lock when `is_approved` lets them.
 *
 * Operations return err::NONE or the first failed precondition; `reason()` tells
 * which. Preconditions are checked before any write, and only a failing token
 * transfer can fail an operation after its writes. The caller runs each operation
 * inside a transaction that is dropped on failure.
 */
template<typename Store>
class escrow_engine {
   public:
      using account_type = typename Store::account_type;

      escrow_engine(Store& store, const chain_clock_st& clock): _store(store), _clock(clock) {}

      const std::string& reason() const { return _reason; }

      /// Writes epoch 0, the point every global walk starts from.
      void seed() {
         point_t p;
         p.ts        = _clock.now;
         p.blk       = _clock.block;
         _store.set_point(0, p);
         _store.set_epoch(0);
      }

      /// Records global data to the checkpoint. A second call at the same time is a no-op.
      err checkpoint() {
         reentrancy_guard guard(_store);
         if (!guard.acquired()) return _fail(err::REENTRANT, "reentrant call");

         if (_store.point(_store.epoch()).ts == _clock.now)
            return err::NONE;

         locked_balance_st empty;
         _checkpoint(nullptr, empty, empty);
         return err::NONE;
      }

      /**
       * Adds `value` to the existing active lock of `owner`, paid by `payer`.
       * It never creates a lock, so anyone may top up another account.
       */
      err deposit_for(const account_type& payer, const account_type& owner, const int64_t& value) {
         reentrancy_guard guard(_store);
         if (!guard.acquired()) return _fail(err::REENTRANT, "reentrant call");

         auto locked = _store.locked(owner);
         if (value <= 0)                     return _fail(err::NOT_POSITIVE, "need non-zero value");
         if (locked.amount <= 0)             return _fail(err::RECORD_NOT_FOUND, "no existing lock found");
         if (locked.end <= _clock.now)       return _fail(err::TIME_EXPIRED, "cannot add to expired lock, withdraw");

         return _deposit_for(payer, owner, value, 0, locked, DEPOSIT_FOR_TYPE);
      }

      /// Locks `value` for `owner` until `unlock_time` rounded down to a whole week.
      err create_lock(const account_type& owner, const int64_t& value, const uint64_t& unlock_time) {
         reentrancy_guard guard(_store);
         if (!guard.acquired()) return _fail(err::REENTRANT, "reentrant call");
         if (!_allowed_depositor(owner)) return _fail(err::NO_AUTH, "smart contract depositors not allowed");

         auto rounded   = floor_week(unlock_time);
         auto locked    = _store.locked(owner);
         if (value <= 0)                        return _fail(err::NOT_POSITIVE, "need non-zero value");
         if (locked.amount != 0)                return _fail(err::RECORD_EXISTING, "withdraw old tokens first");
         if (rounded <= _clock.now)             return _fail(err::TIME_EXPIRED, "can only lock until time in the future");
         if (rounded > _clock.now + MAXTIME)    return _fail(err::OVERSIZED, "voting lock can be 4 years max");

         return _deposit_for(owner, owner, value, rounded, locked, CREATE_LOCK_TYPE);
      }

      /// Adds `value` to the lock of `owner` without changing its unlock time.
      err increase_amount(const account_type& owner, const int64_t& value) {
         reentrancy_guard guard(_store);
         if (!guard.acquired()) return _fail(err::REENTRANT, "reentrant call");
         if (!_allowed_depositor(owner)) return _fail(err::NO_AUTH, "smart contract depositors not allowed");

         auto locked = _store.locked(owner);
         if (value <= 0)                     return _fail(err::NOT_POSITIVE, "need non-zero value");
         if (locked.amount <= 0)             return _fail(err::RECORD_NOT_FOUND, "no existing lock found");
         if (locked.end <= _clock.now)       return _fail(err::TIME_EXPIRED, "cannot add to expired lock, withdraw");

         return _deposit_for(owner, owner, value, 0, locked, INCREASE_LOCK_AMOUNT);
      }

      /// Extends the lock of `owner` to `unlock_time` rounded down to a whole week.
      err increase_unlock_time(const account_type& owner, const uint64_t& unlock_time) {
         reentrancy_guard guard(_store);
         if (!guard.acquired()) return _fail(err::REENTRANT, "reentrant call");
         if (!_allowed_depositor(owner)) return _fail(err::NO_AUTH, "smart contract depositors not allowed");

         auto rounded   = floor_week(unlock_time);
         auto locked    = _store.locked(owner);
         if (locked.end <= _clock.now)          return _fail(err::TIME_EXPIRED, "lock expired");
         if (locked.amount <= 0)                return _fail(err::RECORD_NOT_FOUND, "nothing is locked");
         if (rounded <= locked.end)             return _fail(err::PARAM_ERROR, "can only increase lock duration");
         if (rounded > _clock.now + MAXTIME)    return _fail(err::OVERSIZED, "voting lock can be 4 years max");

         return _deposit_for(owner, owner, 0, rounded, locked, INCREASE_UNLOCK_TIME);
      }

      /// Returns the whole expired lock of `owner`; `withdrawn` receives the amount.
      err withdraw(const account_type& owner, int64_t& withdrawn) {
         reentrancy_guard guard(_store);
         if (!guard.acquired()) return _fail(err::REENTRANT, "reentrant call");

         auto locked = _store.locked(owner);
         if (locked.amount <= 0)             return _fail(err::RECORD_NOT_FOUND, "no locked balance");
         if (_clock.now < locked.end)        return _fail(err::TIME_PREMATURE, "the lock didn't expire");

         withdrawn               = locked.amount;
         auto old_locked         = locked;
         locked                  = locked_balance_st{};
         _store.set_locked(owner, locked);

         auto supply_before      = _store.supply();
         _store.set_supply(supply_before - withdrawn);

         _checkpoint(&owner, old_locked, locked);

         if (!_store.transfer_out(owner, withdrawn))
            return _fail(err::TRANSFER_FAILED, "token transfer out failed");

         _store.notify_withdraw(owner, withdrawn, _clock.now);
         _store.notify_supply(supply_before, supply_before - withdrawn);
         return err::NONE;
      }

      /// Voting power of `owner` at time `t`, decayed from the account point in force at `t`.
      int64_t balance_of(const account_type& owner, const uint64_t& t) const {
         auto epoch = find_user_timestamp_epoch(owner, t);
         if (epoch == 0)
            return 0;
         return decay(_store.user_point(owner, epoch), t).bias;
      }

      /// Voting power of `owner` at `block`, which must not be in the future.
      err balance_of_at(const account_type& owner, const uint64_t& block, int64_t& power) const {
         if (block > _clock.block) return _fail(err::PARAM_ERROR, "block is in the future");

         auto user_epoch   = find_user_block_epoch(owner, block);
         auto upoint       = _store.user_point(owner, user_epoch);

         auto max_epoch    = _store.epoch();
         auto epoch        = find_block_epoch(block, max_epoch);
         auto block_time   = _block_time(epoch, max_epoch, block);

         power = decay(upoint, block_time).bias;
         return err::NONE;
      }

      /// Total voting power at time `t`, replayed from the global point in force at `t`.
      int64_t total_supply(const uint64_t& t) const {
         auto epoch = find_timestamp_epoch(t, _store.epoch());
         return supply_at(_store.point(epoch), t);
      }

      /// Total voting power at `block`, which must not be in the future.
      err total_supply_at(const uint64_t& block, int64_t& power) const {
         if (block > _clock.block) return _fail(err::PARAM_ERROR, "block is in the future");

         auto max_epoch    = _store.epoch();
         auto epoch        = find_block_epoch(block, max_epoch);
         power = supply_at(_store.point(epoch), _block_time(epoch, max_epoch, block));
         return err::NONE;
      }

      /**
       * Replays the weekly walk from `last_point` to `t` without touching the store.
       * Callers start from the point in force at `t`, so a `t` before `last_point`
       * only happens before the seed point and gives 0.
       */
      int64_t supply_at(point_t last_point, const uint64_t& t) const {
         if (t < last_point.ts)
            return 0;

         int128 bias = last_point.bias;
         auto t_i    = floor_week(last_point.ts);
         for (uint32_t i = 0; i < MAX_WALK_WEEKS; i++) {
            t_i += WEEK;
            int64_t d_slope = 0;
            if (t_i > t)
               t_i = t;
            else
               d_slope = _store.slope_change(t_i);

            bias -= (int128)last_point.slope * (int128)(t_i - last_point.ts);
            if (t_i == t)
               break;
            last_point.slope  += d_slope;
            if (last_point.slope < 0)
               last_point.slope = 0;
            last_point.ts     = t_i;
         }
         return clamp_bias(bias);
      }

      uint64_t find_block_epoch(const uint64_t& block, const uint64_t& max_epoch) const {
         return bisect_history(block, max_epoch, [&](const uint64_t& epoch) {
            return _store.point(epoch).blk;
         });
      }

      uint64_t find_user_block_epoch(const account_type& owner, const uint64_t& block) const {
         return bisect_history(block, _store.user_epoch(owner), [&](const uint64_t& epoch) {
            return _store.user_point(owner, epoch).blk;
         });
      }

      uint64_t find_timestamp_epoch(const uint64_t& t, const uint64_t& max_epoch) const {
         return bisect_history(t, max_epoch, [&](const uint64_t& epoch) {
            return _store.point(epoch).ts;
         });
      }

      /// 0 when `owner` had no point yet at `t`.
      uint64_t find_user_timestamp_epoch(const account_type& owner, const uint64_t& t) const {
         return bisect_history(t, _store.user_epoch(owner), [&](const uint64_t& epoch) {
            return _store.user_point(owner, epoch).ts;
         });
      }

      uint64_t locked_end(const account_type& owner) const {
         return _store.locked(owner).end;
      }

      int64_t last_user_slope(const account_type& owner) const {
         return _store.user_point(owner, _store.user_epoch(owner)).slope;
      }

      uint64_t user_point_ts(const account_type& owner, const uint64_t& idx) const {
         return _store.user_point(owner, idx).ts;
      }

   private:
      /// Holds the store's entered flag for the lifetime of one mutating call.
      class reentrancy_guard {
         public:
            explicit reentrancy_guard(Store& store): _store(store), _acquired(!store.entered()) {
               if (_acquired) _store.set_entered(true);
            }
            ~reentrancy_guard() {
               if (_acquired) _store.set_entered(false);
            }
            bool acquired() const { return _acquired; }

         private:
            Store&   _store;
            bool     _acquired;
      };

      bool _allowed_depositor(const account_type& account) const {
         return !_store.is_contract(account) || _store.is_approved(account);
      }

      err _fail(const err& code, const std::string& reason) const {
         _reason = reason;
         return code;
      }

      err _deposit_for(const account_type& payer, const account_type& owner, const int64_t& value,
                       const uint64_t& unlock_time, locked_balance_st locked, const deposit_type& type) {
         auto supply_before = _store.supply();
         if (value > std::numeric_limits<int64_t>::max() - supply_before)
            return _fail(err::OVERSIZED, "supply overflow");
         if (value > std::numeric_limits<int64_t>::max() - locked.amount)
            return _fail(err::OVERSIZED, "locked amount overflow");

         _store.set_supply(supply_before + value);

         auto old_locked   = locked;
         locked.amount     += value;
         if (unlock_time != 0)
            locked.end     = unlock_time;
         _store.set_locked(owner, locked);

         // The slope of an existing lock may change, so the walk always runs with both lines.
         _checkpoint(&owner, old_locked, locked);

         if (value != 0 && !_store.transfer_in(payer, value))
            return _fail(err::TRANSFER_FAILED, "token transfer in failed");

         _store.notify_deposit(owner, value, locked.end, type, _clock.now);
         _store.notify_supply(supply_before, supply_before + value);
         return err::NONE;
      }

      /**
       * Catches the global history up to now, week by week, then folds the change of
       * `owner` (when given) into the newest global point and the slope schedule.
       * At most MAX_WALK_WEEKS weeks are walked per call; longer gaps need more calls.
       */
      void _checkpoint(const account_type* owner, const locked_balance_st& old_locked, const locked_balance_st& new_locked) {
         const auto now    = _clock.now;
         point_t u_old;
         point_t u_new;
         int64_t old_dslope   = 0;
         int64_t new_dslope   = 0;
         uint64_t epoch       = _store.epoch();

         if (owner != nullptr) {
            u_old = line_for(old_locked.amount, old_locked.end, now);
            u_new = line_for(new_locked.amount, new_locked.end, now);

            // dslope is the change in slope applied at that time, read before it is rewritten
            old_dslope = _store.slope_change(old_locked.end);
            if (new_locked.end != 0) {
               if (new_locked.end == old_locked.end)
                  new_dslope = old_dslope;
               else
                  new_dslope = _store.slope_change(new_locked.end);
            }
         }

         point_t last_point         = _store.point(epoch);
         auto last_checkpoint       = last_point.ts;
         const auto initial_point   = last_point;

         int128 block_slope = 0;     // dblock/dt scaled by MULTIPLIER
         if (now > last_point.ts)
            block_slope = MULTIPLIER * ((int128)_clock.block - (int128)last_point.blk) / (int128)(now - last_point.ts);

         auto t_i = floor_week(last_checkpoint);
         for (uint32_t i = 0; i < MAX_WALK_WEEKS; i++) {
            t_i += WEEK;
            int64_t d_slope = 0;
            if (t_i > now)
               t_i = now;
            else
               d_slope = _store.slope_change(t_i);

            last_point.bias   -= last_point.slope * (int64_t)(t_i - last_checkpoint);
            last_point.slope  += d_slope;
            if (last_point.bias < 0)      // this can happen
               last_point.bias = 0;
            if (last_point.slope < 0)     // this cannot happen, but just in case
               last_point.slope = 0;
            last_checkpoint   = t_i;
            last_point.ts     = t_i;
            last_point.blk    = initial_point.blk
                              + (uint64_t)(block_slope * (int128)(t_i - initial_point.ts) / MULTIPLIER);
            epoch += 1;
            if (t_i == now) {
               last_point.blk = _clock.block;
               break;
            }
            _store.set_point(epoch, last_point);
         }

         _store.set_epoch(epoch);

         if (owner != nullptr) {
            last_point.slope  += u_new.slope - u_old.slope;
            last_point.bias   += u_new.bias - u_old.bias;
            if (last_point.slope < 0)
               last_point.slope = 0;
            if (last_point.bias < 0)
               last_point.bias = 0;
         }

         _store.set_point(epoch, last_point);

         if (owner == nullptr)
            return;

         // Schedule the slope changes (slope is going down):
         // new_user_slope is subtracted at new_locked.end and old_user_slope added back at old_locked.end
         if (old_locked.end > now) {
            old_dslope += u_old.slope;       // cancel the old line
            if (new_locked.end == old_locked.end)
               old_dslope -= u_new.slope;    // a new deposit, not an extension
            _store.set_slope_change(old_locked.end, old_dslope);
         }

         if (new_locked.end > now && new_locked.end > old_locked.end) {
            new_dslope -= u_new.slope;
            _store.set_slope_change(new_locked.end, new_dslope);
         }

         auto user_epoch   = _store.user_epoch(*owner) + 1;
         _store.set_user_epoch(*owner, user_epoch);
         u_new.ts          = now;
         u_new.blk         = _clock.block;
         _store.set_user_point(*owner, user_epoch, u_new);
      }

      /// Timestamp of `block`, interpolated inside the epoch that contains it.
      uint64_t _block_time(const uint64_t& epoch, const uint64_t& max_epoch, const uint64_t& block) const {
         auto point_0      = _store.point(epoch);
         int128 d_block    = 0;
         int128 d_t        = 0;
         if (epoch < max_epoch) {
            auto point_1   = _store.point(epoch + 1);
            d_block        = (int128)point_1.blk - (int128)point_0.blk;
            d_t            = (int128)point_1.ts - (int128)point_0.ts;
         } else {
            d_block        = (int128)_clock.block - (int128)point_0.blk;
            d_t            = (int128)_clock.now - (int128)point_0.ts;
         }

         int128 block_time = point_0.ts;
         if (d_block != 0)
            block_time += d_t * ((int128)block - (int128)point_0.blk) / d_block;
         return block_time < 0 ? 0 : (uint64_t)block_time;
      }

      Store&               _store;
      chain_clock_st       _clock;
      mutable std::string  _reason;
};

} //namespace shibdao
