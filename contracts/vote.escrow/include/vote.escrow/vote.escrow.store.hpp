#pragma once

#include <vote.escrow/vote.escrow.db.hpp>
#include <vote.escrow/vote.escrow.engine.hpp>
#include <vote.escrow/vote.escrow.utils.hpp>
#include <amax.system/amax.system.db.hpp>
#include <smart.wallet.checker/smart.wallet.checker.db.hpp>

namespace shibdao {

/**
 * Escrow state kept in the contract tables and the global singleton.
 * Token movement and event logs are sent as inline actions, so they only take
 * effect when the whole action succeeds.
 */
class chain_store {
   public:
      using account_type = name;

      chain_store(const name& self, global_t& gstate): _self(self), _gstate(gstate),
            _points(self, self.value), _user_epochs(self, self.value),
            _slope_changes(self, self.value), _locks(self, self.value) {}

      uint64_t epoch() const { return _gstate.epoch; }
      void set_epoch(const uint64_t& epoch) { _gstate.epoch = epoch; }

      point_t point(const uint64_t& epoch) const {
         auto itr = _points.find(epoch);
         return itr == _points.end() ? point_t{} : itr->to_point();
      }

      void set_point(const uint64_t& epoch, const point_t& p) {
         auto itr = _points.find(epoch);
         db::set(_points, itr, _self, [&]( auto& row, bool is_new ) {
            if (is_new) row.epoch = epoch;
            row.bias          = p.bias;
            row.slope         = p.slope;
            row.block_time    = p.ts;
            row.block_num     = p.blk;
         });
      }

      uint64_t user_epoch(const name& owner) const {
         auto itr = _user_epochs.find(owner.value);
         return itr == _user_epochs.end() ? 0 : itr->epoch;
      }

      void set_user_epoch(const name& owner, const uint64_t& epoch) {
         auto itr = _user_epochs.find(owner.value);
         db::set(_user_epochs, itr, _self, [&]( auto& row, bool is_new ) {
            if (is_new) row.owner = owner;
            row.epoch         = epoch;
         });
      }

      point_t user_point(const name& owner, const uint64_t& epoch) const {
         user_point_history_t::tbl_t user_points(_self, owner.value);
         auto itr = user_points.find(epoch);
         return itr == user_points.end() ? point_t{} : itr->to_point();
      }

      void set_user_point(const name& owner, const uint64_t& epoch, const point_t& p) {
         user_point_history_t::tbl_t user_points(_self, owner.value);
         auto itr = user_points.find(epoch);
         db::set(user_points, itr, _self, [&]( auto& row, bool is_new ) {
            if (is_new) row.epoch = epoch;
            row.bias          = p.bias;
            row.slope         = p.slope;
            row.block_time    = p.ts;
            row.block_num     = p.blk;
         });
      }

      int64_t slope_change(const uint64_t& ts) const {
         auto itr = _slope_changes.find(ts);
         return itr == _slope_changes.end() ? 0 : itr->slope;
      }

      void set_slope_change(const uint64_t& ts, const int64_t& slope) {
         auto itr = _slope_changes.find(ts);
         db::set(_slope_changes, itr, _self, [&]( auto& row, bool is_new ) {
            if (is_new) row.ts = ts;
            row.slope         = slope;
         });
      }

      locked_balance_st locked(const name& owner) const {
         auto itr = _locks.find(owner.value);
         if (itr == _locks.end()) return locked_balance_st{};
         return locked_balance_st{ itr->amount.amount, itr->end.sec_since_epoch() };
      }

      void set_locked(const name& owner, const locked_balance_st& l) {
         auto itr = _locks.find(owner.value);
         db::set(_locks, itr, _self, [&]( auto& row, bool is_new ) {
            if (is_new) row.owner = owner;
            row.amount        = asset(l.amount, _gstate.token.get_symbol());
            row.end           = time_point_sec(l.end);
         });
      }

      int64_t supply() const { return _gstate.supply.amount; }
      void set_supply(const int64_t& supply) { _gstate.supply.amount = supply; }

      bool entered() const { return _gstate.entered; }
      void set_entered(const bool& entered) { _gstate.entered = entered; }

      // tokens come in through the transfer notification, before the lock is touched
      bool transfer_in(const name& from, const int64_t& amount) { return true; }
      bool transfer_out(const name& to, const int64_t& amount);

      // an account with an abi set on the system contract runs code
      bool is_contract(const name& account) const {
         return amax_system::is_contract(SYSTEM_CONTRACT, account);
      }

      bool is_approved(const name& account) const {
         return _gstate.smart_wallet_checker != name() && checker::is_approved(_gstate.smart_wallet_checker, account);
      }

      void notify_deposit(const name& owner, const int64_t& value, const uint64_t& locktime, const deposit_type& type, const uint64_t& ts);
      void notify_withdraw(const name& owner, const int64_t& value, const uint64_t& ts);
      void notify_supply(const int64_t& prev_supply, const int64_t& supply);

   private:
      name                                _self;
      global_t&                           _gstate;
      point_history_t::tbl_t              _points;
      user_point_epoch_t::tbl_t           _user_epochs;
      slope_change_t::tbl_t               _slope_changes;
      locked_balance_t::tbl_t             _locks;
};

} //namespace shibdao
