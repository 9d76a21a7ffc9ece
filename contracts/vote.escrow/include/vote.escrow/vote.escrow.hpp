#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>
#include <eosio/system.hpp>

#include <string>

#include <vote.escrow/vote.escrow.db.hpp>
#include <vote.escrow/vote.escrow.engine.hpp>
#include <vote.escrow/vote.escrow.store.hpp>

namespace shibdao {

using std::string;
using std::vector;

using namespace eosio;

/**
 * The `vote.escrow` contract locks SHIB for up to 4 years in exchange for voting power
 * that decays linearly to zero at the unlock time.
 *
 * Locks are opened and topped up by transferring the token to this contract:
 *    - memo `create:$unlock_time`   - create a lock for the sender
 *    - memo `increase`              - add to the sender's active lock
 *    - memo `deposit:$account`      - add to the active lock of `$account`
 * Unlock times are rounded down to whole weeks.
 *
 * Voting power is kept as a history of decay points, globally and per account, plus a
 * schedule of slope changes keyed by unlock time. Past balances and totals are
 * answered from that history by time or by block number.
 */
class [[eosio::contract("vote.escrow")]] vote_escrow : public contract {
   public:
      using contract::contract;

   vote_escrow(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value),
        _gstate(_global.exists() ? _global.get() : global_t{}),
        _store(get_self(), _gstate) {}

    ~vote_escrow() { if (_gstate_changed) _global.set( _gstate, get_self() ); }

   //admin
   ACTION init(const name& admin, const extended_symbol& token);
   ACTION setenabled(const bool& enabled);
   ACTION commitadmin(const name& future_admin);
   ACTION applyadmin();
   ACTION commitcheck(const name& checker);
   ACTION applycheck();

   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   //USER
   ACTION inctime(const name& owner, const uint64_t& unlock_time);
   ACTION withdraw(const name& owner);
   ACTION checkpoint();

   //queries, a zero time means now; they never write
   [[eosio::action, eosio::read_only]] int64_t  balanceof(const name& owner, const uint64_t& ts);
   [[eosio::action, eosio::read_only]] int64_t  balanceofat(const name& owner, const uint64_t& block);
   [[eosio::action, eosio::read_only]] int64_t  totalsupply(const uint64_t& ts);
   [[eosio::action, eosio::read_only]] int64_t  totalsupplyat(const uint64_t& block);
   [[eosio::action, eosio::read_only]] uint64_t lockedend(const name& owner);
   [[eosio::action, eosio::read_only]] int64_t  lastslope(const name& owner);
   [[eosio::action, eosio::read_only]] uint64_t userpointts(const name& owner, const uint64_t& idx);
   [[eosio::action, eosio::read_only]] uint64_t userepoch(const name& owner);

   //logs
   ACTION depositlog(const name& provider, const asset& value, const uint64_t& locktime, const uint8_t& type, const uint64_t& ts);
   using depositlog_action    = action_wrapper<"depositlog"_n,  &vote_escrow::depositlog>;
   ACTION withdrawlog(const name& provider, const asset& value, const uint64_t& ts);
   using withdrawlog_action   = action_wrapper<"withdrawlog"_n, &vote_escrow::withdrawlog>;
   ACTION supplylog(const asset& prev_supply, const asset& supply);
   using supplylog_action     = action_wrapper<"supplylog"_n,   &vote_escrow::supplylog>;

   private:
      escrow_engine<chain_store> _engine() {
         return escrow_engine<chain_store>(_store, _clock());
      }

      chain_clock_st _clock() const {
         return chain_clock_st{ current_time_point().sec_since_epoch(), current_block_number() };
      }

      void _check_enabled();

      global_singleton     _global;
      global_t             _gstate;
      bool                 _gstate_changed = false;      //saved on exit when set
      chain_store          _store;
};
} //namespace shibdao
