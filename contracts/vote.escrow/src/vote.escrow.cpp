#include <vote.escrow/vote.escrow.hpp>
#include <vote.escrow/vote.escrow.utils.hpp>
#include <utils.hpp>

#include <eosio/system.hpp>
#include <eosio/time.hpp>

static constexpr eosio::name ACTIVE_PERM{"active"_n};

namespace shibdao {
using namespace std;

struct token_bank {
      void transfer( const name&    from,
                     const name&    to,
                     const asset&   quantity,
                     const string&  memo );
      using transfer_action = eosio::action_wrapper<"transfer"_n, &token_bank::transfer>;
};

#define TRANSFER(bank, to, quantity, memo) \
    {	token_bank::transfer_action act{ bank, { {_self, ACTIVE_PERM} } };\
            act.send( _self, to, quantity, memo );}

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

bool chain_store::transfer_out(const name& to, const int64_t& amount) {
   TRANSFER( _gstate.token.get_contract(), to, asset(amount, _gstate.token.get_symbol()), "withdraw" )
   return true;
}

void chain_store::notify_deposit(const name& owner, const int64_t& value, const uint64_t& locktime, const deposit_type& type, const uint64_t& ts) {
   vote_escrow::depositlog_action act{ _self, { {_self, ACTIVE_PERM} } };
   act.send( owner, asset(value, _gstate.token.get_symbol()), locktime, (uint8_t)type, ts );
}

void chain_store::notify_withdraw(const name& owner, const int64_t& value, const uint64_t& ts) {
   vote_escrow::withdrawlog_action act{ _self, { {_self, ACTIVE_PERM} } };
   act.send( owner, asset(value, _gstate.token.get_symbol()), ts );
}

void chain_store::notify_supply(const int64_t& prev_supply, const int64_t& supply) {
   vote_escrow::supplylog_action act{ _self, { {_self, ACTIVE_PERM} } };
   act.send( asset(prev_supply, _gstate.token.get_symbol()), asset(supply, _gstate.token.get_symbol()) );
}

void vote_escrow::init(const name& admin, const extended_symbol& token) {
   require_auth( _self );
   CHECKC( _gstate.admin == name(), err::RECORD_EXISTING, "already initialized" )
   CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin account does not exist" )
   CHECKC( is_account(token.get_contract()), err::ACCOUNT_INVALID, "token contract does not exist" )

   _gstate.admin                    = admin;
   _gstate.token                    = token;
   _gstate.supply                   = asset(0, token.get_symbol());
   _gstate.enabled                  = true;

   _engine().seed();
   _gstate_changed                  = true;
}

void vote_escrow::setenabled(const bool& enabled) {
   require_auth( _gstate.admin );
   _gstate.enabled                  = enabled;
   _gstate_changed                  = true;
}

void vote_escrow::commitadmin(const name& future_admin) {
   require_auth( _gstate.admin );
   CHECKC( is_account(future_admin), err::ACCOUNT_INVALID, "account does not exist: " + future_admin.to_string() )
   _gstate.future_admin             = future_admin;
   _gstate_changed                  = true;
}

void vote_escrow::applyadmin() {
   require_auth( _gstate.admin );
   CHECKC( _gstate.future_admin != name(), err::RECORD_NOT_FOUND, "admin not set" )
   _gstate.admin                    = _gstate.future_admin;
   _gstate_changed                  = true;
}

void vote_escrow::commitcheck(const name& checker) {
   require_auth( _gstate.admin );
   CHECKC( is_account(checker), err::ACCOUNT_INVALID, "account does not exist: " + checker.to_string() )
   _gstate.future_smart_wallet_checker = checker;
   _gstate_changed                  = true;
}

void vote_escrow::applycheck() {
   require_auth( _gstate.admin );
   _gstate.smart_wallet_checker     = _gstate.future_smart_wallet_checker;
   _gstate_changed                  = true;
}

/**
 * @param from
 * @param to
 * @param quant
 * @param memo: three formats:
 *       1) create:$unlock_time - lock for the sender until $unlock_time (seconds)
 *       2) increase            - add to the sender's lock
 *       3) deposit:$account    - add to the lock of $account
 */
void vote_escrow::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   _check_enabled();
   _gstate_changed = true;
   CHECKC( get_first_receiver() == _gstate.token.get_contract(), err::CONTRACT_MISMATCH, "token contract mismatch" )
   CHECKC( quant.symbol == _gstate.token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch" )

   auto engine = _engine();
   auto code   = err::NONE;
   vector<string_view> params = split(memo, ":");
   if (params.size() == 2 && params[0] == "create") {
      uint64_t unlock_time = 0;
      CHECKC( to_uint64(params[1], unlock_time), err::MEMO_FORMAT_ERROR, "invalid unlock time: " + string(params[1]) )
      code = engine.create_lock(from, quant.amount, unlock_time);

   } else if (params.size() == 1 && params[0] == "increase") {
      code = engine.increase_amount(from, quant.amount);

   } else if (params.size() == 2 && params[0] == "deposit") {
      auto owner = name(params[1]);
      CHECKC( is_account(owner), err::ACCOUNT_INVALID, "account does not exist: " + owner.to_string() )
      code = engine.deposit_for(from, owner, quant.amount);

   } else {
      CHECKC( false, err::MEMO_FORMAT_ERROR, "invalid memo format" )
   }
   CHECKC( code == err::NONE, code, engine.reason() )
}

void vote_escrow::inctime(const name& owner, const uint64_t& unlock_time) {
   require_auth( owner );
   _check_enabled();
   _gstate_changed = true;

   auto engine = _engine();
   auto code   = engine.increase_unlock_time(owner, unlock_time);
   CHECKC( code == err::NONE, code, engine.reason() )
}

//only the whole lock can be withdrawn, and only once it expired
void vote_escrow::withdraw(const name& owner) {
   require_auth( owner );
   CHECKC( _gstate.admin != name(), err::NOT_STARTED, "not initialized" )

   _gstate_changed   = true;

   auto engine       = _engine();
   int64_t withdrawn = 0;
   auto code         = engine.withdraw(owner, withdrawn);
   CHECKC( code == err::NONE, code, engine.reason() )
}

void vote_escrow::checkpoint() {
   CHECKC( _gstate.admin != name(), err::NOT_STARTED, "not initialized" )
   _gstate_changed = true;

   auto engine = _engine();
   auto code   = engine.checkpoint();
   CHECKC( code == err::NONE, code, engine.reason() )
}

int64_t vote_escrow::balanceof(const name& owner, const uint64_t& ts) {
   auto clock = _clock();
   return _engine().balance_of(owner, ts == 0 ? clock.now : ts);
}

int64_t vote_escrow::balanceofat(const name& owner, const uint64_t& block) {
   auto engine    = _engine();
   int64_t power  = 0;
   auto code      = engine.balance_of_at(owner, block, power);
   CHECKC( code == err::NONE, code, engine.reason() + ": " + to_string(block) )
   return power;
}

int64_t vote_escrow::totalsupply(const uint64_t& ts) {
   auto clock = _clock();
   return _engine().total_supply(ts == 0 ? clock.now : ts);
}

int64_t vote_escrow::totalsupplyat(const uint64_t& block) {
   auto engine    = _engine();
   int64_t power  = 0;
   auto code      = engine.total_supply_at(block, power);
   CHECKC( code == err::NONE, code, engine.reason() + ": " + to_string(block) )
   return power;
}

uint64_t vote_escrow::lockedend(const name& owner) {
   return _engine().locked_end(owner);
}

int64_t vote_escrow::lastslope(const name& owner) {
   return _engine().last_user_slope(owner);
}

uint64_t vote_escrow::userpointts(const name& owner, const uint64_t& idx) {
   return _engine().user_point_ts(owner, idx);
}

uint64_t vote_escrow::userepoch(const name& owner) {
   return _store.user_epoch(owner);
}

void vote_escrow::depositlog(const name& provider, const asset& value, const uint64_t& locktime, const uint8_t& type, const uint64_t& ts) {
   require_auth(get_self());
   require_recipient(provider);
}

void vote_escrow::withdrawlog(const name& provider, const asset& value, const uint64_t& ts) {
   require_auth(get_self());
   require_recipient(provider);
}

void vote_escrow::supplylog(const asset& prev_supply, const asset& supply) {
   require_auth(get_self());
}

void vote_escrow::_check_enabled() {
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
}

} //namespace shibdao
