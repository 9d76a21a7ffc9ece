#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <vote.escrow/vote.escrow.point.hpp>

#include <string>

namespace shibdao {

using namespace std;
using namespace eosio;

static constexpr name       SYSTEM_CONTRACT  = "amax"_n;
static constexpr name       SHIB_BANK        = "shib.token"_n;
static constexpr symbol     SHIB             = symbol(symbol_code("SHIB"), 8);

#define TBL struct [[eosio::table, eosio::contract("vote.escrow")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("vote.escrow")]]

NTBL("global") global_t {
    name                admin;                                                  //can commit and apply the config below
    name                future_admin;
    name                smart_wallet_checker;                                   //allow list for contract lockers
    name                future_smart_wallet_checker;

    extended_symbol     token                   = extended_symbol(SHIB, SHIB_BANK);   //locked token
    asset               supply                  = asset(0, SHIB);                     //total locked, not decayed
    uint64_t            epoch                   = 0;                                  //latest point_history epoch
    bool                enabled                 = false;
    bool                entered                 = false;                              //reentrancy lock

    EOSLIB_SERIALIZE( global_t, (admin)(future_admin)(smart_wallet_checker)(future_smart_wallet_checker)
                                (token)(supply)(epoch)(enabled)(entered) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//scope: _self
TBL locked_balance_t {
    name                owner;                          //PK
    asset               amount;                         //locked amount
    time_point_sec      end;                            //unlock time

    locked_balance_t() {}
    locked_balance_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }
    uint64_t by_end() const { return end.sec_since_epoch(); }

    typedef eosio::multi_index< "locked"_n, locked_balance_t,
        indexed_by< "byend"_n, const_mem_fun<locked_balance_t, uint64_t, &locked_balance_t::by_end> >
    > tbl_t;

    EOSLIB_SERIALIZE( locked_balance_t, (owner)(amount)(end) )
};

//scope: _self
TBL point_history_t {
    uint64_t                epoch;                          //PK, global epoch
    int64_t                 bias            = 0;
    int64_t                 slope           = 0;
    uint64_t                block_time      = 0;
    uint64_t                block_num       = 0;

    point_history_t() {}
    point_history_t(const uint64_t& e): epoch(e) {}

    uint64_t primary_key()const { return epoch; }

    point_t to_point()const { return point_t{ bias, slope, block_time, block_num }; }

    typedef eosio::multi_index<"pointhistory"_n, point_history_t> tbl_t;

    EOSLIB_SERIALIZE( point_history_t, (epoch)(bias)(slope)(block_time)(block_num) )
};

//scope: owner
TBL user_point_history_t {
    uint64_t                epoch;                          //PK: 1,2,3...
    int64_t                 bias            = 0;
    int64_t                 slope           = 0;
    uint64_t                block_time      = 0;
    uint64_t                block_num       = 0;

    user_point_history_t() {}
    user_point_history_t(const uint64_t& e): epoch(e) {}

    uint64_t primary_key()const { return epoch; }

    point_t to_point()const { return point_t{ bias, slope, block_time, block_num }; }

    typedef eosio::multi_index<"userpoints"_n, user_point_history_t> tbl_t;

    EOSLIB_SERIALIZE( user_point_history_t, (epoch)(bias)(slope)(block_time)(block_num) )
};

//scope: _self
TBL user_point_epoch_t {
    name                owner;                          //PK
    uint64_t            epoch           = 0;

    user_point_epoch_t() {}
    user_point_epoch_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "userepochs"_n, user_point_epoch_t > tbl_t;

    EOSLIB_SERIALIZE( user_point_epoch_t, (owner)(epoch) )
};

//scope: _self
//time -> signed slope change
TBL slope_change_t {
    uint64_t            ts;                             //PK, always a week boundary
    int64_t             slope           = 0;

    slope_change_t() {}
    slope_change_t(const uint64_t& t): ts(t) {}

    uint64_t primary_key() const { return ts; }

    typedef eosio::multi_index< "slopechanges"_n, slope_change_t > tbl_t;

    EOSLIB_SERIALIZE( slope_change_t, (ts)(slope) )
};

} //namespace shibdao
