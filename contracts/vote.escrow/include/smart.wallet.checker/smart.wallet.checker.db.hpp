#pragma once

#include <eosio/eosio.hpp>

namespace shibdao { namespace checker {

using namespace eosio;

//scope: checker contract
struct [[eosio::table, eosio::contract("wallet.check")]] approved_t {
    name              account;                        //PK, contract wallet allowed to lock

    uint64_t primary_key()const { return account.value; }

    typedef eosio::multi_index< "approved"_n, approved_t > tbl_t;

    EOSLIB_SERIALIZE( approved_t, (account) )
};

inline bool is_approved(const name& checker, const name& account) {
    approved_t::tbl_t approved(checker, checker.value);
    return approved.find(account.value) != approved.end();
}

} } //namespace shibdao::checker
