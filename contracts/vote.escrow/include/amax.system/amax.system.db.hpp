#pragma once

#include <eosio/crypto.hpp>
#include <eosio/eosio.hpp>

namespace amax_system {

using namespace eosio;

//scope: system contract, one row per account that has an abi set
struct [[eosio::table, eosio::contract("amax.system")]] abi_hash {
    name              owner;
    checksum256       hash;

    uint64_t primary_key()const { return owner.value; }

    typedef eosio::multi_index< "abihash"_n, abi_hash > tbl_t;

    EOSLIB_SERIALIZE( abi_hash, (owner)(hash) )
};

inline bool is_contract(const name& system_contract, const name& account) {
    abi_hash::tbl_t hashes(system_contract, system_contract.value);
    return hashes.find(account.value) != hashes.end();
}

} //namespace amax_system
