#pragma once

#include <eosio/eosio.hpp>

#include <limits>
#include <string>
#include <string_view>

namespace shibdao {

using namespace std;

inline bool to_uint64(string_view s, uint64_t& value) {
    if (s.empty() || s.size() > 20) return false;
    uint64_t ret = 0;
    for (auto c : s) {
        if (c < '0' || c > '9') return false;
        uint64_t digit = c - '0';
        if (ret > (std::numeric_limits<uint64_t>::max() - digit) / 10) return false;
        ret = ret * 10 + digit;
    }
    value = ret;
    return true;
}

namespace db {

    template<typename table, typename Lambda>
    inline void set(table &tbl,  typename table::const_iterator& itr, const eosio::name& emplaced_payer,
            const eosio::name& modified_payer, Lambda&& setter )
   {
        if (itr == tbl.end()) {
            tbl.emplace(emplaced_payer, [&]( auto& p ) {
               setter(p, true);
            });
        } else {
            tbl.modify(itr, modified_payer, [&]( auto& p ) {
               setter(p, false);
            });
        }
    }

    template<typename table, typename Lambda>
    inline void set(table &tbl,  typename table::const_iterator& itr, const eosio::name& emplaced_payer,
               Lambda&& setter )
   {
      set(tbl, itr, emplaced_payer, eosio::same_payer, setter);
   }

}// namespace db

} //namespace shibdao
