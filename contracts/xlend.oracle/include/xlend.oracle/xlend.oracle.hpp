#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <string>

#include <xlend.oracle/xlend.oracle.db.hpp>

namespace xlend { namespace oracle {

using std::string;

class [[eosio::contract("xlend.oracle")]] xlend_oracle : public eosio::contract {
private:
   global_singleton    _global;
   global_t            _gstate;

public:
   using contract::contract;
   xlend_oracle(eosio::name receiver, eosio::name code, datastream<const char*> ds):
      contract(receiver, code, ds), _global(_self, _self.value) {
      _gstate = _global.exists() ? _global.get() : global_t{};
   }

   ~xlend_oracle() {
      _global.set( _gstate, get_self() );
   }

   ACTION init( const name& admin );

   ACTION addseer( const name& seer );

   ACTION removeseer( const name& seer );

   /**
    * register a price feed for a hub pool
    * @param decimals - precision of the pool's underlying token
    */
   ACTION addfeed( const uint8_t& pool_id, const uint8_t& decimals );

   ACTION removefeed( const uint8_t& pool_id );

   ACTION updateprice( const name& seer, const std::vector<feed_price_info>& infos );

private:
   void _updateprice( const uint8_t& pool_id, const uint128_t& price );
};

}} // namespace xlend::oracle
