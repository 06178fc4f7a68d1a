#include <xlend.oracle/xlend.oracle.hpp>

namespace xlend { namespace oracle {

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + std::to_string((int)code) + string("]] ") + msg); }

void xlend_oracle::init( const name& admin ) {
   require_auth( get_self() );
   CHECKC( is_account(admin), err::PARAM_ERROR, "admin account does not exist" );
   _gstate.admin = admin;
}

void xlend_oracle::addseer( const name& seer ) {
   require_auth( _gstate.admin );

   seer_t::idx_t seers( _self, _self.value );
   CHECKC( seers.find(seer.value) == seers.end(), err::RECORD_EXISTING, "seer account is existing" );
   seers.emplace( _self, [&]( auto& s ) {
      s.seer = seer;
   });
}

void xlend_oracle::removeseer( const name& seer ) {
   require_auth( _gstate.admin );

   seer_t::idx_t seers( _self, _self.value );
   auto itr = seers.find( seer.value );
   CHECKC( itr != seers.end(), err::RECORD_NOT_FOUND, "seer account is invalid" );
   seers.erase( itr );
}

void xlend_oracle::addfeed( const uint8_t& pool_id, const uint8_t& decimals ) {
   require_auth( _gstate.admin );
   CHECKC( decimals <= 18, err::PARAM_ERROR, "decimals too large" );

   price_feed_t::idx_t feeds( _self, _self.value );
   CHECKC( feeds.find(pool_id) == feeds.end(), err::RECORD_EXISTING, "feed is existing" );
   feeds.emplace( _self, [&]( auto& f ) {
      f.pool_id    = pool_id;
      f.price      = 0;
      f.decimals   = decimals;
      f.updated_at = current_time_point();
   });
}

void xlend_oracle::removefeed( const uint8_t& pool_id ) {
   require_auth( _gstate.admin );

   price_feed_t::idx_t feeds( _self, _self.value );
   auto itr = feeds.find( pool_id );
   CHECKC( itr != feeds.end(), err::RECORD_NOT_FOUND, "feed is not found" );
   feeds.erase( itr );
}

void xlend_oracle::updateprice( const name& seer, const std::vector<feed_price_info>& infos ) {
   require_auth( seer );

   seer_t::idx_t seers( _self, _self.value );
   CHECKC( seers.find(seer.value) != seers.end(), err::NO_AUTH, "seer account is invalid" );
   CHECKC( !infos.empty(), err::PARAM_ERROR, "infos length must bigger than 0" );
   for( auto& info : infos ) {
      _updateprice( info.pool_id, info.price );
   }
}

void xlend_oracle::_updateprice( const uint8_t& pool_id, const uint128_t& price ) {
   CHECKC( price > 0, err::NOT_POSITIVE, "price must be positive" );

   price_feed_t::idx_t feeds( _self, _self.value );
   auto itr = feeds.find( pool_id );
   CHECKC( itr != feeds.end(), err::RECORD_NOT_FOUND, "feed is not found" );

   auto older_price = itr->price;
   if( older_price != 0 ) {
      auto upper_limit = older_price / 100 * PRICE_UPPER_LIMIT_PCT;
      auto down_limit  = older_price / 100 * PRICE_DOWN_LIMIT_PCT;
      CHECKC( price > down_limit && price < upper_limit, err::PARAM_ERROR, "price not valid" );
   }

   feeds.modify( itr, same_payer, [&]( auto& f ) {
      f.price      = price;
      f.updated_at = current_time_point();
   });
}

}} // namespace xlend::oracle
