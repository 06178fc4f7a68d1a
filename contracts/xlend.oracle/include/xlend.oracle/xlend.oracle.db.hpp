#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <string>
#include <vector>

namespace xlend { namespace oracle {

using namespace eosio;
using std::string;

enum class err: uint8_t {
   NONE                 = 0,
   RECORD_NOT_FOUND     = 1,
   RECORD_EXISTING      = 2,
   PARAM_ERROR          = 3,
   NO_AUTH              = 4,
   NOT_POSITIVE         = 5
};

#define ORACLE_TBL struct [[eosio::table, eosio::contract("xlend.oracle")]]

// 单次更新允许的价格区间：旧价的 50% ~ 150%
static constexpr uint64_t PRICE_DOWN_LIMIT_PCT = 50;
static constexpr uint64_t PRICE_UPPER_LIMIT_PCT = 150;

struct [[eosio::table("global"), eosio::contract("xlend.oracle")]] global_t {
   name                 admin;

   EOSLIB_SERIALIZE( global_t, (admin) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

ORACLE_TBL seer_t {
   name                 seer;

   uint64_t primary_key() const { return seer.value; }

   typedef eosio::multi_index< "seers"_n, seer_t > idx_t;
   EOSLIB_SERIALIZE( seer_t, (seer) )
};

struct feed_price_info {
   uint8_t              pool_id;
   uint128_t            price;        // 18dp USD
};

ORACLE_TBL price_feed_t {
   uint8_t              pool_id;
   uint128_t            price = 0;    // 18dp USD，每个完整代币
   uint8_t              decimals = 0; // 代币精度
   time_point_sec       updated_at;

   uint64_t primary_key() const { return pool_id; }

   typedef eosio::multi_index< "feeds"_n, price_feed_t > idx_t;
   EOSLIB_SERIALIZE( price_feed_t, (pool_id)(price)(decimals)(updated_at) )
};

}} // namespace xlend::oracle
