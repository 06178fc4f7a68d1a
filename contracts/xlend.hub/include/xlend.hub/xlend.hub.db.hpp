#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <map>
#include <string>

namespace xlend {

using namespace eosio;
using std::string;

static constexpr name      active_perm      {"active"_n};
static constexpr uint64_t  PCT_BOOST        = 10'000;                      // 4dp
static constexpr uint64_t  RATE_BOOST       = 1'000'000;                   // 6dp
static constexpr uint128_t HIGH_PRECISION   = 1'000'000'000'000'000'000ULL; // 1e18

enum class err: uint8_t {
   NONE                                   = 0,
   RECORD_NOT_FOUND                       = 1,
   RECORD_EXISTING                        = 2,
   SYMBOL_MISMATCH                        = 3,
   PARAM_ERROR                            = 4,
   PAUSED                                 = 5,
   NO_AUTH                                = 6,
   NOT_POSITIVE                           = 7,
   ACCOUNT_INVALID                        = 8,
   OVERSIZED                              = 9,

   RATIO_EXCEEDS_ONE                      = 20,
   MATH_OVERFLOW                          = 21,
   MATH_DIVIDE_BY_ZERO                    = 22,

   DEPRECATED_POOL                        = 30,
   DEPOSIT_CAP_REACHED                    = 31,
   BORROW_CAP_REACHED                     = 32,
   INSUFFICIENT_LIQUIDITY                 = 33,
   STABLE_BORROW_NOT_SUPPORTED            = 34,
   STABLE_BORROW_PERCENTAGE_CAP_EXCEEDED  = 35,
   MAX_STABLE_RATE_EXCEEDED               = 36,
   REBALANCE_UP_UTILISATION_NOT_REACHED   = 37,
   REBALANCE_UP_THRESHOLD_NOT_REACHED     = 38,
   REBALANCE_DOWN_THRESHOLD_NOT_REACHED   = 39,
   CANNOT_MINT_FTOKEN                     = 40,
   PRICE_FEED_NOT_FOUND                   = 41,

   LOAN_TYPE_UNKNOWN                      = 50,
   LOAN_TYPE_DEPRECATED                   = 51,
   LOAN_POOL_UNKNOWN                      = 52,
   LOAN_POOL_DEPRECATED                   = 53,
   USER_LOAN_ALREADY_CREATED              = 54,
   UNKNOWN_USER_LOAN                      = 55,
   NOT_ACCOUNT_OWNER                      = 56,
   LOAN_NOT_EMPTY                         = 57,
   SAME_LOAN                              = 58,
   LOAN_TYPE_MISMATCH                     = 59,
   UNDER_COLLATERALIZED                   = 60,
   OVER_COLLATERALIZED                    = 61,
   COLLATERAL_CAP_REACHED                 = 62,
   LOAN_BORROW_CAP_REACHED                = 63,
   NO_COLLATERAL_IN_LOAN_FOR_POOL         = 64,
   NO_BORROW_IN_LOAN_FOR_POOL             = 65,
   NO_STABLE_BORROW_IN_LOAN_FOR_POOL      = 66,
   NO_VARIABLE_BORROW_IN_LOAN_FOR_POOL    = 67,
   BORROW_TYPE_MISMATCH                   = 68,
   INSUFFICIENT_COLLATERAL                = 69,
   EXCESS_REPAYMENT_EXCEEDED              = 70,
   INSUFFICIENT_SEIZED                    = 71
};

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + std::to_string((int)code) + string("]] ") + msg); }

#define TBL struct [[eosio::table, eosio::contract("xlend.hub")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("xlend.hub")]]

inline string to_string_u128(uint128_t v) {
   if (v == 0) return "0";
   string s;
   while (v > 0) {
      s.insert(s.begin(), char('0' + int(v % 10)));
      v /= 10;
   }
   return s;
}

NTBL("global") global_t {
   name                 admin;
   name                 bridge;                    // 跨链消息中继账户
   name                 oracle_contract;
   name                 ftoken_contract;
   bool                 paused = false;

   EOSLIB_SERIALIZE( global_t, (admin)(bridge)(oracle_contract)(ftoken_contract)(paused) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

NTBL("globalidx") global_idx_t {
   uint64_t             loan_id = 0;

   EOSLIB_SERIALIZE( global_idx_t, (loan_id) )
};
typedef eosio::singleton< "globalidx"_n, global_idx_t > global_idx_singleton;

// ============ pool ============
struct deposit_data_st {
   uint64_t             optimal_utilisation_ratio = 7500;            // 4dp
   asset                total_amount;
   uint128_t            interest_rate = 0;
   uint128_t            interest_index = HIGH_PRECISION;
};

struct variable_borrow_data_st {
   uint64_t             vr0 = 17'500;                                // 6dp
   uint64_t             vr1 = 50'000;
   uint64_t             vr2 = 1'000'000;
   asset                total_amount;
   uint128_t            interest_rate = 0;
   uint128_t            interest_index = HIGH_PRECISION;
};

struct stable_borrow_data_st {
   uint64_t             sr0 = 20'000;                                // 6dp
   uint64_t             sr1 = 20'000;
   uint64_t             sr2 = 1'000'000;
   uint64_t             sr3 = 250'000;
   uint64_t             optimal_stable_to_total_debt_ratio = 2000;  // 4dp
   uint64_t             rebalance_up_utilisation_ratio = 9500;
   uint64_t             rebalance_up_deposit_interest_rate = 4000;
   uint64_t             rebalance_down_delta = 2000;
   asset                total_amount;
   uint128_t            interest_rate = 0;                           // 当前报价
   uint128_t            average_interest_rate = 0;
};

struct fee_data_st {
   uint64_t             flash_loan_fee = 1000;                       // 6dp
   uint64_t             retention_rate = 100'000;                    // 6dp
   name                 fee_recipient;
   asset                total_retained_amount;
};

struct caps_data_st {
   uint64_t             deposit = 100'000'000;                       // USD，0 表示不限
   uint64_t             borrow = 50'000'000;
   uint128_t            stable_borrow_percentage = 50'000'000'000'000'000ULL; // 18dp
};

struct config_data_st {
   bool                 deprecated = false;
   bool                 stable_borrow_supported = true;
   bool                 can_mint_ftoken = true;
   bool                 flash_loan_supported = true;
};

NTBL("pools") pool_t {
   uint8_t                    pool_id;
   symbol                     sym;                  // 底层资产
   symbol                     fsym;                 // 存款凭证
   time_point_sec             last_update_at;
   deposit_data_st            deposit;
   variable_borrow_data_st    variable_borrow;
   stable_borrow_data_st      stable_borrow;
   fee_data_st                fee;
   caps_data_st               caps;
   config_data_st             config;

   uint64_t primary_key() const { return pool_id; }

   EOSLIB_SERIALIZE( pool_t, (pool_id)(sym)(fsym)(last_update_at)(deposit)(variable_borrow)
                             (stable_borrow)(fee)(caps)(config) )
};
typedef eosio::multi_index< "pools"_n, pool_t > pool_tbl;

// ============ loan type / loan pool ============
NTBL("loantypes") loan_type_t {
   uint8_t              loan_type_id;
   bool                 deprecated = false;
   uint64_t             loan_target_health = PCT_BOOST;              // 4dp

   uint64_t primary_key() const { return loan_type_id; }

   EOSLIB_SERIALIZE( loan_type_t, (loan_type_id)(deprecated)(loan_target_health) )
};
typedef eosio::multi_index< "loantypes"_n, loan_type_t > loan_type_tbl;

struct loan_pool_reward_st {
   time_point_sec       last_update_at;
   uint128_t            minimum_amount = 0;
   uint128_t            collateral_speed = 0;                        // 每秒，18dp
   uint128_t            borrow_speed = 0;
   uint128_t            collateral_reward_index = 0;
   uint128_t            borrow_reward_index = 0;
};

struct loan_pool_ref {
   uint8_t              loan_type_id;
   uint8_t              pool_id;
};

//scope: loan_type_id
NTBL("loanpools") loan_pool_t {
   uint8_t              pool_id;
   bool                 deprecated = false;
   uint64_t             collateral_factor = 0;                       // 4dp
   uint64_t             collateral_cap = 0;                          // USD
   uint64_t             borrow_factor = PCT_BOOST;                   // 4dp
   uint64_t             borrow_cap = 0;                              // USD
   uint64_t             liquidation_bonus = 0;                       // 4dp
   uint64_t             liquidation_fee = 0;                         // 4dp
   asset                collateral_used;                             // fsym
   asset                borrow_used;                                 // sym
   loan_pool_reward_st  reward;

   uint64_t primary_key() const { return pool_id; }

   EOSLIB_SERIALIZE( loan_pool_t, (pool_id)(deprecated)(collateral_factor)(collateral_cap)
                                  (borrow_factor)(borrow_cap)(liquidation_bonus)(liquidation_fee)
                                  (collateral_used)(borrow_used)(reward) )
};
typedef eosio::multi_index< "loanpools"_n, loan_pool_t > loan_pool_tbl;

// ============ user loan ============
struct loan_collateral_st {
   asset                balance;                                     // fsym
   uint128_t            reward_index = 0;
};

struct loan_borrow_st {
   asset                amount;                                      // 本金
   asset                balance;                                     // 本金 + 利息
   uint128_t            last_interest_index = HIGH_PRECISION;
   bool                 is_stable = false;
   uint128_t            stable_interest_rate = 0;
   time_point_sec       last_stable_update_at;
   uint128_t            reward_index = 0;
};

NTBL("loans") user_loan_t {
   uint64_t                                  id;
   name                                      account;
   uint64_t                                  nonce;
   uint8_t                                   loan_type_id;
   string                                    loan_name;
   std::map<uint8_t, loan_collateral_st>     collaterals;
   std::map<uint8_t, loan_borrow_st>         borrows;
   time_point_sec                            created_at;

   uint64_t primary_key() const { return id; }
   uint64_t by_account() const { return account.value; }
   uint128_t by_account_nonce() const { return (uint128_t(account.value) << 64) | nonce; }

   bool is_empty() const { return collaterals.empty() && borrows.empty(); }

   EOSLIB_SERIALIZE( user_loan_t, (id)(account)(nonce)(loan_type_id)(loan_name)
                                  (collaterals)(borrows)(created_at) )
};
typedef eosio::multi_index< "loans"_n, user_loan_t,
   indexed_by<"byaccount"_n,  const_mem_fun<user_loan_t, uint64_t,  &user_loan_t::by_account>>,
   indexed_by<"accountnonce"_n, const_mem_fun<user_loan_t, uint128_t, &user_loan_t::by_account_nonce>>
> user_loan_tbl;

//scope: account
NTBL("userrewards") user_pool_rewards_t {
   uint8_t              pool_id;
   uint64_t             collateral = 0;
   uint64_t             borrow = 0;
   uint64_t             interest_paid = 0;

   uint64_t primary_key() const { return pool_id; }

   EOSLIB_SERIALIZE( user_pool_rewards_t, (pool_id)(collateral)(borrow)(interest_paid) )
};
typedef eosio::multi_index< "userrewards"_n, user_pool_rewards_t > user_pool_rewards_tbl;

} // namespace xlend
